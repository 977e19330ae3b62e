#include "Orchestrator.hpp"
#include "GraphJson.hpp"
#include "IntentExtractor.hpp"
#include "Log.hpp"
#include "Messages.hpp"
#include "PlanAssembler.hpp"
#include <chrono>
#include <cstdio>
#include <exception>
#include <utility>
#include <vector>

namespace navmaze {

Orchestrator::Orchestrator(ServiceConfig cfg, Emit emit, IntentCatalog catalog)
    : cfg_(std::move(cfg)), emit_(std::move(emit)), catalog_(std::move(catalog)),
      monitor_(cfg_.max_step_retries) {
    set_oracle(SolverFn());
    set_extractor(IntentExtractorFn());
}

void Orchestrator::set_oracle(SolverFn oracle) {
    oracle_ = std::move(oracle);
    SolverFn bounded = oracle_;
    if (bounded && cfg_.solver_timeout_ms > 0) {
        bounded = with_timeout(bounded, std::chrono::milliseconds(cfg_.solver_timeout_ms));
    }
    solver_ = with_fallback(bounded);
}

void Orchestrator::set_extractor(IntentExtractorFn fn) {
    external_extractor_ = static_cast<bool>(fn);
    extractor_ = fn ? std::move(fn) : IntentExtractorFn(extract_intent_rules);
}

size_t Orchestrator::restore_graphs() {
    if (!store_ || !cfg_.persist_graphs) return 0;
    return store_->load_all(&graphs_);
}

const NavigationGraph* Orchestrator::graph(const std::string& app) const {
    auto it = graphs_.find(app);
    return it == graphs_.end() ? nullptr : &it->second;
}

std::string Orchestrator::current_screen(const std::string& app) const {
    auto it = screens_.find(app);
    return it == screens_.end() ? cfg_.default_screen : it->second;
}

void Orchestrator::send(const std::string& type, const std::string& request_id, const Json::Value& payload) {
    if (emit_) emit_(make_message(type, request_id, payload));
}

std::string Orchestrator::request_id_of(const Json::Value& msg) const {
    std::string id = field_string(msg, "requestId");
    if (id.empty()) {
        const long long ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        id = "req-" + std::to_string(ms) + "-" + std::to_string(++seq_);
    }
    return id;
}

void Orchestrator::on_connect() {
    Json::Value p(Json::objectValue);
    p["service"] = "navmaze";
    p["oracleLoaded"] = static_cast<bool>(oracle_);
    p["extractorLoaded"] = external_extractor_;
    p["graphs"] = static_cast<Json::UInt64>(graphs_.size());
    p["activePlans"] = static_cast<Json::UInt64>(monitor_.active());
    p["timestamp"] = static_cast<Json::Int64>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
    send("status", "", p);
}

bool Orchestrator::handle_line(const std::string& line) {
    Json::Value msg;
    std::string err;
    if (!parse_message(line, &msg, &err)) {
        std::fprintf(stderr, "ORCH: JSON invalido (%s): %.100s\n", err.c_str(), line.c_str());
        return false;
    }
    return handle(msg);
}

bool Orchestrator::handle(const Json::Value& msg) {
    if (!msg.isObject() || !msg["type"].isString()) {
        std::fprintf(stderr, "ORCH: mensagem sem type descartada\n");
        return false;
    }
    const std::string type = msg["type"].asString();
    try {
        return dispatch(type, msg);
    } catch (const std::exception& e) {
        std::fprintf(stderr, "ORCH: falha tratando '%s': %s\n", type.c_str(), e.what());
        return false;
    }
}

bool Orchestrator::dispatch(const std::string& type, const Json::Value& msg) {
    using Handler = void (Orchestrator::*)(const Json::Value&);
    static const std::map<std::string, Handler> handlers = {
        {"voice_command", &Orchestrator::on_voice_command},
        {"intent_request", &Orchestrator::on_intent_request},
        {"graph_update", &Orchestrator::on_graph_update},
        {"ui_state", &Orchestrator::on_ui_state},
        {"action_result", &Orchestrator::on_action_result},
        {"explore_complete", &Orchestrator::on_explore_complete},
        {"replan", &Orchestrator::on_replan},
        {"cancel_plan", &Orchestrator::on_cancel_plan},
        {"solve", &Orchestrator::on_solve},
    };
    if (type == "ping") {
        send("pong", field_string(msg, "requestId"), Json::Value(Json::objectValue));
        return true;
    }
    auto it = handlers.find(type);
    if (it == handlers.end()) {
        std::fprintf(stderr, "ORCH: tipo desconhecido '%s'\n", type.c_str());
        return false;
    }
    (this->*(it->second))(msg);
    return true;
}

void Orchestrator::run_pipeline(const std::string& request_id, const Intent& intent, const std::string& app) {
    auto g = graphs_.find(app);
    if (g == graphs_.end()) {
        std::fprintf(log_out(), "ORCH: sem grafo para %s, pedindo exploracao\n", app.c_str());
        pending_[request_id] = PendingRequest{app, intent};
        Json::Value p(Json::objectValue);
        p["app"] = app;
        p["depth"] = cfg_.explore_depth;
        p["intent"] = intent.name;
        send("explore_request", request_id, p);
        return;
    }
    pending_.erase(request_id);

    const std::string current = current_screen(app);
    PlanAssembler assembler(g->second, catalog_);
    ExecutionPlan plan = assembler.plan(intent, current, solver_);
    plan.intent.app = app;
    Json::Value payload = plan_to_json(plan);
    monitor_.start(request_id, app, std::move(plan));
    send("execute_plan", request_id, payload);
}

void Orchestrator::on_voice_command(const Json::Value& msg) {
    const std::string text = field_string(msg, "text");
    if (text.empty()) {
        std::fprintf(stderr, "ORCH: voice_command sem texto\n");
        return;
    }
    const std::string app = field_string(msg, "app", cfg_.default_app);
    const std::string rid = request_id_of(msg);
    std::fprintf(log_out(), "ORCH: voice_command \"%s\"\n", text.c_str());

    Intent intent = extractor_(text);
    intent.raw_text = text;
    intent.app = app;

    Json::Value p(Json::objectValue);
    p["intent"] = intent.name;
    p["confidence"] = intent.confidence;
    p["params"] = intent_to_json(intent)["params"];
    p["summary"] = build_summary(intent);
    p["requiresConfirmation"] = catalog_.is_sensitive(intent.name);
    send("intent_confirmed", rid, p);

    run_pipeline(rid, intent, app);
}

void Orchestrator::on_intent_request(const Json::Value& msg) {
    Intent intent;
    if (!intent_from_json(msg, &intent)) {
        std::fprintf(stderr, "ORCH: intent_request sem intent\n");
        return;
    }
    if (intent.app.empty()) intent.app = cfg_.default_app;
    run_pipeline(request_id_of(msg), intent, intent.app);
}

void Orchestrator::on_graph_update(const Json::Value& msg) {
    const std::string app = field_string(msg, "app");
    const Json::Value& gj = message_field(msg, "graph");
    if (app.empty() || !gj.isObject()) {
        std::fprintf(stderr, "ORCH: graph_update sem app ou graph\n");
        return;
    }
    NavigationGraph g;
    std::string why;
    if (!load_graph(gj, app, &g, &why)) {
        std::fprintf(stderr, "ORCH: graph_update de %s rejeitado: %s\n", app.c_str(), why.c_str());
        return;
    }
    std::fprintf(log_out(), "ORCH: grafo %s atualizado (%zu nos, %zu arestas)\n", app.c_str(), g.node_count(), g.edge_count());
    if (store_ && cfg_.persist_graphs && !store_->save(g)) {
        std::fprintf(stderr, "ORCH: grafo %s mantido so em memoria\n", app.c_str());
    }
    Json::Value p(Json::objectValue);
    p["app"] = app;
    p["nodes"] = static_cast<Json::UInt64>(g.node_count());
    p["edges"] = static_cast<Json::UInt64>(g.edge_count());
    graphs_[app] = std::move(g);
    send("graph_ack", field_string(msg, "requestId"), p);
}

void Orchestrator::on_ui_state(const Json::Value& msg) {
    const std::string app = field_string(msg, "currentApp");
    const std::string screen = field_string(msg, "screenFingerprint");
    if (app.empty() || screen.empty()) return;
    screens_[app] = screen;
    if (verbose()) std::fprintf(log_out(), "ORCH: ui_state %s -> %s\n", app.c_str(), screen.c_str());
}

void Orchestrator::on_action_result(const Json::Value& msg) {
    StepReport r;
    r.request_id = field_string(msg, "requestId");
    const Json::Value& idx = message_field(msg, "stepIndex");
    r.step_index = idx.isInt() ? idx.asInt() : -1;
    const Json::Value& ok = message_field(msg, "success");
    r.success = ok.isBool() && ok.asBool();
    r.new_screen = field_string(msg, "newScreenFingerprint");
    r.error = field_string(msg, "error");

    const MonitorOutcome out = monitor_.report(r, &screens_);
    if (out.event == MonitorEvent::Completed) {
        Json::Value p(Json::objectValue);
        p["summary"] = out.summary;
        p["success"] = true;
        send("plan_complete", r.request_id, p);
    } else if (out.event == MonitorEvent::Diverged) {
        Json::Value p(Json::objectValue);
        p["stepIndex"] = out.step_index;
        p["error"] = out.error;
        p["action"] = out.action;
        p["expectedScreen"] = out.expected_screen;
        p["screen"] = out.screen;
        send("plan_error", r.request_id, p);
    }
}

void Orchestrator::on_explore_complete(const Json::Value& msg) {
    std::string app = field_string(msg, "app");
    const std::string rid = field_string(msg, "requestId");
    if (app.empty() && !rid.empty()) {
        auto it = pending_.find(rid);
        if (it != pending_.end()) app = it->second.app;
    }
    std::fprintf(log_out(), "ORCH: exploracao concluida para %s\n", app.c_str());

    std::vector<std::string> ready;
    for (const auto& kv : pending_) {
        if (kv.second.app == app) ready.push_back(kv.first);
    }
    if (ready.empty()) return;
    if (!graphs_.count(app)) {
        std::fprintf(stderr, "ORCH: %s ainda sem grafo, %zu pedido(s) pendente(s)\n", app.c_str(), ready.size());
        return;
    }
    for (const std::string& id : ready) {
        const PendingRequest req = pending_[id];
        std::fprintf(log_out(), "ORCH: replanejando %s com grafo novo\n", id.c_str());
        run_pipeline(id, req.intent, req.app);
    }
}

void Orchestrator::on_replan(const Json::Value& msg) {
    const std::string rid = field_string(msg, "requestId");
    if (const ActivePlan* ap = monitor_.find(rid)) {
        const Intent intent = ap->plan.intent;
        const std::string app = ap->app;
        run_pipeline(rid, intent, app);
        return;
    }
    auto it = pending_.find(rid);
    if (it != pending_.end()) {
        const PendingRequest req = it->second;
        run_pipeline(rid, req.intent, req.app);
        return;
    }
    std::fprintf(stderr, "ORCH: replan sem plano para %s\n", rid.c_str());
}

void Orchestrator::on_cancel_plan(const Json::Value& msg) {
    const std::string rid = field_string(msg, "requestId");
    Json::Value p(Json::objectValue);
    p["success"] = false;
    p["cancelled"] = true;
    ActivePlan ap;
    if (monitor_.cancel(rid, &ap)) {
        p["summary"] = ap.plan.summary;
    } else if (pending_.erase(rid)) {
        p["summary"] = "";
    } else {
        std::fprintf(stderr, "ORCH: cancel_plan sem plano para %s\n", rid.c_str());
        return;
    }
    send("plan_complete", rid, p);
}

void Orchestrator::on_solve(const Json::Value& msg) {
    const std::string rid = field_string(msg, "requestId", "unknown");
    const Json::Value& gj = message_field(msg, "grid");
    const Json::Value& wj = message_field(msg, "width");
    const Json::Value& hj = message_field(msg, "height");
    std::vector<int> grid;
    if (gj.isArray()) {
        grid.reserve(gj.size());
        for (const Json::Value& v : gj) grid.push_back(v.isInt() ? v.asInt() : static_cast<int>(Token::Wall));
    }
    const int w = wj.isInt() ? wj.asInt() : 0;
    const int h = hj.isInt() ? hj.asInt() : 0;

    SolveResult r;
    const auto t0 = Clock::now();
    if (grid_dims_ok(grid.size(), w, h)) {
        r = solver_(grid, w, h);
    } else {
        std::fprintf(stderr, "ORCH: solve %s com dimensoes invalidas (%dx%d, %zu celulas)\n",
                     rid.c_str(), w, h, grid.size());
    }
    const long long ms = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - t0).count();
    std::fprintf(log_out(), "ORCH: solve %s (%dx%d) -> %s em %lld ms\n", rid.c_str(), w, h, r.success ? "ok" : "falha", ms);

    Json::Value out(Json::objectValue);
    out["type"] = "solution";
    out["requestId"] = rid;
    Json::Value path(Json::arrayValue);
    for (const GridPos& p : r.path) {
        Json::Value cell(Json::arrayValue);
        cell.append(p.row);
        cell.append(p.col);
        path.append(cell);
    }
    out["path"] = path;
    out["success"] = r.success;
    out["inferenceTimeMs"] = static_cast<Json::Int64>(ms);
    if (emit_) emit_(out);
}

void Orchestrator::tick(Clock::time_point now) {
    if (cfg_.plan_ttl_ms <= 0) return;
    for (const ActivePlan& ap : monitor_.expire(std::chrono::milliseconds(cfg_.plan_ttl_ms), now)) {
        Json::Value p(Json::objectValue);
        p["stepIndex"] = -1;
        p["error"] = "plan expired";
        p["action"] = "abort";
        send("plan_error", ap.request_id, p);
    }
}

std::string Orchestrator::status_line() const {
    char buf[256];
    const StoreStatus st = store_ ? store_->status() : StoreStatus{};
    std::snprintf(buf, sizeof(buf), "STATUS graphs=%zu screens=%zu plans=%zu pending=%zu stored=%u dir=%s",
                  graphs_.size(), screens_.size(), monitor_.active(), pending_.size(),
                  static_cast<unsigned>(st.saved_count), st.dir.empty() ? "-" : st.dir.c_str());
    return buf;
}

bool Orchestrator::reset_store() {
    if (!store_) return false;
    return store_->eraseAll();
}

} // namespace navmaze
