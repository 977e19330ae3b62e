#include "PlanAssembler.hpp"
#include "Log.hpp"
#include "PathDecoder.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>

namespace navmaze {

static ActionKind action_or_tap(const std::string& type, const char* where) {
    ActionKind k = ActionKind::Tap;
    if (!type.empty() && !parse_action(type, &k)) {
        std::fprintf(stderr, "PLAN: acao '%s' desconhecida em %s, usando tap\n", type.c_str(), where);
    }
    return k;
}

static std::string join(const std::vector<std::string>& v, const char* sep) {
    std::string out;
    for (size_t i = 0; i < v.size(); ++i) {
        if (i) out += sep;
        out += v[i];
    }
    return out;
}

/** @brief true se cada par consecutivo de `nodes` é uma transição do grafo. */
static bool follows_graph(const NavigationGraph& g, const std::vector<std::string>& nodes) {
    for (size_t j = 0; j + 1 < nodes.size(); ++j) {
        const std::vector<std::string> nb = g.neighbors(nodes[j]);
        if (std::find(nb.begin(), nb.end(), nodes[j + 1]) == nb.end()) return false;
    }
    return true;
}

static std::string replace_all(std::string s, const std::string& from, const std::string& to) {
    for (size_t pos = s.find(from); pos != std::string::npos; pos = s.find(from, pos + to.size())) {
        s.replace(pos, from.size(), to);
    }
    return s;
}

std::string format_amount(const std::string& digits) {
    if (digits.empty()) return digits;
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return digits;
    }
    std::string out;
    const size_t n = digits.size();
    for (size_t i = 0; i < n; ++i) {
        if (i && (n - i) % 3 == 0) out.push_back(',');
        out.push_back(digits[i]);
    }
    return out;
}

std::string build_summary(const Intent& intent) {
    if (intent.name == "send_money") {
        const std::string amount = intent.has("amount") ? format_amount(intent.param("amount")) : "?";
        return "Enviar $" + amount + " a " + intent.param("recipient", "?") + " desde " +
               intent.param("source", "cuenta principal");
    }
    if (intent.name == "check_balance") return "Consultar saldo";
    if (intent.name == "transfer_pocket") return "Transferir entre bolsillos";
    if (intent.name == "pay_bill") return "Pagar servicio: " + intent.param("service", "?");
    return "Ejecutar: " + intent.name;
}

ActionStep PlanAssembler::build_action_step(int index, const std::string& from, const std::string& to) const {
    ActionStep s;
    s.index = index;
    s.expected_screen = to;

    const GraphEdge* e = graph_.edge(from, to);
    if (e && !e->action.empty()) {
        s.action = action_or_tap(e->action.type, "aresta");
        s.selector = e->action.selector;
        s.description = "Navigate: " + from + " → " + to;
        return s;
    }

    const GraphNode* n = graph_.node(to);
    if (n && !n->key_elements.empty()) {
        const UiElement& el = n->key_elements.front();
        s.action = ActionKind::Tap;
        if (!el.id.empty()) s.selector["id"] = el.id;
        if (!el.text.empty()) s.selector["text"] = el.text;
        if (!el.content_desc.empty()) s.selector["content_desc"] = el.content_desc;
        s.description = "Tap: " + (el.text.empty() ? to : el.text);
        return s;
    }

    const std::string label = n ? n->label : to;
    s.action = ActionKind::Tap;
    s.selector = Selector{{"text", label}, {"content_desc", label}};
    s.description = "Navigate to: " + label;
    return s;
}

std::vector<ActionStep> PlanAssembler::build_param_steps(int start_index, const std::string& screen,
                                                         const Intent& intent) const {
    std::vector<ActionStep> steps;
    int idx = start_index;
    for (const ParamRule& rule : catalog_.param_rules(screen)) {
        if (!intent.has(rule.param)) continue;
        std::string v = intent.param(rule.param);
        if (!rule.strip_prefix.empty() && v.compare(0, rule.strip_prefix.size(), rule.strip_prefix) == 0) {
            v = v.substr(rule.strip_prefix.size());
        }
        auto fill = [&](const std::string& tpl) {
            return replace_all(replace_all(tpl, "{value}", v), "{money}", format_amount(v));
        };
        ActionStep s;
        s.index = idx++;
        s.action = action_or_tap(rule.action, screen.c_str());
        for (const auto& kv : rule.selector) s.selector[kv.first] = fill(kv.second);
        s.value = fill(rule.value);
        s.expected_screen = screen;
        s.description = fill(rule.description);
        steps.push_back(s);
    }
    return steps;
}

ExecutionPlan PlanAssembler::assemble(const std::vector<std::string>& checkpoints, const Intent& intent,
                                      const SolverFn& solver) const {
    ExecutionPlan plan;
    plan.intent = intent;
    plan.checkpoints = checkpoints;
    int index = 0;

    for (size_t i = 0; i + 1 < checkpoints.size(); ++i) {
        const std::string& from = checkpoints[i];
        const std::string& to = checkpoints[i + 1];
        if (from == to) continue;

        HopReport hop;
        hop.from = from;
        hop.to = to;

        CompiledField cf;
        const CompileStatus st = compile(graph_, from, to, &cf, layout_);
        hop.dropped = cf.dropped;
        if (st == CompileStatus::StartMissing || st == CompileStatus::TargetMissing) {
            std::fprintf(stderr, "PLAN: salto %s -> %s descartado (%s)\n", from.c_str(), to.c_str(), to_string(st));
            hop.outcome = HopOutcome::CompileFailed;
            plan.hops.push_back(hop);
            continue;
        }

        std::vector<std::string> nodes;
        if (st != CompileStatus::Ok) {
            std::fprintf(stderr, "PLAN: %s -> %s fora do campo (%s), BFS no grafo\n", from.c_str(), to.c_str(), to_string(st));
        } else if (solver) {
            SolveResult r = solver(cf.flat(), cf.field.width(), cf.field.height());
            if (r.success && !r.path.empty()) {
                nodes = decode_path(r.path, cf.positions);
                if (nodes.empty() || nodes.front() != from || nodes.back() != to) {
                    std::fprintf(stderr, "PLAN: caminho do solver nao liga %s -> %s, BFS no grafo\n", from.c_str(), to.c_str());
                    nodes.clear();
                } else if (!follows_graph(graph_, nodes)) {
                    // o campo é não-direcionado e corredores se cruzam
                    std::fprintf(stderr, "PLAN: caminho do solver %s usa transicao inexistente, BFS no grafo\n",
                                 join(nodes, " > ").c_str());
                    nodes.clear();
                } else {
                    hop.outcome = HopOutcome::Oracle;
                }
            }
        }
        if (nodes.empty()) {
            if (auto p = graph_.shortest_path(from, to)) {
                nodes = *p;
                hop.outcome = HopOutcome::GraphFallback;
            }
        }
        if (nodes.empty()) {
            std::fprintf(stderr, "PLAN: sem caminho %s -> %s\n", from.c_str(), to.c_str());
            hop.outcome = HopOutcome::Unreachable;
            plan.hops.push_back(hop);
            continue;
        }
        if (verbose()) std::fprintf(log_out(), "PLAN: %s -> %s via %s [%s]\n", from.c_str(), to.c_str(),
                                    join(nodes, " > ").c_str(), to_string(hop.outcome));

        const size_t before = plan.steps.size();
        for (size_t j = 0; j + 1 < nodes.size(); ++j) {
            plan.steps.push_back(build_action_step(index++, nodes[j], nodes[j + 1]));
        }
        for (ActionStep& ps : build_param_steps(index, to, intent)) {
            plan.steps.push_back(ps);
            ++index;
        }
        hop.nodes = nodes;
        hop.steps = static_cast<int>(plan.steps.size() - before);
        plan.hops.push_back(hop);
    }

    plan.summary = build_summary(intent);
    plan.requires_confirmation = catalog_.is_sensitive(intent.name) ||
                                 catalog_.is_sensitive(catalog_.route_key(intent.name, intent.params));
    plan.estimated_time_ms = static_cast<int>(plan.steps.size()) * CFG_STEP_COST_MS;
    std::fprintf(log_out(), "PLAN: %s -> %zu passos, %d/%zu saltos, ~%d ms\n", intent.name.c_str(),
                 plan.steps.size(), plan.resolved_hops(), plan.hops.size(), plan.estimated_time_ms);
    return plan;
}

ExecutionPlan PlanAssembler::plan(const Intent& intent, const std::string& current_screen, const SolverFn& solver) const {
    const std::vector<std::string> checkpoints = catalog_.resolve(intent, current_screen);
    std::fprintf(log_out(), "PLAN: checkpoints %s\n", join(checkpoints, " -> ").c_str());
    return assemble(checkpoints, intent, solver);
}

} // namespace navmaze
