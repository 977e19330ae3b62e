#include "ExecutionMonitor.hpp"
#include "Log.hpp"
#include <cstdio>
#include <utility>

namespace navmaze {

const char* to_string(PlanState s) {
    switch (s) {
        case PlanState::Planned: return "planned";
        case PlanState::Executing: return "executing";
        case PlanState::Completed: return "completed";
        case PlanState::Failed: return "failed";
        case PlanState::Replanning: return "replanning";
        case PlanState::Cancelled: return "cancelled";
    }
    return "?";
}

void ExecutionMonitor::start(const std::string& request_id, const std::string& app, ExecutionPlan plan,
                             Clock::time_point now) {
    ActivePlan ap;
    ap.request_id = request_id;
    ap.app = app;
    ap.plan = std::move(plan);
    ap.started = now;
    if (plans_.count(request_id)) std::fprintf(log_out(), "MONITOR: plano %s substituido\n", request_id.c_str());
    plans_[request_id] = std::move(ap);
}

MonitorOutcome ExecutionMonitor::report(const StepReport& r, std::map<std::string, std::string>* screens) {
    MonitorOutcome out;
    out.step_index = r.step_index;
    out.screen = r.new_screen;
    out.error = r.error;

    auto it = plans_.find(r.request_id);
    if (it == plans_.end()) {
        std::fprintf(stderr, "MONITOR: sem plano ativo para %s\n", r.request_id.c_str());
        return out;
    }
    ActivePlan& ap = it->second;
    const std::vector<ActionStep>& steps = ap.plan.steps;
    out.app = ap.app;
    out.summary = ap.plan.summary;
    const bool valid_index = r.step_index >= 0 && r.step_index < static_cast<int>(steps.size());
    if (valid_index) out.expected_screen = steps[static_cast<size_t>(r.step_index)].expected_screen;

    if (r.success) {
        if (screens) {
            if (!r.new_screen.empty()) (*screens)[ap.app] = r.new_screen;
            else if (valid_index) (*screens)[ap.app] = out.expected_screen;
        }
        if (r.step_index + 1 >= static_cast<int>(steps.size())) {
            std::fprintf(log_out(), "MONITOR: plano %s concluido (%s)\n", r.request_id.c_str(), ap.plan.summary.c_str());
            out.event = MonitorEvent::Completed;
            plans_.erase(it);
            return out;
        }
        ap.state = PlanState::Executing;
        if (r.step_index + 1 > ap.next_step) ap.next_step = r.step_index + 1;
        if (verbose()) std::fprintf(log_out(), "MONITOR: %s passo %d ok -> %s\n", r.request_id.c_str(), r.step_index, r.new_screen.c_str());
        out.event = MonitorEvent::Advanced;
        return out;
    }

    std::fprintf(stderr, "MONITOR: %s passo %d falhou: %s\n", r.request_id.c_str(), r.step_index, r.error.c_str());
    if (r.new_screen.empty() || r.new_screen == out.expected_screen) {
        if (ap.state == PlanState::Planned) ap.state = PlanState::Executing;
        out.event = MonitorEvent::Ignored;
        return out;
    }

    const int n = ++ap.divergences[r.step_index];
    const bool give_up = n > max_retries_;
    ap.state = give_up ? PlanState::Failed : PlanState::Replanning;
    out.action = give_up ? "abort" : "retry";
    if (screens) (*screens)[ap.app] = r.new_screen;
    std::fprintf(stderr, "MONITOR: divergencia em %s passo %d: tela '%s' (esperada '%s'), %s\n",
                 r.request_id.c_str(), r.step_index, r.new_screen.c_str(), out.expected_screen.c_str(), out.action.c_str());
    out.event = MonitorEvent::Diverged;
    return out;
}

bool ExecutionMonitor::cancel(const std::string& request_id, ActivePlan* out) {
    auto it = plans_.find(request_id);
    if (it == plans_.end()) return false;
    it->second.state = PlanState::Cancelled;
    if (out) *out = std::move(it->second);
    plans_.erase(it);
    std::fprintf(log_out(), "MONITOR: plano %s cancelado\n", request_id.c_str());
    return true;
}

std::vector<ActivePlan> ExecutionMonitor::expire(std::chrono::milliseconds ttl, Clock::time_point now) {
    std::vector<ActivePlan> gone;
    for (auto it = plans_.begin(); it != plans_.end();) {
        if (now - it->second.started > ttl) {
            it->second.state = PlanState::Cancelled;
            std::fprintf(stderr, "MONITOR: plano %s expirou\n", it->first.c_str());
            gone.push_back(std::move(it->second));
            it = plans_.erase(it);
        } else {
            ++it;
        }
    }
    return gone;
}

const ActivePlan* ExecutionMonitor::find(const std::string& request_id) const {
    auto it = plans_.find(request_id);
    return it == plans_.end() ? nullptr : &it->second;
}

} // namespace navmaze
