#include "Plan.hpp"

namespace navmaze {

const char* to_string(ActionKind a) {
    switch (a) {
        case ActionKind::Tap: return "tap";
        case ActionKind::Fill: return "fill";
        case ActionKind::Swipe: return "swipe";
        case ActionKind::Scroll: return "scroll";
        case ActionKind::Back: return "back";
        case ActionKind::Wait: return "wait";
    }
    return "tap";
}

bool parse_action(const std::string& s, ActionKind* out) {
    static const ActionKind all[] = {ActionKind::Tap, ActionKind::Fill, ActionKind::Swipe,
                                     ActionKind::Scroll, ActionKind::Back, ActionKind::Wait};
    for (ActionKind a : all) {
        if (s == to_string(a)) {
            if (out) *out = a;
            return true;
        }
    }
    return false;
}

const char* to_string(HopOutcome o) {
    switch (o) {
        case HopOutcome::Oracle: return "oracle";
        case HopOutcome::GraphFallback: return "graph_fallback";
        case HopOutcome::CompileFailed: return "compile_failed";
        case HopOutcome::Unreachable: return "unreachable";
    }
    return "?";
}

} // namespace navmaze
