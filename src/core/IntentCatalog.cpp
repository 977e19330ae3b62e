#include "IntentCatalog.hpp"
#include "GraphJson.hpp"
#include "Log.hpp"
#include <cstdio>
#include <utility>

namespace navmaze {

IntentCatalog IntentCatalog::defaults() {
    IntentCatalog c;
    c.hub_ = "home";
    c.routes_["send_money"] = {"home", "transfers", "send", "confirm", "success"};
    c.routes_["send_money_from_pocket"] = {"home", "pockets", "pocket_detail", "withdraw_pocket",
                                           "home", "transfers", "send", "confirm", "success"};
    c.routes_["check_balance"] = {"home"};
    c.routes_["transfer_pocket"] = {"home", "pockets", "pocket_detail", "withdraw_pocket"};
    c.routes_["pay_bill"] = {"home", "payments", "pay_bill"};
    c.routes_["transaction_history"] = {"home"};

    c.variants_.push_back({"send_money", "source", "bolsillo", "send_money_from_pocket"});

    c.sensitive_ = {"send_money", "send_money_from_pocket", "pay_bill", "transfer_pocket"};

    const Selector search{{"id", "search_recipient"}, {"class", "android.widget.EditText"}};
    const Selector amount{{"id", "amount_input"}, {"class", "android.widget.EditText"}};
    for (const char* cp : {"send", "send_contact"}) {
        c.params_[cp].push_back({"recipient", "fill", search, "{value}", "Search recipient: {value}", ""});
        c.params_[cp].push_back({"recipient", "tap", Selector{{"text", "{value}"}}, "", "Select: {value}", ""});
    }
    for (const char* cp : {"send", "enter_amount"}) {
        c.params_[cp].push_back({"amount", "fill", amount, "{value}", "Enter amount: ${money}", ""});
    }
    c.params_["pocket_detail"].push_back({"source", "tap", Selector{{"text", "{value}"}, {"content_desc", "{value}"}},
                                          "", "Select pocket: {value}", "bolsillo_"});
    return c;
}

static bool read_string_list(const Json::Value& arr, std::vector<std::string>* out) {
    if (!arr.isArray()) return false;
    std::vector<std::string> v;
    for (const Json::Value& s : arr) {
        if (!s.isString()) return false;
        v.push_back(s.asString());
    }
    *out = std::move(v);
    return true;
}

bool IntentCatalog::load_json(const Json::Value& json, std::string* error) {
    auto fail = [&](const std::string& why) {
        if (error) *error = why;
        return false;
    };
    if (!json.isObject()) return fail("catalog is not an object");
    IntentCatalog next = *this;

    if (json.isMember("hub")) {
        if (!json["hub"].isString()) return fail("hub is not a string");
        next.hub_ = json["hub"].asString();
    }
    if (json.isMember("routes")) {
        const Json::Value& routes = json["routes"];
        if (!routes.isObject()) return fail("routes is not an object");
        for (const std::string& intent : routes.getMemberNames()) {
            std::vector<std::string> seq;
            if (!read_string_list(routes[intent], &seq)) return fail("route '" + intent + "' is not a string array");
            next.routes_[intent] = std::move(seq);
        }
    }
    if (json.isMember("variants")) {
        const Json::Value& vars = json["variants"];
        if (!vars.isArray()) return fail("variants is not an array");
        next.variants_.clear();
        for (const Json::Value& v : vars) {
            if (!v.isObject() || !v["intent"].isString() || !v["param"].isString() || !v["route"].isString())
                return fail("variant lacks intent/param/route");
            next.variants_.push_back({v["intent"].asString(), v["param"].asString(),
                                      v["prefix"].isString() ? v["prefix"].asString() : std::string(),
                                      v["route"].asString()});
        }
    }
    if (json.isMember("sensitive")) {
        std::vector<std::string> list;
        if (!read_string_list(json["sensitive"], &list)) return fail("sensitive is not a string array");
        next.sensitive_ = std::set<std::string>(list.begin(), list.end());
    }
    if (json.isMember("params")) {
        const Json::Value& params = json["params"];
        if (!params.isObject()) return fail("params is not an object");
        next.params_.clear();
        for (const std::string& cp : params.getMemberNames()) {
            const Json::Value& rules = params[cp];
            if (!rules.isArray()) return fail("params '" + cp + "' is not an array");
            for (const Json::Value& r : rules) {
                if (!r.isObject() || !r["param"].isString() || !r["action"].isString())
                    return fail("param rule at '" + cp + "' lacks param/action");
                ParamRule rule;
                rule.param = r["param"].asString();
                rule.action = r["action"].asString();
                rule.selector = selector_from_json(r["selector"]);
                rule.value = r["value"].isString() ? r["value"].asString() : std::string();
                rule.description = r["description"].isString() ? r["description"].asString() : std::string();
                rule.strip_prefix = r["strip_prefix"].isString() ? r["strip_prefix"].asString() : std::string();
                next.params_[cp].push_back(std::move(rule));
            }
        }
    }
    *this = std::move(next);
    std::fprintf(log_out(), "CATALOG: %zu rotas, hub '%s'\n", routes_.size(), hub_.c_str());
    return true;
}

std::string IntentCatalog::route_key(const std::string& intent, const std::map<std::string, std::string>& params) const {
    for (const RouteVariant& v : variants_) {
        if (v.intent != intent) continue;
        auto it = params.find(v.param);
        if (it != params.end() && it->second.compare(0, v.prefix.size(), v.prefix) == 0) return v.route;
    }
    return intent;
}

std::vector<std::string> IntentCatalog::resolve(const std::string& intent, const std::map<std::string, std::string>& params,
                                                const std::string& current_screen) const {
    const std::string key = route_key(intent, params);
    auto it = routes_.find(key);
    if (it == routes_.end() || it->second.empty()) {
        std::fprintf(stderr, "CATALOG: sem checkpoints para intent '%s'\n", intent.c_str());
        return {current_screen};
    }
    std::vector<std::string> seq;
    if (it->second.front() != current_screen) seq.push_back(current_screen);
    seq.insert(seq.end(), it->second.begin(), it->second.end());
    return dedupe_checkpoints(seq, hub_);
}

const std::vector<ParamRule>& IntentCatalog::param_rules(const std::string& checkpoint) const {
    static const std::vector<ParamRule> kNone;
    auto it = params_.find(checkpoint);
    return it == params_.end() ? kNone : it->second;
}

void IntentCatalog::set_sensitive(const std::string& intent, bool on) {
    if (on) sensitive_.insert(intent);
    else sensitive_.erase(intent);
}

std::vector<std::string> dedupe_checkpoints(const std::vector<std::string>& seq, const std::string& hub) {
    std::set<std::string> seen;
    std::vector<std::string> out;
    for (const std::string& cp : seq) {
        if (cp == hub || seen.insert(cp).second) out.push_back(cp);
    }
    return out;
}

} // namespace navmaze
