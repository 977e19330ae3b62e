#include "Messages.hpp"
#include "GraphJson.hpp"
#include <cctype>
#include <memory>
#include <sstream>
#include <utility>

namespace navmaze {

bool parse_message(const std::string& line, Json::Value* out, std::string* error) {
    Json::CharReaderBuilder b;
    b["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(b.newCharReader());
    Json::Value root;
    std::string errs;
    if (!reader->parse(line.data(), line.data() + line.size(), &root, &errs)) {
        if (error) *error = errs;
        return false;
    }
    if (!root.isObject()) {
        if (error) *error = "message is not an object";
        return false;
    }
    if (out) *out = std::move(root);
    return true;
}

std::string write_message(const Json::Value& msg) {
    Json::StreamWriterBuilder b;
    b["indentation"] = "";
    b["emitUTF8"] = true;
    return Json::writeString(b, msg);
}

Json::Value make_message(const std::string& type, const std::string& request_id, const Json::Value& payload) {
    Json::Value m(Json::objectValue);
    m["type"] = type;
    if (!request_id.empty()) m["requestId"] = request_id;
    m["payload"] = payload.isNull() ? Json::Value(Json::objectValue) : payload;
    return m;
}

const Json::Value& message_field(const Json::Value& msg, const char* key) {
    static const Json::Value kNull;
    if (!msg.isObject()) return kNull;
    const Json::Value& payload = msg["payload"];
    if (payload.isObject() && payload.isMember(key)) return payload[key];
    if (msg.isMember(key)) return msg[key];
    return kNull;
}

std::string field_string(const Json::Value& msg, const char* key, const std::string& def) {
    const Json::Value& v = message_field(msg, key);
    return v.isString() ? v.asString() : def;
}

std::map<std::string, std::string> params_from_json(const Json::Value& json) {
    std::map<std::string, std::string> out;
    if (!json.isObject()) return out;
    for (const std::string& k : json.getMemberNames()) {
        const Json::Value& v = json[k];
        if (v.isString()) out[k] = v.asString();
        else if (v.isBool()) out[k] = v.asBool() ? "true" : "false";
        else if (v.isInt64()) out[k] = std::to_string(v.asInt64());
        else if (v.isUInt64()) out[k] = std::to_string(v.asUInt64());
        else if (v.isDouble()) {
            std::ostringstream os;
            os << v.asDouble();
            out[k] = os.str();
        }
    }
    return out;
}

bool intent_from_json(const Json::Value& msg, Intent* out) {
    if (!out) return false;
    Intent in;
    in.confidence = 1.0;
    const Json::Value& iv = message_field(msg, "intent");
    if (iv.isString()) {
        in.name = iv.asString();
    } else if (iv.isObject()) {
        if (iv["name"].isString()) in.name = iv["name"].asString();
        if (iv["confidence"].isNumeric()) in.confidence = iv["confidence"].asDouble();
        in.params = params_from_json(iv["params"]);
    }
    if (in.name.empty()) return false;
    const Json::Value& conf = message_field(msg, "confidence");
    if (conf.isNumeric()) in.confidence = conf.asDouble();
    for (const auto& kv : params_from_json(message_field(msg, "params"))) in.params[kv.first] = kv.second;
    in.raw_text = field_string(msg, "text");
    in.app = field_string(msg, "app");
    *out = std::move(in);
    return true;
}

static bool all_digits(const std::string& s) {
    if (s.empty() || s.size() > 18) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

Json::Value intent_to_json(const Intent& intent) {
    Json::Value j(Json::objectValue);
    j["name"] = intent.name;
    j["confidence"] = intent.confidence;
    Json::Value params(Json::objectValue);
    for (const auto& kv : intent.params) {
        if (kv.first == "amount" && all_digits(kv.second)) params[kv.first] = Json::Int64(std::stoll(kv.second));
        else params[kv.first] = kv.second;
    }
    j["params"] = params;
    return j;
}

Json::Value step_to_json(const ActionStep& step) {
    Json::Value j(Json::objectValue);
    j["index"] = step.index;
    j["action"] = to_string(step.action);
    j["selector"] = selector_to_json(step.selector);
    j["value"] = step.value;
    j["expectedScreen"] = step.expected_screen;
    j["description"] = step.description;
    j["timeoutMs"] = step.timeout_ms;
    return j;
}

Json::Value plan_to_json(const ExecutionPlan& plan) {
    Json::Value j(Json::objectValue);
    j["intent"] = intent_to_json(plan.intent);
    j["summary"] = plan.summary;
    j["requiresConfirmation"] = plan.requires_confirmation;
    j["estimatedTimeMs"] = plan.estimated_time_ms;
    Json::Value cps(Json::arrayValue);
    for (const std::string& c : plan.checkpoints) cps.append(c);
    j["checkpoints"] = cps;
    Json::Value steps(Json::arrayValue);
    for (const ActionStep& s : plan.steps) steps.append(step_to_json(s));
    j["steps"] = steps;
    return j;
}

} // namespace navmaze
