#include "GraphJson.hpp"
#include <algorithm>
#include <set>

namespace navmaze {

static std::string str_or(const Json::Value& obj, const char* key, const std::string& def) {
    const Json::Value& v = obj[key];
    return v.isString() ? v.asString() : def;
}

static bool bool_or(const Json::Value& obj, const char* key, bool def) {
    const Json::Value& v = obj[key];
    return v.isBool() ? v.asBool() : def;
}

Selector selector_from_json(const Json::Value& json) {
    Selector s;
    if (!json.isObject()) return s;
    for (const std::string& k : json.getMemberNames()) {
        if (json[k].isString()) s[k] = json[k].asString();
    }
    return s;
}

Json::Value selector_to_json(const Selector& s) {
    Json::Value out(Json::objectValue);
    for (const auto& kv : s) out[kv.first] = kv.second;
    return out;
}

static GraphNode node_from_json(const std::string& id, const Json::Value& nj) {
    GraphNode n;
    n.id = id;
    n.label = id;
    if (!nj.isObject()) return n;
    n.label = str_or(nj, "label", id);
    n.activity = str_or(nj, "activity", "");
    n.dynamic = bool_or(nj, "dynamic", false);
    const Json::Value& edges = nj["edges"];
    if (edges.isArray()) {
        for (const Json::Value& e : edges) {
            if (e.isString()) n.edges.push_back(e.asString());
        }
    }
    const Json::Value& snap = nj["accessibility_snapshot"];
    if (snap.isObject() && snap["key_elements"].isArray()) {
        for (const Json::Value& ej : snap["key_elements"]) {
            if (!ej.isObject()) continue;
            UiElement el;
            el.id = str_or(ej, "id", "");
            el.text = str_or(ej, "text", "");
            el.content_desc = str_or(ej, "content_desc", "");
            el.class_name = str_or(ej, "class", "");
            n.key_elements.push_back(el);
        }
    }
    return n;
}

std::vector<std::string> node_ids_in_order(const Json::Value& graph) {
    std::vector<std::string> ids;
    const Json::Value& nodes = graph["nodes"];
    if (!nodes.isObject()) return ids;
    std::set<std::string> seen;
    const Json::Value& order = graph["node_order"];
    if (order.isArray()) {
        for (const Json::Value& v : order) {
            if (v.isString() && nodes.isMember(v.asString()) && seen.insert(v.asString()).second) {
                ids.push_back(v.asString());
            }
        }
    }
    // getMemberNames() vem ordenado; a posição no texto recupera a ordem enviada
    std::vector<std::string> rest;
    for (const std::string& id : nodes.getMemberNames()) {
        if (!seen.count(id)) rest.push_back(id);
    }
    std::stable_sort(rest.begin(), rest.end(), [&nodes](const std::string& a, const std::string& b) {
        return nodes[a].getOffsetStart() < nodes[b].getOffsetStart();
    });
    ids.insert(ids.end(), rest.begin(), rest.end());
    return ids;
}

bool load_graph(const Json::Value& json, const std::string& app, NavigationGraph* out, std::string* error) {
    auto fail = [&](const std::string& why) {
        if (error) *error = why;
        return false;
    };
    if (!out) return fail("no output graph");
    if (!json.isObject()) return fail("graph is not an object");
    const Json::Value& nodes = json["nodes"];
    if (!nodes.isObject()) return fail("graph.nodes is not an object");

    const std::string pkg = !app.empty() ? app : str_or(json, "app", "unknown");
    NavigationGraph g(pkg, str_or(json, "version", "1.0.0"));

    for (const std::string& id : node_ids_in_order(json)) {
        g.add_node(node_from_json(id, nodes[id]));
    }

    const Json::Value& edges = json["edges"];
    if (!edges.isNull() && !edges.isArray()) return fail("graph.edges is not an array");
    if (edges.isArray()) {
        for (Json::ArrayIndex i = 0; i < edges.size(); ++i) {
            const Json::Value& ej = edges[i];
            if (!ej.isObject() || !ej["from"].isString() || !ej["to"].isString()) {
                return fail("edge " + std::to_string(i) + " lacks from/to");
            }
            GraphEdge e;
            e.from = ej["from"].asString();
            e.to = ej["to"].asString();
            const Json::Value& action = ej["action"];
            if (action.isObject()) {
                e.action.type = str_or(action, "type", "");
                e.action.selector = selector_from_json(action["selector"]);
            }
            if (ej["weight"].isInt()) e.weight = ej["weight"].asInt();
            e.bidirectional = bool_or(ej, "bidirectional", false);
            g.add_edge(std::move(e));
        }
    }

    *out = std::move(g);
    return true;
}

Json::Value graph_to_json(const NavigationGraph& g) {
    Json::Value root(Json::objectValue);
    root["app"] = g.app();
    root["version"] = g.version();
    Json::Value nodes(Json::objectValue);
    Json::Value order(Json::arrayValue);
    for (const std::string& id : g.node_order()) {
        order.append(id);
        const GraphNode* n = g.node(id);
        Json::Value nj(Json::objectValue);
        nj["label"] = n->label;
        Json::Value edges(Json::arrayValue);
        for (const std::string& e : n->edges) edges.append(e);
        nj["edges"] = edges;
        if (!n->activity.empty()) nj["activity"] = n->activity;
        if (n->dynamic) nj["dynamic"] = true;
        if (!n->key_elements.empty()) {
            Json::Value elems(Json::arrayValue);
            for (const UiElement& el : n->key_elements) {
                Json::Value ej(Json::objectValue);
                ej["id"] = el.id;
                ej["text"] = el.text;
                ej["content_desc"] = el.content_desc;
                ej["class"] = el.class_name;
                elems.append(ej);
            }
            nj["accessibility_snapshot"]["key_elements"] = elems;
        }
        nodes[id] = nj;
    }
    root["nodes"] = nodes;
    root["node_order"] = order;
    Json::Value edges(Json::arrayValue);
    for (const GraphEdge& e : g.edges()) {
        Json::Value ej(Json::objectValue);
        ej["from"] = e.from;
        ej["to"] = e.to;
        if (!e.action.empty()) {
            ej["action"]["type"] = e.action.type;
            ej["action"]["selector"] = selector_to_json(e.action.selector);
        }
        ej["weight"] = e.weight;
        ej["bidirectional"] = e.bidirectional;
        edges.append(ej);
    }
    root["edges"] = edges;
    return root;
}

} // namespace navmaze
