#include "NavigationGraph.hpp"
#include <algorithm>
#include <queue>
#include <unordered_set>

namespace navmaze {

bool NavigationGraph::add_node(GraphNode n) {
    if (nodes_.count(n.id)) return false;
    order_.push_back(n.id);
    std::string key = n.id;
    nodes_.emplace(std::move(key), std::move(n));
    return true;
}

const GraphNode* NavigationGraph::node(const std::string& id) const {
    auto it = nodes_.find(id);
    return it == nodes_.end() ? nullptr : &it->second;
}

std::vector<std::string> NavigationGraph::neighbors(const std::string& id) const {
    std::vector<std::string> out;
    auto push = [&](const std::string& n) {
        if (std::find(out.begin(), out.end(), n) == out.end()) out.push_back(n);
    };
    for (const GraphEdge& e : edges_) {
        if (e.from == id) push(e.to);
        else if (e.bidirectional && e.to == id) push(e.from);
    }
    if (const GraphNode* n = node(id)) {
        for (const std::string& e : n->edges) push(e);
    }
    return out;
}

const GraphEdge* NavigationGraph::edge(const std::string& from, const std::string& to) const {
    for (const GraphEdge& e : edges_) {
        if (e.from == from && e.to == to) return &e;
        if (e.bidirectional && e.to == from && e.from == to) return &e;
    }
    return nullptr;
}

std::vector<std::string> NavigationGraph::bfs_order(const std::string& seed) const {
    std::vector<std::string> visited;
    if (!has_node(seed)) return visited;
    std::unordered_set<std::string> seen{seed};
    std::queue<std::string> q;
    q.push(seed);
    while (!q.empty()) {
        std::string cur = q.front(); q.pop();
        visited.push_back(cur);
        for (const std::string& nb : neighbors(cur)) {
            if (!seen.count(nb) && has_node(nb)) {
                seen.insert(nb);
                q.push(nb);
            }
        }
    }
    return visited;
}

std::optional<std::vector<std::string>> NavigationGraph::shortest_path(const std::string& start, const std::string& target) const {
    if (!has_node(start) || !has_node(target)) return std::nullopt;
    std::unordered_map<std::string, std::string> prev;
    std::unordered_set<std::string> seen{start};
    std::queue<std::string> q;
    q.push(start);
    bool found = false;
    while (!q.empty()) {
        std::string cur = q.front(); q.pop();
        if (cur == target) { found = true; break; }
        for (const std::string& nb : neighbors(cur)) {
            if (!seen.count(nb) && has_node(nb)) {
                seen.insert(nb);
                prev[nb] = cur;
                q.push(nb);
            }
        }
    }
    if (!found) return std::nullopt;
    std::vector<std::string> path;
    for (std::string cur = target; ; cur = prev[cur]) {
        path.push_back(cur);
        if (cur == start) break;
    }
    std::reverse(path.begin(), path.end()); // reconstrói do target ao start
    return path;
}

} // namespace navmaze
