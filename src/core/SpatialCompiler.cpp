#include "SpatialCompiler.hpp"
#include "Log.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <set>
#include <utility>

namespace navmaze {

const char* to_string(CompileStatus s) {
    switch (s) {
        case CompileStatus::Ok: return "ok";
        case CompileStatus::StartMissing: return "start_missing";
        case CompileStatus::TargetMissing: return "target_missing";
        case CompileStatus::StartDropped: return "start_dropped";
        case CompileStatus::TargetDropped: return "target_dropped";
    }
    return "?";
}

FieldLayout layout_nodes(const NavigationGraph& g, const LayoutParams& p) {
    FieldLayout lay;
    if (g.empty()) return lay;

    const int n = static_cast<int>(g.node_count());
    const int usable = p.size - 2 * p.border;
    const int cols = std::max(1, static_cast<int>(std::ceil(std::sqrt(static_cast<double>(n)))));
    const int rows = std::max(1, (n + cols - 1) / cols);

    int col_spacing = std::max(p.spacing, usable / cols);
    int row_spacing = std::max(p.spacing, usable / rows);
    col_spacing = cols > 1 ? std::min(col_spacing, (usable - 1) / (cols - 1)) : usable / 2;
    row_spacing = rows > 1 ? std::min(row_spacing, (usable - 1) / (rows - 1)) : usable / 2;

    lay.order = g.bfs_order(g.node_order().front());
    std::set<std::string> ordered(lay.order.begin(), lay.order.end());
    for (const std::string& id : g.node_order()) {
        if (!ordered.count(id)) lay.order.push_back(id);
    }

    const int lo = p.border + 1;      // primeira linha/coluna utilizável
    const int hi = p.size - p.border; // primeira linha/coluna fora da área
    std::set<GridPos> taken;
    for (size_t i = 0; i < lay.order.size(); ++i) {
        const std::string& id = lay.order[i];
        if (usable < 1 || lo >= hi) { lay.dropped.push_back(id); continue; }
        int r = std::min(lo + static_cast<int>(i) / cols * row_spacing, hi - 1);
        int c = std::min(lo + static_cast<int>(i) % cols * col_spacing, hi - 1);
        bool placed = true;
        while (taken.count({r, c})) {
            if (++c >= hi) { c = lo; ++r; }
            if (r >= hi) { placed = false; break; }
        }
        if (!placed) {
            lay.dropped.push_back(id);
            continue;
        }
        taken.insert({r, c});
        lay.positions[id] = GridPos{r, c};
        if (verbose()) std::fprintf(log_out(), "COMPILER: no '%s' em (%d,%d)\n", id.c_str(), r, c);
    }
    if (!lay.dropped.empty()) {
        std::fprintf(stderr, "COMPILER: %zu no(s) fora do campo %dx%d (primeiro: '%s')\n",
                     lay.dropped.size(), p.size, p.size, lay.dropped.front().c_str());
    }
    return lay;
}

/** @brief Corredor em L: horizontal na linha de `a`, depois vertical na coluna de `b`. */
static void trace_l_path(SpatialField& f, GridPos a, GridPos b) {
    auto open = [&](int r, int c) {
        if (f.in_bounds(r, c) && f.at(r, c) == Token::Wall) f.set(r, c, Token::Path);
    };
    const int cs = b.col >= a.col ? 1 : -1;
    for (int c = a.col; c != b.col; c += cs) open(a.row, c);
    open(a.row, b.col);
    const int rs = b.row >= a.row ? 1 : -1;
    for (int r = a.row; r != b.row; r += rs) open(r, b.col);
    open(b.row, b.col);
}

static void trace_edges(const NavigationGraph& g, CompiledField& cf) {
    std::set<std::pair<std::string, std::string>> traced;
    auto trace = [&](const std::string& from, const std::string& to) {
        auto a = cf.positions.find(from);
        auto b = cf.positions.find(to);
        if (a == cf.positions.end() || b == cf.positions.end()) return;
        trace_l_path(cf.field, a->second, b->second);
    };
    for (const GraphEdge& e : g.edges()) {
        if (!traced.insert({e.from, e.to}).second) continue;
        trace(e.from, e.to);
        if (e.bidirectional) traced.insert({e.to, e.from});
    }
    for (const std::string& id : g.node_order()) {
        for (const std::string& nb : g.node(id)->edges) {
            if (!traced.insert({id, nb}).second) continue;
            trace(id, nb);
        }
    }
}

CompileStatus compile(const NavigationGraph& g, const std::string& start, const std::string& target,
                      CompiledField* out, const LayoutParams& p) {
    if (!out) return CompileStatus::StartMissing;
    *out = CompiledField{};
    out->field = SpatialField(p.size, p.size);

    FieldLayout lay = layout_nodes(g, p);
    out->positions = std::move(lay.positions);
    out->dropped = std::move(lay.dropped);
    for (const auto& kv : out->positions) {
        out->cells[kv.second] = kv.first;
        out->field.set(kv.second.row, kv.second.col, Token::Path);
    }
    trace_edges(g, *out);

    if (!g.has_node(start)) return CompileStatus::StartMissing;
    if (!g.has_node(target)) return CompileStatus::TargetMissing;
    auto s = out->positions.find(start);
    if (s == out->positions.end()) return CompileStatus::StartDropped;
    auto t = out->positions.find(target);
    if (t == out->positions.end()) return CompileStatus::TargetDropped;

    out->start = s->second;
    out->target = t->second;
    out->field.set(out->start.row, out->start.col, Token::Start);
    out->field.set(out->target.row, out->target.col, Token::Target);
    return CompileStatus::Ok;
}

std::string render_field(const CompiledField& cf, const std::vector<GridPos>* solution) {
    const SpatialField& f = cf.field;
    std::set<GridPos> sol;
    if (solution) sol.insert(solution->begin(), solution->end());
    std::string out;
    out.reserve(static_cast<size_t>((f.width() + 1) * f.height()));
    for (int r = 0; r < f.height(); ++r) {
        for (int c = 0; c < f.width(); ++c) {
            char ch = '#';
            switch (f.at(r, c)) {
                case Token::Wall: ch = '#'; break;
                case Token::Path: ch = '.'; break;
                case Token::Start: ch = 'S'; break;
                case Token::Target: ch = 'T'; break;
                case Token::Solution: ch = '*'; break;
                case Token::Error: ch = 'x'; break;
            }
            if (ch == '.') {
                const std::string* id = cf.node_at({r, c});
                if (id && !id->empty()) ch = (*id)[0];
                else if (sol.count({r, c})) ch = '*';
            }
            out.push_back(ch);
        }
        out.push_back('\n');
    }
    return out;
}

} // namespace navmaze
