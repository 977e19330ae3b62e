#include "unity.h"
#include "core/PathDecoder.hpp"
#include "core/PathSolver.hpp"
#include "core/SpatialCompiler.hpp"
#include <queue>
#include <random>
#include <set>
#include <string>
#include <vector>

using namespace navmaze;

static NavigationGraph gen_graph(int n, int extra_edges, uint32_t seed) {
    std::mt19937 rng(seed);
    NavigationGraph g("com.random");
    std::vector<std::string> ids;
    for (int i = 0; i < n; ++i) ids.push_back("s" + std::to_string(i));
    std::uniform_int_distribution<int> pick(0, n - 1);
    for (int i = 0; i < n; ++i) {
        GraphNode node;
        node.id = ids[i];
        node.label = ids[i];
        // lista de vizinhos curta e aleatória
        const int k = pick(rng) % 3;
        for (int j = 0; j < k; ++j) node.edges.push_back(ids[pick(rng)]);
        g.add_node(node);
    }
    for (int e = 0; e < extra_edges; ++e) {
        GraphEdge edge;
        edge.from = ids[pick(rng)];
        edge.to = ids[pick(rng)];
        edge.bidirectional = (e % 2) == 0;
        g.add_edge(edge);
    }
    return g;
}

// Alcançabilidade por inundação sobre células não-parede
static bool flood_reaches(const SpatialField& f, GridPos from, GridPos to) {
    std::vector<uint8_t> seen(static_cast<size_t>(f.width() * f.height()), 0);
    std::queue<GridPos> q;
    q.push(from);
    seen[static_cast<size_t>(from.row * f.width() + from.col)] = 1;
    const int dr[4] = {-1, 1, 0, 0};
    const int dc[4] = {0, 0, -1, 1};
    while (!q.empty()) {
        GridPos p = q.front(); q.pop();
        if (p == to) return true;
        for (int d = 0; d < 4; ++d) {
            int r = p.row + dr[d], c = p.col + dc[d];
            if (!f.in_bounds(r, c) || f.at(r, c) == Token::Wall) continue;
            size_t j = static_cast<size_t>(r * f.width() + c);
            if (!seen[j]) { seen[j] = 1; q.push({r, c}); }
        }
    }
    return false;
}

void setUp() {}
void tearDown() {}

void test_compile_solve_decode_on_random_graphs() {
    for (int i = 0; i < 40; ++i) {
        const uint32_t seed = 4242u + static_cast<uint32_t>(i);
        std::mt19937 rng(seed ^ 0x9e37u);
        const int n = 2 + static_cast<int>(rng() % 39);
        NavigationGraph g = gen_graph(n, n / 2, seed);
        std::uniform_int_distribution<int> pick(0, n - 1);
        const std::string start = g.node_order()[static_cast<size_t>(pick(rng))];
        const std::string target = g.node_order()[static_cast<size_t>(pick(rng))];

        CompiledField cf;
        const CompileStatus st = compile(g, start, target, &cf);
        TEST_ASSERT_EQUAL_INT_MESSAGE((int)CompileStatus::Ok, (int)st, "all nodes should fit the default field");
        TEST_ASSERT_EQUAL_INT(n, (int)cf.positions.size());
        TEST_ASSERT_EQUAL_INT(0, (int)cf.dropped.size());
        std::set<GridPos> distinct;
        for (const auto& kv : cf.positions) distinct.insert(kv.second);
        TEST_ASSERT_EQUAL_INT(n, (int)distinct.size());

        if (start == target) {
            TEST_ASSERT_EQUAL_INT(0, cf.field.count(Token::Start));
            TEST_ASSERT_EQUAL_INT(1, cf.field.count(Token::Target));
            continue;
        }
        TEST_ASSERT_EQUAL_INT(1, cf.field.count(Token::Start));
        TEST_ASSERT_EQUAL_INT(1, cf.field.count(Token::Target));

        SolveResult r = bfs_solve(cf.flat(), cf.field.width(), cf.field.height());
        TEST_ASSERT_EQUAL_INT(flood_reaches(cf.field, cf.start, cf.target) ? 1 : 0, r.success ? 1 : 0);
        // caminho no grafo implica corredor no campo
        if (g.shortest_path(start, target)) TEST_ASSERT_TRUE(r.success);
        if (!r.success) continue;

        TEST_ASSERT_TRUE(is_usable_path(cf.flat(), cf.field.width(), cf.field.height(), r.path));
        auto nodes = decode_path(r.path, cf.positions);
        TEST_ASSERT_TRUE(nodes.size() >= 2);
        TEST_ASSERT_EQUAL_STRING(start.c_str(), nodes.front().c_str());
        TEST_ASSERT_EQUAL_STRING(target.c_str(), nodes.back().c_str());
        for (size_t k = 1; k < nodes.size(); ++k) TEST_ASSERT_TRUE(nodes[k] != nodes[k - 1]);
    }
}

int main(int argc, char** argv) {
    UNITY_BEGIN();
    RUN_TEST(test_compile_solve_decode_on_random_graphs);
    return UNITY_END();
}
