#include "unity.h"
#include "core/PathDecoder.hpp"
#include "core/PathSolver.hpp"
#include "core/SpatialCompiler.hpp"
#include <map>
#include <string>
#include <vector>

using namespace navmaze;

void setUp() {}
void tearDown() {}

static std::map<std::string, GridPos> two_nodes() {
    return {{"a", GridPos{1, 1}}, {"b", GridPos{1, 4}}};
}

void test_corridor_cells_are_skipped() {
    auto ids = decode_path({{1, 1}, {1, 2}, {1, 3}, {1, 4}}, two_nodes());
    TEST_ASSERT_EQUAL_INT(2, (int)ids.size());
    TEST_ASSERT_EQUAL_STRING("a", ids[0].c_str());
    TEST_ASSERT_EQUAL_STRING("b", ids[1].c_str());
}

void test_consecutive_duplicates_collapse() {
    auto ids = decode_path({{1, 1}, {1, 1}, {1, 2}, {1, 1}}, two_nodes());
    TEST_ASSERT_EQUAL_INT(1, (int)ids.size());
    TEST_ASSERT_EQUAL_STRING("a", ids[0].c_str());

    // volta ao mesmo nó depois de outro é mantida
    auto back = decode_path({{1, 1}, {1, 4}, {1, 3}, {1, 1}}, two_nodes());
    TEST_ASSERT_EQUAL_INT(3, (int)back.size());
    TEST_ASSERT_EQUAL_STRING("a", back[2].c_str());
}

void test_no_node_cells_gives_empty() {
    TEST_ASSERT_EQUAL_INT(0, (int)decode_path({{0, 0}, {0, 1}}, two_nodes()).size());
    TEST_ASSERT_EQUAL_INT(0, (int)decode_path({}, two_nodes()).size());
}

void test_decoded_solver_path_spans_endpoints() {
    NavigationGraph g;
    const char* ids[] = {"home", "transfers", "send", "confirm"};
    for (int i = 0; i < 4; ++i) {
        GraphNode n;
        n.id = ids[i];
        n.label = ids[i];
        if (i < 3) n.edges.push_back(ids[i + 1]);
        g.add_node(n);
    }
    CompiledField cf;
    TEST_ASSERT_EQUAL_INT((int)CompileStatus::Ok, (int)compile(g, "home", "confirm", &cf));
    SolveResult r = bfs_solve(cf.flat(), cf.field.width(), cf.field.height());
    TEST_ASSERT_TRUE(r.success);
    auto nodes = decode_path(r.path, cf.positions);
    TEST_ASSERT_TRUE(nodes.size() >= 2);
    TEST_ASSERT_EQUAL_STRING("home", nodes.front().c_str());
    TEST_ASSERT_EQUAL_STRING("confirm", nodes.back().c_str());
    for (size_t i = 1; i < nodes.size(); ++i) TEST_ASSERT_TRUE(nodes[i] != nodes[i - 1]);
}

int main(int argc, char** argv) {
    UNITY_BEGIN();
    RUN_TEST(test_corridor_cells_are_skipped);
    RUN_TEST(test_consecutive_duplicates_collapse);
    RUN_TEST(test_no_node_cells_gives_empty);
    RUN_TEST(test_decoded_solver_path_spans_endpoints);
    return UNITY_END();
}
