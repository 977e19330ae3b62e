/**
 * @file tests/test_spatial_compiler.cpp
 * @brief Layout, corredores e marcação do campo compilado.
 *
 * Como executar:
 * - Via CTest: `ctest -R test_spatial_compiler`
 * - Ou executando o binário deste teste diretamente.
 */
#include "unity.h"
#include "core/PathSolver.hpp"
#include "core/SpatialCompiler.hpp"
#include <cstdio>
#include <set>
#include <sstream>
#include <string>
#include <vector>

using namespace navmaze;

void setUp() {}
void tearDown() {}

static void add(NavigationGraph& g, const std::string& id, std::vector<std::string> edges = {}) {
    GraphNode n;
    n.id = id;
    n.label = id;
    n.edges = std::move(edges);
    g.add_node(n);
}

static NavigationGraph chain_graph() {
    NavigationGraph g("com.bank");
    add(g, "home", {"transfers"});
    add(g, "transfers", {"send"});
    add(g, "send", {"confirm"});
    add(g, "confirm", {"success"});
    add(g, "success");
    return g;
}

void test_layout_is_square_grid_inside_border() {
    NavigationGraph g = chain_graph();
    FieldLayout lay = layout_nodes(g);
    TEST_ASSERT_EQUAL_INT(5, (int)lay.positions.size());
    TEST_ASSERT_EQUAL_INT(0, (int)lay.dropped.size());
    // 5 nós: 3 colunas x 2 linhas
    TEST_ASSERT_EQUAL_INT(2, lay.positions["home"].row);
    TEST_ASSERT_EQUAL_INT(2, lay.positions["home"].col);
    TEST_ASSERT_EQUAL_INT(2, lay.positions["transfers"].row);
    TEST_ASSERT_EQUAL_INT(11, lay.positions["transfers"].col);
    TEST_ASSERT_EQUAL_INT(2, lay.positions["send"].row);
    TEST_ASSERT_EQUAL_INT(20, lay.positions["send"].col);
    TEST_ASSERT_EQUAL_INT(16, lay.positions["confirm"].row);
    TEST_ASSERT_EQUAL_INT(2, lay.positions["confirm"].col);
    TEST_ASSERT_EQUAL_INT(16, lay.positions["success"].row);
    TEST_ASSERT_EQUAL_INT(11, lay.positions["success"].col);
}

void test_layout_order_is_bfs_then_unreached() {
    NavigationGraph g;
    add(g, "a", {"c"});
    add(g, "b");
    add(g, "c");
    FieldLayout lay = layout_nodes(g);
    TEST_ASSERT_EQUAL_INT(3, (int)lay.order.size());
    TEST_ASSERT_EQUAL_STRING("a", lay.order[0].c_str());
    TEST_ASSERT_EQUAL_STRING("c", lay.order[1].c_str());
    TEST_ASSERT_EQUAL_STRING("b", lay.order[2].c_str());
}

void test_compile_marks_single_start_and_target() {
    NavigationGraph g = chain_graph();
    CompiledField cf;
    TEST_ASSERT_EQUAL_INT((int)CompileStatus::Ok, (int)compile(g, "home", "success", &cf));
    TEST_ASSERT_EQUAL_INT(1, cf.field.count(Token::Start));
    TEST_ASSERT_EQUAL_INT(1, cf.field.count(Token::Target));
    TEST_ASSERT_EQUAL_INT(kFieldSize, cf.field.width());
    TEST_ASSERT_EQUAL_INT(kFieldSize, cf.field.height());
    TEST_ASSERT_TRUE(cf.start == cf.positions["home"]);
    TEST_ASSERT_TRUE(cf.target == cf.positions["success"]);
    TEST_ASSERT_EQUAL_INT((int)Token::Start, (int)cf.field.at(cf.start.row, cf.start.col));
    for (const auto& kv : cf.positions) {
        TEST_ASSERT_TRUE(cf.field.at(kv.second.row, kv.second.col) != Token::Wall);
        TEST_ASSERT_NOT_NULL(cf.node_at(kv.second));
        TEST_ASSERT_EQUAL_STRING(kv.first.c_str(), cf.node_at(kv.second)->c_str());
    }
    TEST_ASSERT_EQUAL_INT(kFieldSize * kFieldSize, (int)cf.flat().size());
}

void test_same_start_and_target_target_wins() {
    NavigationGraph g = chain_graph();
    CompiledField cf;
    TEST_ASSERT_EQUAL_INT((int)CompileStatus::Ok, (int)compile(g, "send", "send", &cf));
    TEST_ASSERT_EQUAL_INT(0, cf.field.count(Token::Start));
    TEST_ASSERT_EQUAL_INT(1, cf.field.count(Token::Target));
}

void test_corridor_follows_row_then_column() {
    NavigationGraph g;
    add(g, "a", {"b"});
    add(g, "b");
    GraphEdge ghost; ghost.from = "a"; ghost.to = "ghost";
    g.add_edge(ghost);
    CompiledField cf;
    TEST_ASSERT_EQUAL_INT((int)CompileStatus::Ok, (int)compile(g, "a", "b", &cf));
    const GridPos a = cf.positions["a"];
    const GridPos b = cf.positions["b"];
    TEST_ASSERT_EQUAL_INT(a.row, b.row);
    for (int c = a.col; c <= b.col; ++c) {
        TEST_ASSERT_TRUE(cf.field.at(a.row, c) != Token::Wall);
    }
    // só o corredor e os nós ficam abertos
    const int open = kFieldSize * kFieldSize - cf.field.count(Token::Wall);
    TEST_ASSERT_EQUAL_INT(b.col - a.col + 1, open);

    SolveResult r = bfs_solve(cf.flat(), kFieldSize, kFieldSize);
    TEST_ASSERT_TRUE(r.success);
    TEST_ASSERT_EQUAL_INT(b.col - a.col + 1, (int)r.path.size());
}

void test_missing_endpoints_reported_before_marking() {
    NavigationGraph g = chain_graph();
    CompiledField cf;
    TEST_ASSERT_EQUAL_INT((int)CompileStatus::StartMissing, (int)compile(g, "ghost", "home", &cf));
    TEST_ASSERT_EQUAL_INT(5, (int)cf.positions.size());
    TEST_ASSERT_EQUAL_INT(0, cf.field.count(Token::Start));
    TEST_ASSERT_EQUAL_INT((int)CompileStatus::TargetMissing, (int)compile(g, "home", "ghost", &cf));
    TEST_ASSERT_EQUAL_INT(0, cf.field.count(Token::Target));
    TEST_ASSERT_EQUAL_STRING("start_missing", to_string(CompileStatus::StartMissing));
}

void test_overflow_nodes_are_dropped_explicitly() {
    NavigationGraph g;
    for (int i = 0; i < 20; ++i) {
        char id[8];
        std::snprintf(id, sizeof(id), "n%02d", i);
        add(g, id);
    }
    LayoutParams tiny;
    tiny.size = 6;
    tiny.spacing = 4;
    tiny.border = 1;
    FieldLayout lay = layout_nodes(g, tiny);
    TEST_ASSERT_EQUAL_INT(9, (int)lay.positions.size());
    TEST_ASSERT_EQUAL_INT(11, (int)lay.dropped.size());
    std::set<GridPos> cells;
    for (const auto& kv : lay.positions) {
        TEST_ASSERT_TRUE(kv.second.row >= 2 && kv.second.row < 5);
        TEST_ASSERT_TRUE(kv.second.col >= 2 && kv.second.col < 5);
        cells.insert(kv.second);
    }
    TEST_ASSERT_EQUAL_INT(9, (int)cells.size());
    TEST_ASSERT_EQUAL_STRING("n19", lay.dropped.back().c_str());

    CompiledField cf;
    TEST_ASSERT_EQUAL_INT((int)CompileStatus::TargetDropped, (int)compile(g, "n00", "n19", &cf, tiny));
    TEST_ASSERT_EQUAL_INT(11, (int)cf.dropped.size());
    TEST_ASSERT_EQUAL_INT((int)CompileStatus::StartDropped, (int)compile(g, "n19", "n00", &cf, tiny));
}

void test_disconnected_target_has_no_field_path() {
    NavigationGraph g;
    add(g, "a");
    add(g, "b");
    CompiledField cf;
    TEST_ASSERT_EQUAL_INT((int)CompileStatus::Ok, (int)compile(g, "a", "b", &cf));
    TEST_ASSERT_FALSE(bfs_solve(cf.flat(), kFieldSize, kFieldSize).success);
}

void test_render_field_draws_tokens_and_solution() {
    NavigationGraph g = chain_graph();
    CompiledField cf;
    compile(g, "home", "transfers", &cf);
    SolveResult r = bfs_solve(cf.flat(), kFieldSize, kFieldSize);
    TEST_ASSERT_TRUE(r.success);
    const std::string txt = render_field(cf, &r.path);

    std::istringstream is(txt);
    std::string line;
    int rows = 0;
    while (std::getline(is, line)) {
        TEST_ASSERT_EQUAL_INT(kFieldSize, (int)line.size());
        ++rows;
    }
    TEST_ASSERT_EQUAL_INT(kFieldSize, rows);
    const size_t stride = static_cast<size_t>(kFieldSize + 1);
    TEST_ASSERT_EQUAL_INT('S', txt[2 * stride + 2]);
    TEST_ASSERT_EQUAL_INT('*', txt[2 * stride + 3]);
    TEST_ASSERT_EQUAL_INT('T', txt[2 * stride + 11]);
    TEST_ASSERT_EQUAL_INT('s', txt[2 * stride + 20]);
    TEST_ASSERT_EQUAL_INT('#', txt[0]);
}

int main(int argc, char** argv) {
    UNITY_BEGIN();
    RUN_TEST(test_layout_is_square_grid_inside_border);
    RUN_TEST(test_layout_order_is_bfs_then_unreached);
    RUN_TEST(test_compile_marks_single_start_and_target);
    RUN_TEST(test_same_start_and_target_target_wins);
    RUN_TEST(test_corridor_follows_row_then_column);
    RUN_TEST(test_missing_endpoints_reported_before_marking);
    RUN_TEST(test_overflow_nodes_are_dropped_explicitly);
    RUN_TEST(test_disconnected_target_has_no_field_path);
    RUN_TEST(test_render_field_draws_tokens_and_solution);
    return UNITY_END();
}
