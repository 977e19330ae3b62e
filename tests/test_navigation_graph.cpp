#include "unity.h"
#include "core/NavigationGraph.hpp"
#include <string>
#include <vector>

using namespace navmaze;

void setUp() {}
void tearDown() {}

static GraphNode make_node(const std::string& id, std::vector<std::string> edges = {}) {
    GraphNode n;
    n.id = id;
    n.label = id;
    n.edges = std::move(edges);
    return n;
}

void test_add_node_keeps_first_and_order() {
    NavigationGraph g("com.test");
    TEST_ASSERT_TRUE(g.add_node(make_node("home")));
    TEST_ASSERT_TRUE(g.add_node(make_node("transfers")));
    GraphNode dup = make_node("home");
    dup.label = "Outro";
    TEST_ASSERT_FALSE(g.add_node(dup));
    TEST_ASSERT_EQUAL_INT(2, (int)g.node_count());
    TEST_ASSERT_EQUAL_STRING("home", g.node("home")->label.c_str());
    TEST_ASSERT_EQUAL_STRING("home", g.node_order()[0].c_str());
    TEST_ASSERT_EQUAL_STRING("transfers", g.node_order()[1].c_str());
    TEST_ASSERT_NULL(g.node("missing"));
}

void test_neighbors_merge_edges_and_lists_once() {
    NavigationGraph g;
    g.add_node(make_node("a", {"b", "c"}));
    g.add_node(make_node("b"));
    g.add_node(make_node("c"));
    g.add_node(make_node("d"));
    GraphEdge ab; ab.from = "a"; ab.to = "b";
    g.add_edge(ab);
    GraphEdge da; da.from = "d"; da.to = "a"; da.bidirectional = true;
    g.add_edge(da);

    auto nb = g.neighbors("a");
    TEST_ASSERT_EQUAL_INT(3, (int)nb.size());
    TEST_ASSERT_EQUAL_STRING("b", nb[0].c_str());
    TEST_ASSERT_EQUAL_STRING("d", nb[1].c_str());
    TEST_ASSERT_EQUAL_STRING("c", nb[2].c_str());

    // aresta simples não vale no sentido contrário
    TEST_ASSERT_EQUAL_INT(0, (int)g.neighbors("b").size());
    auto nd = g.neighbors("d");
    TEST_ASSERT_EQUAL_INT(1, (int)nd.size());
    TEST_ASSERT_EQUAL_STRING("a", nd[0].c_str());
}

void test_edge_lookup_honors_bidirectional() {
    NavigationGraph g;
    g.add_node(make_node("a"));
    g.add_node(make_node("b"));
    GraphEdge e; e.from = "a"; e.to = "b"; e.bidirectional = true;
    e.action.type = "tap";
    e.action.selector["id"] = "btn_b";
    g.add_edge(e);
    TEST_ASSERT_NOT_NULL(g.edge("a", "b"));
    TEST_ASSERT_NOT_NULL(g.edge("b", "a"));
    TEST_ASSERT_EQUAL_STRING("btn_b", g.edge("b", "a")->action.selector.at("id").c_str());
    TEST_ASSERT_NULL(g.edge("a", "c"));
}

void test_bfs_order_skips_unknown_neighbors() {
    NavigationGraph g;
    g.add_node(make_node("home", {"transfers", "ghost", "pockets"}));
    g.add_node(make_node("transfers", {"send"}));
    g.add_node(make_node("pockets"));
    g.add_node(make_node("send"));
    g.add_node(make_node("island"));
    auto order = g.bfs_order("home");
    TEST_ASSERT_EQUAL_INT(4, (int)order.size());
    TEST_ASSERT_EQUAL_STRING("home", order[0].c_str());
    TEST_ASSERT_EQUAL_STRING("transfers", order[1].c_str());
    TEST_ASSERT_EQUAL_STRING("pockets", order[2].c_str());
    TEST_ASSERT_EQUAL_STRING("send", order[3].c_str());
    TEST_ASSERT_EQUAL_INT(0, (int)g.bfs_order("ghost").size());
}

void test_shortest_path_in_hops() {
    NavigationGraph g;
    g.add_node(make_node("home", {"transfers", "pockets"}));
    g.add_node(make_node("transfers", {"send", "home"}));
    g.add_node(make_node("pockets"));
    g.add_node(make_node("send", {"confirm"}));
    g.add_node(make_node("confirm"));
    auto p = g.shortest_path("home", "confirm");
    TEST_ASSERT_TRUE(p.has_value());
    TEST_ASSERT_EQUAL_INT(4, (int)p->size());
    TEST_ASSERT_EQUAL_STRING("home", p->front().c_str());
    TEST_ASSERT_EQUAL_STRING("transfers", (*p)[1].c_str());
    TEST_ASSERT_EQUAL_STRING("send", (*p)[2].c_str());
    TEST_ASSERT_EQUAL_STRING("confirm", p->back().c_str());

    auto self = g.shortest_path("send", "send");
    TEST_ASSERT_TRUE(self.has_value());
    TEST_ASSERT_EQUAL_INT(1, (int)self->size());

    TEST_ASSERT_FALSE(g.shortest_path("pockets", "home").has_value());
    TEST_ASSERT_FALSE(g.shortest_path("home", "ghost").has_value());
}

int main(int argc, char** argv) {
    UNITY_BEGIN();
    RUN_TEST(test_add_node_keeps_first_and_order);
    RUN_TEST(test_neighbors_merge_edges_and_lists_once);
    RUN_TEST(test_edge_lookup_honors_bidirectional);
    RUN_TEST(test_bfs_order_skips_unknown_neighbors);
    RUN_TEST(test_shortest_path_in_hops);
    return UNITY_END();
}
