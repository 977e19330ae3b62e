/**
 * @file tests/test_graph_json.cpp
 * @brief Leitura e escrita do grafo no formato JSON do explorador.
 */
#include "unity.h"
#include "core/GraphJson.hpp"
#include "core/Messages.hpp"
#include "core/SpatialCompiler.hpp"
#include <string>

using namespace navmaze;

void setUp() {}
void tearDown() {}

static Json::Value parse(const std::string& text) {
    Json::Value v;
    TEST_ASSERT_TRUE_MESSAGE(parse_message(text, &v), "fixture JSON should parse");
    return v;
}

static const char* kBankGraph = R"({
  "app": "com.bank",
  "version": "2.1.0",
  "nodes": {
    "home": {"label": "Inicio", "edges": ["transfers"], "activity": ".MainActivity"},
    "transfers": {"label": "Transferir", "edges": ["send"],
                  "accessibility_snapshot": {"key_elements": [
                      {"id": "btn_send", "text": "Enviar plata", "class": "android.widget.Button"}]}},
    "send": {"dynamic": true}
  },
  "edges": [
    {"from": "home", "to": "transfers", "action": {"type": "tap", "selector": {"text": "Transferir", "index": 3}},
     "weight": 2, "bidirectional": true}
  ]
})";

void test_load_full_graph() {
    NavigationGraph g;
    std::string err;
    TEST_ASSERT_TRUE(load_graph(parse(kBankGraph), "", &g, &err));
    TEST_ASSERT_EQUAL_STRING("com.bank", g.app().c_str());
    TEST_ASSERT_EQUAL_STRING("2.1.0", g.version().c_str());
    TEST_ASSERT_EQUAL_INT(3, (int)g.node_count());
    TEST_ASSERT_EQUAL_INT(1, (int)g.edge_count());

    const GraphNode* home = g.node("home");
    TEST_ASSERT_NOT_NULL(home);
    TEST_ASSERT_EQUAL_STRING("Inicio", home->label.c_str());
    TEST_ASSERT_EQUAL_STRING(".MainActivity", home->activity.c_str());

    const GraphNode* send = g.node("send");
    TEST_ASSERT_EQUAL_STRING("send", send->label.c_str());
    TEST_ASSERT_TRUE(send->dynamic);

    const GraphNode* tr = g.node("transfers");
    TEST_ASSERT_EQUAL_INT(1, (int)tr->key_elements.size());
    TEST_ASSERT_EQUAL_STRING("btn_send", tr->key_elements[0].id.c_str());
    TEST_ASSERT_EQUAL_STRING("Enviar plata", tr->key_elements[0].text.c_str());
    TEST_ASSERT_EQUAL_STRING("android.widget.Button", tr->key_elements[0].class_name.c_str());

    const GraphEdge& e = g.edges()[0];
    TEST_ASSERT_EQUAL_STRING("tap", e.action.type.c_str());
    TEST_ASSERT_EQUAL_INT(2, e.weight);
    TEST_ASSERT_TRUE(e.bidirectional);
    // valores não-string no seletor são ignorados
    TEST_ASSERT_EQUAL_INT(1, (int)e.action.selector.size());
    TEST_ASSERT_EQUAL_STRING("Transferir", e.action.selector.at("text").c_str());
}

void test_explicit_app_wins_and_defaults() {
    NavigationGraph g;
    TEST_ASSERT_TRUE(load_graph(parse(R"({"nodes": {"home": {}}})"), "com.other", &g));
    TEST_ASSERT_EQUAL_STRING("com.other", g.app().c_str());
    TEST_ASSERT_EQUAL_STRING("1.0.0", g.version().c_str());
    TEST_ASSERT_EQUAL_INT(0, (int)g.edge_count());

    NavigationGraph anon;
    TEST_ASSERT_TRUE(load_graph(parse(R"({"nodes": {}})"), "", &anon));
    TEST_ASSERT_EQUAL_STRING("unknown", anon.app().c_str());
    TEST_ASSERT_TRUE(anon.empty());
}

void test_malformed_graph_rejected_and_output_untouched() {
    NavigationGraph g("com.keep");
    GraphNode n; n.id = "old"; n.label = "old";
    g.add_node(n);

    std::string err;
    TEST_ASSERT_FALSE(load_graph(parse(R"({"nodes": []})"), "", &g, &err));
    TEST_ASSERT_FALSE(err.empty());
    TEST_ASSERT_FALSE(load_graph(parse(R"({"nodes": {"a": {}}, "edges": [{"from": "a"}]})"), "", &g, &err));
    TEST_ASSERT_FALSE(load_graph(parse(R"({"nodes": {"a": {}}, "edges": {"from": "a", "to": "a"}})"), "", &g, &err));
    TEST_ASSERT_FALSE(load_graph(Json::Value("text"), "", &g, &err));

    TEST_ASSERT_EQUAL_STRING("com.keep", g.app().c_str());
    TEST_ASSERT_TRUE(g.has_node("old"));
}

void test_write_then_read_keeps_structure() {
    NavigationGraph g;
    TEST_ASSERT_TRUE(load_graph(parse(kBankGraph), "", &g));
    NavigationGraph back;
    TEST_ASSERT_TRUE(load_graph(graph_to_json(g), "", &back));
    TEST_ASSERT_EQUAL_STRING(g.app().c_str(), back.app().c_str());
    TEST_ASSERT_EQUAL_INT((int)g.node_count(), (int)back.node_count());
    TEST_ASSERT_EQUAL_INT((int)g.edge_count(), (int)back.edge_count());
    TEST_ASSERT_TRUE(back.node("send")->dynamic);
    TEST_ASSERT_EQUAL_STRING("btn_send", back.node("transfers")->key_elements[0].id.c_str());
    TEST_ASSERT_NOT_NULL(back.edge("transfers", "home"));
}

void test_nodes_keep_the_order_they_were_sent() {
    const char* text = R"({"nodes": {
        "home": {"edges": ["transfers"]},
        "transfers": {"edges": ["send"]},
        "send": {"edges": ["confirm"]},
        "confirm": {},
        "about": {}
    }})";
    NavigationGraph g;
    TEST_ASSERT_TRUE(load_graph(parse(text), "com.bank", &g));
    const std::vector<std::string>& order = g.node_order();
    TEST_ASSERT_EQUAL_INT(5, (int)order.size());
    TEST_ASSERT_EQUAL_STRING("home", order[0].c_str());
    TEST_ASSERT_EQUAL_STRING("transfers", order[1].c_str());
    TEST_ASSERT_EQUAL_STRING("send", order[2].c_str());
    TEST_ASSERT_EQUAL_STRING("confirm", order[3].c_str());
    TEST_ASSERT_EQUAL_STRING("about", order[4].c_str());

    // primeiro nó enviado é a semente do layout; o inalcançado vai por último
    FieldLayout lay = layout_nodes(g);
    TEST_ASSERT_EQUAL_STRING("home", lay.order.front().c_str());
    TEST_ASSERT_EQUAL_STRING("about", lay.order.back().c_str());
    TEST_ASSERT_TRUE((lay.positions.at("home") == GridPos{2, 2}));

    // o texto gravado e relido mantém a mesma ordem
    NavigationGraph back;
    TEST_ASSERT_TRUE(load_graph(parse(write_message(graph_to_json(g))), "", &back));
    TEST_ASSERT_TRUE(back.node_order() == order);
}

void test_node_order_field_wins_over_text_order() {
    const char* text = R"({"node_order": ["send", "ghost", "send", 7], "nodes": {"home": {}, "send": {}, "zeta": {}}})";
    NavigationGraph g;
    TEST_ASSERT_TRUE(load_graph(parse(text), "com.bank", &g));
    TEST_ASSERT_EQUAL_INT(3, (int)g.node_order().size());
    TEST_ASSERT_EQUAL_STRING("send", g.node_order()[0].c_str());
    TEST_ASSERT_EQUAL_STRING("home", g.node_order()[1].c_str());
    TEST_ASSERT_EQUAL_STRING("zeta", g.node_order()[2].c_str());
}

int main(int argc, char** argv) {
    UNITY_BEGIN();
    RUN_TEST(test_load_full_graph);
    RUN_TEST(test_explicit_app_wins_and_defaults);
    RUN_TEST(test_malformed_graph_rejected_and_output_untouched);
    RUN_TEST(test_write_then_read_keeps_structure);
    RUN_TEST(test_nodes_keep_the_order_they_were_sent);
    RUN_TEST(test_node_order_field_wins_over_text_order);
    return UNITY_END();
}
