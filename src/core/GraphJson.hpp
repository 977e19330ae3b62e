/**
 * @file GraphJson.hpp
 * @brief Conversão entre o JSON do explorador e `NavigationGraph`.
 *
 * Formato aceito:
 * {
 *   "app": "...", "version": "...",
 *   "nodes": { "<id>": {"label", "edges": [...], "activity",
 *                      "accessibility_snapshot": {"key_elements": [{"id","text","content_desc","class"}]},
 *                      "dynamic"} },
 *   "edges": [ {"from","to","action": {"type","selector": {...}},"weight","bidirectional"} ]
 * }
 */
#pragma once
#include <string>
#include <vector>
#include <json/json.h>
#include "NavigationGraph.hpp"

namespace navmaze {

/**
 * @brief Ids de `graph.nodes` na ordem de inserção.
 *
 * Usa `node_order` (gravado por `graph_to_json`) quando presente; os demais
 * nós seguem a posição em que aparecem no texto JSON lido. Objetos montados
 * em memória não têm posição e ficam em ordem alfabética.
 */
std::vector<std::string> node_ids_in_order(const Json::Value& graph);

/**
 * @brief Monta um grafo a partir do JSON.
 *
 * Os nós entram na ordem de `node_ids_in_order`, que é a semente e o
 * desempate do layout. `nodes` precisa ser objeto e toda aresta precisa de `from`/`to` string; caso
 * contrário o grafo inteiro é rejeitado. Campos opcionais com tipo errado são
 * ignorados.
 *
 * @param json objeto do grafo
 * @param app pacote a usar quando o JSON não traz `app` (vazio = "unknown")
 * @param out grafo de saída (só alterado em caso de sucesso)
 * @param error motivo da rejeição (opcional)
 * @return true se o grafo foi montado
 */
bool load_graph(const Json::Value& json, const std::string& app, NavigationGraph* out, std::string* error = nullptr);

/** @brief Serializa o grafo no mesmo formato aceito por `load_graph`. */
Json::Value graph_to_json(const NavigationGraph& g);

/** @brief Lê um seletor {atributo: string}; valores não-string são ignorados. */
Selector selector_from_json(const Json::Value& json);

/** @brief Seletor como objeto JSON. */
Json::Value selector_to_json(const Selector& s);

} // namespace navmaze
