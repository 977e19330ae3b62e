/**
 * @file NavigationGraph.hpp
 * @brief Grafo de navegação (telas e transições) descoberto para um aplicativo.
 */
#pragma once
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace navmaze {

/** @brief Seletor de elemento de UI: atributo (id/text/content_desc/class) -> valor. */
using Selector = std::map<std::string, std::string>;

/** @brief Elemento relevante capturado no snapshot de acessibilidade de uma tela. */
struct UiElement {
    std::string id;           ///< resource-id
    std::string text;         ///< Texto visível
    std::string content_desc; ///< content-description
    std::string class_name;   ///< Classe do widget
};

/**
 * @brief Como executar uma transição: tipo de ação e seletor do alvo.
 */
struct ActionDescriptor {
    std::string type;   ///< "tap", "fill", ... (vazio = sem ação registrada)
    Selector selector;  ///< Seletor do elemento alvo

    bool empty() const { return type.empty() && selector.empty(); }
};

/**
 * @brief Uma tela do aplicativo.
 */
struct GraphNode {
    std::string id;                       ///< Identificador único
    std::string label;                    ///< Rótulo legível
    std::vector<std::string> edges;       ///< Vizinhos de saída (ordem preservada)
    std::string activity;                 ///< Activity Android (informativo)
    std::vector<UiElement> key_elements;  ///< Snapshot: elementos-chave
    bool dynamic{false};                  ///< Conteúdo varia em tempo de execução
};

/**
 * @brief Transição explícita entre duas telas.
 */
struct GraphEdge {
    std::string from;         ///< Origem
    std::string to;           ///< Destino
    ActionDescriptor action;  ///< Ação registrada (pode ser vazia)
    int weight{1};            ///< Peso
    bool bidirectional{false};///< Também vale no sentido to->from
};

/**
 * @brief Grafo de navegação de um pacote.
 *
 * Substituído por inteiro a cada atualização; imutável depois de montado.
 * A ordem de inserção dos nós é preservada e serve de desempate no layout.
 */
class NavigationGraph {
public:
    explicit NavigationGraph(std::string app = "unknown", std::string version = "1.0.0")
        : app_(std::move(app)), version_(std::move(version)) {}

    /** @brief Pacote do aplicativo. */
    const std::string& app() const { return app_; }
    /** @brief Versão do grafo informada pelo explorador. */
    const std::string& version() const { return version_; }

    /**
     * @brief Insere um nó.
     * @return false se já existe nó com o mesmo id (o existente é mantido)
     */
    bool add_node(GraphNode n);
    /** @brief Acrescenta uma aresta explícita (extremos não são validados aqui). */
    void add_edge(GraphEdge e) { edges_.push_back(std::move(e)); }

    bool has_node(const std::string& id) const { return nodes_.count(id) != 0; }
    /** @brief Nó pelo id, ou nullptr. */
    const GraphNode* node(const std::string& id) const;
    /** @brief Ids na ordem de inserção. */
    const std::vector<std::string>& node_order() const { return order_; }
    const std::vector<GraphEdge>& edges() const { return edges_; }
    size_t node_count() const { return order_.size(); }
    size_t edge_count() const { return edges_.size(); }
    bool empty() const { return order_.empty(); }

    /**
     * @brief Vizinhos alcançáveis a partir de `id`.
     *
     * Arestas explícitas saindo de `id`, arestas bidirecionais chegando em `id`
     * e depois a lista do próprio nó; cada vizinho aparece uma única vez.
     */
    std::vector<std::string> neighbors(const std::string& id) const;

    /** @brief Aresta explícita from->to (ou bidirecional to->from), ou nullptr. */
    const GraphEdge* edge(const std::string& from, const std::string& to) const;

    /** @brief Ordem de visita BFS a partir de `seed`, restrita a nós existentes. */
    std::vector<std::string> bfs_order(const std::string& seed) const;

    /**
     * @brief Caminho mais curto (em saltos) de `start` a `target` sobre o próprio grafo.
     * @return sequência de ids incluindo extremos, ou std::nullopt se inalcançável
     */
    std::optional<std::vector<std::string>> shortest_path(const std::string& start, const std::string& target) const;

private:
    std::string app_;
    std::string version_;
    std::unordered_map<std::string, GraphNode> nodes_;
    std::vector<std::string> order_;
    std::vector<GraphEdge> edges_;
};

} // namespace navmaze
