/**
 * @file GraphStore.hpp
 * @brief Persistência dos grafos de navegação por aplicativo (um JSON por pacote).
 */
#pragma once
#include <cstdint>
#include <map>
#include <string>
#include "NavigationGraph.hpp"

namespace navmaze {

/**
 * @brief Estatísticas da persistência.
 */
struct StoreStatus {
    uint32_t saved_count{0}; ///< Grafos persistidos no diretório
    std::string dir;         ///< Diretório em uso (vazio = desabilitado)
};

/**
 * @brief Armazena grafos em `<dir>/<pacote>.json`.
 *
 * O diretório padrão é `$HOME/.navmaze/graphs`; sem `HOME` a persistência
 * fica desabilitada e as operações de escrita retornam false.
 */
class GraphStore {
public:
    /**
     * @param dir diretório explícito (vazio = padrão a partir de `HOME`)
     */
    explicit GraphStore(std::string dir = std::string());

    /** @brief Diretório em uso. */
    const std::string& dir() const { return dir_; }
    bool enabled() const { return !dir_.empty(); }

    /**
     * @brief Grava o grafo, substituindo o anterior do mesmo pacote.
     * @return true em caso de sucesso
     */
    bool save(const NavigationGraph& g);

    /**
     * @brief Carrega o grafo do pacote.
     * @param app pacote
     * @param out grafo de saída
     * @return false se inexistente ou malformado
     */
    bool load(const std::string& app, NavigationGraph* out) const;

    /**
     * @brief Carrega todos os grafos do diretório; arquivos inválidos são ignorados.
     * @return quantidade carregada
     */
    size_t load_all(std::map<std::string, NavigationGraph>* out) const;

    /**
     * @brief Apaga todos os grafos persistidos.
     * @return true em caso de sucesso (ou diretório inexistente)
     */
    bool eraseAll();

    /** @brief Contagem de grafos no diretório. */
    StoreStatus status() const;

    /** @brief Nome de arquivo seguro para o pacote. */
    static std::string file_name(const std::string& app);

private:
    std::string dir_;
};

} // namespace navmaze
