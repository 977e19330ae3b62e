/**
 * @file Plan.hpp
 * @brief Passos de ação e plano de execução entregue ao atuador.
 */
#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "Config.hpp"
#include "Intent.hpp"
#include "NavigationGraph.hpp"

namespace navmaze {

/** @brief Ação de UI executada pelo atuador. */
enum class ActionKind : uint8_t { Tap, Fill, Swipe, Scroll, Back, Wait };

/** @brief Nome da ação no protocolo ("tap", "fill", ...). */
const char* to_string(ActionKind a);

/**
 * @brief Converte o nome do protocolo em `ActionKind`.
 * @return false se o nome não é conhecido (`out` não é alterado)
 */
bool parse_action(const std::string& s, ActionKind* out);

/**
 * @brief Um passo executável; imutável depois de entrar no plano.
 */
struct ActionStep {
    int index{0};                         ///< Posição no plano (0..n-1)
    ActionKind action{ActionKind::Tap};   ///< Tipo de ação
    Selector selector;                    ///< Como achar o elemento
    std::string value;                    ///< Conteúdo para `Fill`
    std::string expected_screen;          ///< Tela esperada após o passo
    std::string description;              ///< Texto legível
    int timeout_ms{CFG_STEP_TIMEOUT_MS};  ///< Tempo máximo do passo
};

/** @brief Como um salto entre checkpoints foi resolvido. */
enum class HopOutcome : uint8_t {
    Oracle,        ///< Caminho do solver sobre o campo
    GraphFallback, ///< BFS direto no grafo
    CompileFailed, ///< Extremo ausente do grafo; salto descartado
    Unreachable    ///< Nenhum caminho; salto descartado
};

const char* to_string(HopOutcome o);

/** @brief Relatório de um salto checkpoint -> checkpoint. */
struct HopReport {
    std::string from;                 ///< Checkpoint de origem
    std::string to;                   ///< Checkpoint de destino
    HopOutcome outcome{HopOutcome::Unreachable};
    std::vector<std::string> nodes;   ///< Telas percorridas (inclui extremos)
    int steps{0};                     ///< Passos gerados (navegação + parâmetros)
    std::vector<std::string> dropped; ///< Nós que não couberam no campo
};

/**
 * @brief Plano completo para uma intenção.
 */
struct ExecutionPlan {
    Intent intent;                        ///< Intenção atendida
    std::vector<ActionStep> steps;        ///< Passos em ordem
    std::vector<std::string> checkpoints; ///< Checkpoints que geraram o plano
    std::string summary;                  ///< Resumo legível
    bool requires_confirmation{false};    ///< Intenção sensível
    int estimated_time_ms{0};             ///< Custo fixo por passo x passos
    std::vector<HopReport> hops;          ///< Um relatório por salto tentado

    /** @brief Saltos que produziram caminho. */
    int resolved_hops() const {
        int n = 0;
        for (const HopReport& h : hops)
            if (h.outcome == HopOutcome::Oracle || h.outcome == HopOutcome::GraphFallback) ++n;
        return n;
    }
};

} // namespace navmaze
