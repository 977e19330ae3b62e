/**
 * @file PlanAssembler.hpp
 * @brief Montagem do plano de execução: checkpoint a checkpoint, compila o
 *        campo, resolve o caminho e converte cada salto em passos de UI.
 */
#pragma once
#include <string>
#include <vector>
#include "IntentCatalog.hpp"
#include "NavigationGraph.hpp"
#include "PathSolver.hpp"
#include "Plan.hpp"
#include "SpatialCompiler.hpp"

namespace navmaze {

/**
 * @brief Monta `ExecutionPlan` sobre um grafo e um catálogo.
 *
 * Guarda referências: grafo e catálogo precisam viver mais que o montador.
 */
class PlanAssembler {
public:
    PlanAssembler(const NavigationGraph& graph, const IntentCatalog& catalog, LayoutParams layout = {})
        : graph_(graph), catalog_(catalog), layout_(layout) {}

    /**
     * @brief Monta o plano para uma sequência de checkpoints já resolvida.
     *
     * Para cada par consecutivo distinto:
     * 1. compila o campo (extremo ausente do grafo: salto descartado);
     * 2. consulta o solver; sem solver, sem caminho utilizável ou com extremo
     *    fora do campo, faz BFS direto no grafo;
     * 3. sem caminho, o salto é descartado e registrado em `hops`;
     * 4. converte cada par de telas em passo e, ao chegar ao checkpoint,
     *    acrescenta os passos de parâmetros registrados para ele.
     *
     * @param checkpoints sequência de telas a visitar
     * @param intent intenção atendida
     * @param solver solver de campo (pode ser vazio)
     */
    ExecutionPlan assemble(const std::vector<std::string>& checkpoints, const Intent& intent,
                           const SolverFn& solver = SolverFn()) const;

    /** @brief Resolve os checkpoints a partir de `current_screen` e monta o plano. */
    ExecutionPlan plan(const Intent& intent, const std::string& current_screen,
                       const SolverFn& solver = SolverFn()) const;

    /** @brief Passo de navegação para a transição `from` -> `to`. */
    ActionStep build_action_step(int index, const std::string& from, const std::string& to) const;

    /** @brief Passos de parâmetros do checkpoint `screen` (numerados a partir de `start_index`). */
    std::vector<ActionStep> build_param_steps(int start_index, const std::string& screen, const Intent& intent) const;

private:
    const NavigationGraph& graph_;
    const IntentCatalog& catalog_;
    LayoutParams layout_;
};

/** @brief Resumo legível (em espanhol) da intenção. */
std::string build_summary(const Intent& intent);

/** @brief "50000" -> "50,000"; texto que não é número inteiro volta como está. */
std::string format_amount(const std::string& digits);

} // namespace navmaze
