/**
 * @file ExecutionMonitor.hpp
 * @brief Acompanha planos ativos a partir dos resultados de passo do atuador.
 *
 * Estados por plano: Planned -> Executing -> {Completed | Failed -> Replanning}.
 * Cancelled cobre cancelamento explícito e expiração.
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include "Config.hpp"
#include "Plan.hpp"

namespace navmaze {

enum class PlanState : uint8_t { Planned, Executing, Completed, Failed, Replanning, Cancelled };

const char* to_string(PlanState s);

using Clock = std::chrono::steady_clock;

/** @brief Plano vivo na tabela de planos ativos. */
struct ActivePlan {
    std::string request_id;              ///< Chave da tabela
    std::string app;                     ///< Pacote dono do plano
    ExecutionPlan plan;                  ///< Plano enviado ao atuador
    PlanState state{PlanState::Planned}; ///< Estado atual
    int next_step{0};                    ///< Próximo passo esperado
    std::map<int, int> divergences;      ///< Divergências por índice de passo
    Clock::time_point started{};         ///< Criação (ou última substituição)
};

/** @brief Resultado de um passo reportado pelo atuador (`action_result`). */
struct StepReport {
    std::string request_id;
    int step_index{-1};
    bool success{false};
    std::string new_screen; ///< Tela após o passo (pode faltar)
    std::string error;      ///< Erro bruto do atuador
};

/** @brief O que o relatório causou. */
enum class MonitorEvent : uint8_t {
    Unknown,   ///< Sem plano ativo para o request
    Advanced,  ///< Passo intermediário concluído
    Completed, ///< Último passo concluído; plano removido
    Diverged,  ///< Falha com tela diferente da esperada; plano mantido
    Ignored    ///< Falha sem divergência; nada a sinalizar
};

/** @brief Saída de `ExecutionMonitor::report`. */
struct MonitorOutcome {
    MonitorEvent event{MonitorEvent::Unknown};
    std::string app;             ///< Pacote do plano
    std::string summary;         ///< Resumo do plano
    int step_index{-1};          ///< Passo reportado
    std::string action;          ///< Dica para o chamador: "retry" ou "abort"
    std::string expected_screen; ///< Tela esperada pelo passo
    std::string screen;          ///< Tela reportada
    std::string error;           ///< Erro bruto
};

/**
 * @brief Tabela de planos ativos e transições de estado.
 *
 * A tabela de telas atuais pertence ao chamador e é passada em `report`.
 */
class ExecutionMonitor {
public:
    explicit ExecutionMonitor(int max_step_retries = CFG_MAX_STEP_RETRIES) : max_retries_(max_step_retries) {}

    /**
     * @brief Registra (ou substitui) o plano de `request_id` no estado Planned.
     */
    void start(const std::string& request_id, const std::string& app, ExecutionPlan plan,
               Clock::time_point now = Clock::now());

    /**
     * @brief Aplica um resultado de passo.
     *
     * - sucesso no último índice: Completed, plano removido;
     * - sucesso intermediário: tela do app atualizada, plano segue Executing;
     * - falha com tela reportada diferente da esperada: plano mantido em Replanning
     *   com dica "retry"; quando o passo diverge mais que `max_step_retries` vezes,
     *   vai para Failed com dica "abort";
     * - falha sem divergência: ignorada.
     *
     * @param r relatório do atuador
     * @param screens tabela app -> tela atual (pode ser nullptr)
     */
    MonitorOutcome report(const StepReport& r, std::map<std::string, std::string>* screens);

    /**
     * @brief Remove o plano (cancelamento explícito).
     * @param out recebe o plano removido, já em Cancelled (opcional)
     * @return false se não havia plano
     */
    bool cancel(const std::string& request_id, ActivePlan* out = nullptr);

    /** @brief Remove e devolve os planos mais velhos que `ttl`. */
    std::vector<ActivePlan> expire(std::chrono::milliseconds ttl, Clock::time_point now = Clock::now());

    /** @brief Plano ativo, ou nullptr. */
    const ActivePlan* find(const std::string& request_id) const;
    size_t active() const { return plans_.size(); }
    void clear() { plans_.clear(); }

private:
    int max_retries_;
    std::map<std::string, ActivePlan> plans_;
};

} // namespace navmaze
