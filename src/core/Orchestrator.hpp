/**
 * @file Orchestrator.hpp
 * @brief Laço de controle orientado a mensagens: dono de todo o estado por
 *        aplicativo e por request, despacha cada evento ao módulo certo.
 *
 * Eventos são processados um por vez, na ordem de chegada; nenhum handler roda
 * em paralelo com outro, então as tabelas (grafos, telas, planos) não precisam
 * de trava.
 */
#pragma once
#include <functional>
#include <map>
#include <string>
#include <json/json.h>
#include "Config.hpp"
#include "ExecutionMonitor.hpp"
#include "GraphStore.hpp"
#include "Intent.hpp"
#include "IntentCatalog.hpp"
#include "NavigationGraph.hpp"
#include "PathSolver.hpp"

namespace navmaze {

/**
 * @brief Orquestrador do serviço.
 *
 * Mensagens de saída são entregues ao callback `Emit`, uma por chamada.
 */
class Orchestrator {
public:
    using Emit = std::function<void(const Json::Value& msg)>;

    /**
     * @param cfg configuração de execução
     * @param emit destino das mensagens de saída
     * @param catalog catálogo de intenções
     */
    Orchestrator(ServiceConfig cfg, Emit emit, IntentCatalog catalog = IntentCatalog::defaults());

    /** @brief Instala o oráculo de campo (vazio = só o BFS de referência). */
    void set_oracle(SolverFn oracle);
    /** @brief Instala um extrator de intenção externo (vazio = regras embutidas). */
    void set_extractor(IntentExtractorFn fn);
    /** @brief Persistência de grafos (não-possuída; nullptr desliga). */
    void set_store(GraphStore* store) { store_ = store; }

    /** @brief Recarrega os grafos persistidos. @return quantidade carregada */
    size_t restore_graphs();

    /** @brief Chamado a cada (re)conexão: emite `status`. */
    void on_connect();

    /**
     * @brief Processa uma linha JSON.
     * @return false se a mensagem foi descartada (malformada ou falha no handler)
     */
    bool handle_line(const std::string& line);

    /** @brief Processa uma mensagem já decodificada. @return false se descartada */
    bool handle(const Json::Value& msg);

    /** @brief Manutenção periódica: expira planos antigos. */
    void tick(Clock::time_point now = Clock::now());

    /** @brief Grafo do app, ou nullptr. */
    const NavigationGraph* graph(const std::string& app) const;
    /** @brief Tela atual conhecida do app (ou a tela padrão). */
    std::string current_screen(const std::string& app) const;
    const ExecutionMonitor& monitor() const { return monitor_; }
    size_t graph_count() const { return graphs_.size(); }
    size_t pending_count() const { return pending_.size(); }
    bool is_pending(const std::string& request_id) const { return pending_.count(request_id) != 0; }

    /** @brief Linha de status para o operador. */
    std::string status_line() const;
    /** @brief Apaga a persistência de grafos. @return false se não há store ou falhou */
    bool reset_store();

private:
    /** @brief Pedido aguardando o grafo do app. */
    struct PendingRequest {
        std::string app;
        Intent intent;
    };

    bool dispatch(const std::string& type, const Json::Value& msg);
    void on_voice_command(const Json::Value& msg);
    void on_intent_request(const Json::Value& msg);
    void on_graph_update(const Json::Value& msg);
    void on_ui_state(const Json::Value& msg);
    void on_action_result(const Json::Value& msg);
    void on_explore_complete(const Json::Value& msg);
    void on_replan(const Json::Value& msg);
    void on_cancel_plan(const Json::Value& msg);
    void on_solve(const Json::Value& msg);

    /** @brief Resolve + monta + envia o plano, ou pede exploração se falta o grafo. */
    void run_pipeline(const std::string& request_id, const Intent& intent, const std::string& app);
    std::string request_id_of(const Json::Value& msg) const;
    void send(const std::string& type, const std::string& request_id, const Json::Value& payload);

    ServiceConfig cfg_;
    Emit emit_;
    IntentCatalog catalog_;
    SolverFn oracle_;
    SolverFn solver_;
    IntentExtractorFn extractor_;
    bool external_extractor_{false};
    GraphStore* store_{nullptr};

    std::map<std::string, NavigationGraph> graphs_;   ///< app -> grafo
    std::map<std::string, std::string> screens_;      ///< app -> tela atual
    ExecutionMonitor monitor_;                        ///< request -> plano ativo
    std::map<std::string, PendingRequest> pending_;   ///< request -> pedido sem grafo
    mutable unsigned long long seq_{0};               ///< Gerador de requestId
};

} // namespace navmaze
