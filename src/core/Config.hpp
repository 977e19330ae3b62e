/**
 * @file Config.hpp
 * @brief Parâmetros de configuração (CFG_*) e configuração de execução do serviço.
 */
#pragma once
#include <string>

// -----------------------------
// Compile-time defaults (override with -DCFG_* or CMake)
/**
 * @name Parâmetros de configuração (CFG_*)
 * @brief Valores padrão ajustáveis em tempo de compilação.
 *
 * - `CFG_FIELD_SIZE`: lado N do campo espacial NxN entregue ao solver.
 * - `CFG_MAX_GRID_SIDE`: maior lado aceito em grids vindos de fora (`solve`).
 * - `CFG_NODE_SPACING`: espaçamento mínimo entre nós no layout.
 * - `CFG_FIELD_BORDER`: margem (células) a partir da borda do campo.
 * - `CFG_STEP_COST_MS`: custo estimado por passo do plano.
 * - `CFG_STEP_TIMEOUT_MS`: timeout de cada passo enviado ao atuador.
 * - `CFG_SOLVER_TIMEOUT_MS`: tempo máximo de espera pelo oráculo.
 * - `CFG_RECONNECT_DELAY_MS`/`CFG_MAX_RECONNECTS`: política de reconexão.
 * - `CFG_PLAN_TTL_MS`: idade máxima de um plano ativo.
 * - `CFG_MAX_STEP_RETRIES`: divergências por passo antes de sugerir abort.
 * - `CFG_EXPLORE_DEPTH`: profundidade pedida em `explore_request`.
 * - `CFG_DEFAULT_APP`/`CFG_DEFAULT_SCREEN`: app e tela assumidos quando ausentes.
 * - `CFG_VERBOSE`: imprime linhas de depuração.
 */
///@{
#ifndef CFG_FIELD_SIZE
#define CFG_FIELD_SIZE 30
#endif
#ifndef CFG_MAX_GRID_SIDE
#define CFG_MAX_GRID_SIDE 1024
#endif
#ifndef CFG_NODE_SPACING
#define CFG_NODE_SPACING 4
#endif
#ifndef CFG_FIELD_BORDER
#define CFG_FIELD_BORDER 1
#endif
#ifndef CFG_STEP_COST_MS
#define CFG_STEP_COST_MS 2000
#endif
#ifndef CFG_STEP_TIMEOUT_MS
#define CFG_STEP_TIMEOUT_MS 5000
#endif
#ifndef CFG_SOLVER_TIMEOUT_MS
#define CFG_SOLVER_TIMEOUT_MS 30000
#endif
#ifndef CFG_RECONNECT_DELAY_MS
#define CFG_RECONNECT_DELAY_MS 5000
#endif
#ifndef CFG_MAX_RECONNECTS
#define CFG_MAX_RECONNECTS 10
#endif
#ifndef CFG_PLAN_TTL_MS
#define CFG_PLAN_TTL_MS 600000
#endif
#ifndef CFG_MAX_STEP_RETRIES
#define CFG_MAX_STEP_RETRIES 2
#endif
#ifndef CFG_EXPLORE_DEPTH
#define CFG_EXPLORE_DEPTH 4
#endif
#ifndef CFG_DEFAULT_APP
#define CFG_DEFAULT_APP "com.bancolombia.app"
#endif
#ifndef CFG_DEFAULT_SCREEN
#define CFG_DEFAULT_SCREEN "home"
#endif
#ifndef CFG_VERBOSE
#define CFG_VERBOSE 0
#endif
///@}

namespace navmaze {

/**
 * @brief Configuração de execução do serviço (padrões CFG_* + variáveis de ambiente).
 */
struct ServiceConfig {
    std::string input_path{"-"};                      ///< Entrada de mensagens ("-" = stdin)
    std::string output_path{"-"};                     ///< Saída de mensagens ("-" = stdout)
    int reconnect_delay_ms{CFG_RECONNECT_DELAY_MS};   ///< Espera entre tentativas de conexão
    int max_reconnects{CFG_MAX_RECONNECTS};           ///< Tentativas consecutivas antes de desistir
    int solver_timeout_ms{CFG_SOLVER_TIMEOUT_MS};     ///< Timeout do oráculo (0 = sem timeout)
    int plan_ttl_ms{CFG_PLAN_TTL_MS};                 ///< Idade máxima de plano ativo (0 = sem expiração)
    int max_step_retries{CFG_MAX_STEP_RETRIES};       ///< Divergências por passo antes de "abort"
    int explore_depth{CFG_EXPLORE_DEPTH};             ///< Profundidade pedida ao explorador
    std::string default_app{CFG_DEFAULT_APP};         ///< App assumido quando a mensagem não traz
    std::string default_screen{CFG_DEFAULT_SCREEN};   ///< Tela assumida sem `ui_state`
    std::string catalog_path{};                       ///< JSON que substitui o catálogo de intents
    std::string store_dir{};                          ///< Diretório do GraphStore (vazio = padrão)
    bool persist_graphs{true};                        ///< Persistir grafos por app
    bool verbose{CFG_VERBOSE != 0};                   ///< Linhas de depuração
};

/**
 * @brief Lê a configuração a partir das variáveis `NAVMAZE_*`.
 *
 * Valores numéricos inválidos são reportados em stderr e o padrão é mantido.
 * @return configuração resultante
 */
ServiceConfig config_from_env();

} // namespace navmaze
