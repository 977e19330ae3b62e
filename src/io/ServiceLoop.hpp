/**
 * @file ServiceLoop.hpp
 * @brief Laço do serviço: conexão, reconexão limitada e despacho de linhas.
 */
#pragma once
#include <functional>
#include <string>
#include "Transport.hpp"
#include "core/Config.hpp"
#include "core/Orchestrator.hpp"

namespace navmaze {
namespace io {

/**
 * @brief Liga um `Transport` a um `Orchestrator`.
 *
 * Linhas que começam por '{' são mensagens do protocolo; as demais são
 * comandos do operador (`STATUS`, `RESET`). O estado do orquestrador
 * (grafos, telas, planos) sobrevive às reconexões; só o transporte é
 * derrubado.
 */
class ServiceLoop {
public:
    using Sleep = std::function<void(int ms)>;

    /**
     * @param orch orquestrador (não-possuído)
     * @param transport transporte (não-possuído)
     * @param cfg política de reconexão
     * @param sleep espera entre tentativas (vazio = `std::this_thread::sleep_for`)
     */
    ServiceLoop(Orchestrator& orch, Transport& transport, const ServiceConfig& cfg, Sleep sleep = Sleep());

    /**
     * @brief Roda até o fim da entrada ou até esgotar as reconexões.
     * @return 0 em término normal; 1 quando as tentativas de conexão se esgotam
     */
    int run();

    /**
     * @brief Trata uma linha recebida.
     * @return resposta ao comando do operador (vazia para mensagens do protocolo)
     */
    std::string process_line(const std::string& line);

    /** @brief Pede o fim do laço após a linha corrente. */
    void stop() { stop_ = true; }

    /** @brief Conexões bem-sucedidas desde a criação. */
    int connections() const { return connections_; }

private:
    std::string operator_command(const std::string& cmd);

    Orchestrator& orch_;
    Transport& transport_;
    int reconnect_delay_ms_;
    int max_reconnects_;
    Sleep sleep_;
    bool stop_{false};
    int connections_{0};
};

} // namespace io
} // namespace navmaze
