/**
 * @file ServiceLoop.cpp
 * @brief Implementação do laço de serviço com reconexão limitada.
 */
#include "ServiceLoop.hpp"
#include "core/Log.hpp"
#include <cctype>
#include <chrono>
#include <cstdio>
#include <thread>
#include <utility>

namespace navmaze {
namespace io {

ServiceLoop::ServiceLoop(Orchestrator& orch, Transport& transport, const ServiceConfig& cfg, Sleep sleep)
    : orch_(orch), transport_(transport),
      reconnect_delay_ms_(cfg.reconnect_delay_ms), max_reconnects_(cfg.max_reconnects),
      sleep_(std::move(sleep)) {
    if (!sleep_) {
        sleep_ = [](int ms) { std::this_thread::sleep_for(std::chrono::milliseconds(ms)); };
    }
}

static std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

std::string ServiceLoop::operator_command(const std::string& cmd) {
    if (cmd == "RESET" || cmd == "R") {
        const bool ok = orch_.reset_store();
        return std::string("OK RESET ") + (ok ? "done" : "fail");
    }
    if (cmd == "STATUS") return orch_.status_line();
    return "ERR cmd";
}

std::string ServiceLoop::process_line(const std::string& line) {
    const std::string t = trim(line);
    if (t.empty()) return std::string();
    if (t[0] == '{') {
        orch_.handle_line(t);
        return std::string();
    }
    const std::string reply = operator_command(t);
    std::fprintf(log_out(), "%s\n", reply.c_str());
    return reply;
}

int ServiceLoop::run() {
    int failures = 0;
    while (!stop_) {
        if (!transport_.connect()) {
            if (!transport_.reconnectable()) {
                std::fprintf(log_out(), "LOOP: entrada encerrada\n");
                return 0;
            }
            ++failures;
            if (failures > max_reconnects_) {
                std::fprintf(stderr, "LOOP: %d tentativas de conexao falharam, desistindo\n", failures);
                return 1;
            }
            std::fprintf(stderr, "LOOP: conexao falhou (%d/%d), nova tentativa em %d ms\n",
                         failures, max_reconnects_, reconnect_delay_ms_);
            sleep_(reconnect_delay_ms_);
            continue;
        }
        failures = 0;
        ++connections_;
        std::fprintf(log_out(), "LOOP: conectado (#%d)\n", connections_);
        orch_.on_connect();

        std::string line;
        while (!stop_ && transport_.receive(&line)) {
            process_line(line);
            orch_.tick();
        }
        transport_.close();
        if (stop_) break;
        std::fprintf(log_out(), "LOOP: conexao encerrada (planos ativos=%zu)\n", orch_.monitor().active());
    }
    return 0;
}

} // namespace io
} // namespace navmaze
