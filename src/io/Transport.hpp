/**
 * @file Transport.hpp
 * @brief Interface da conexão lógica única com o controlador remoto e o atuador.
 *
 * O transporte entrega e recebe linhas (uma mensagem JSON por linha, sem o
 * '\n' final). A implementação concreta é escolhida pelo serviço a partir de
 * `NAVMAZE_INPUT`/`NAVMAZE_OUTPUT`:
 * - `StreamTransport`: streams já abertos (stdin/stdout), uma única conexão;
 * - `FifoTransport`: caminhos nomeados, reabertos a cada reconexão.
 *
 * Thread-safety: não é thread-safe; o laço do serviço é o único usuário.
 *
 * @since 0.1
 */
#pragma once
#include <cstdio>
#include <string>

namespace navmaze {
namespace io {

/**
 * @brief Conexão baseada em linhas.
 */
class Transport {
public:
    virtual ~Transport() = default;

    /**
     * @brief Abre (ou reabre) a conexão.
     * @return false se não foi possível conectar agora
     */
    virtual bool connect() = 0;

    /** @brief true entre um `connect()` bem-sucedido e a desconexão. */
    virtual bool connected() const = 0;

    /**
     * @brief Bloqueia até a próxima linha.
     * @param line recebe a linha sem '\n' (e sem '\r' final)
     * @return false em fim de stream ou erro (conexão perdida)
     */
    virtual bool receive(std::string* line) = 0;

    /**
     * @brief Envia uma linha; o '\n' é acrescentado aqui.
     * @return false se a conexão caiu
     */
    virtual bool send(const std::string& line) = 0;

    /** @brief Fecha a conexão; idempotente. */
    virtual void close() = 0;

    /** @brief false quando uma nova conexão após a queda não faz sentido. */
    virtual bool reconnectable() const { return true; }
};

/**
 * @brief Transporte sobre dois `FILE*` já abertos (não-possuídos).
 *
 * Depois que a entrada chega ao fim, `connect()` falha e `reconnectable()`
 * passa a false: stdin fechado não volta.
 */
class StreamTransport : public Transport {
public:
    StreamTransport(std::FILE* in = stdin, std::FILE* out = stdout) : in_(in), out_(out) {}

    bool connect() override;
    bool connected() const override { return connected_; }
    bool receive(std::string* line) override;
    bool send(const std::string& line) override;
    void close() override { connected_ = false; }
    bool reconnectable() const override { return !eof_; }

private:
    std::FILE* in_;
    std::FILE* out_;
    bool connected_{false};
    bool eof_{false};
};

/**
 * @brief Transporte sobre caminhos nomeados (FIFOs ou arquivos).
 *
 * `connect()` abre a entrada para leitura e a saída em modo append; em FIFOs
 * a abertura bloqueia até o outro lado aparecer. Um arquivo comum é lido uma
 * única vez: depois do fim, `connect()` falha e `reconnectable()` passa a false.
 */
class FifoTransport : public Transport {
public:
    FifoTransport(std::string in_path, std::string out_path);
    ~FifoTransport() override;

    FifoTransport(const FifoTransport&) = delete;
    FifoTransport& operator=(const FifoTransport&) = delete;

    bool connect() override;
    bool connected() const override { return in_ != nullptr && out_ != nullptr; }
    bool receive(std::string* line) override;
    bool send(const std::string& line) override;
    void close() override;
    bool reconnectable() const override { return !eof_; }

private:
    std::string in_path_;
    std::string out_path_;
    std::FILE* in_{nullptr};
    std::FILE* out_{nullptr};
    bool fifo_{false};
    bool eof_{false};
};

/**
 * @brief Lê uma linha de `f` (sem '\n' nem '\r' final).
 * @return false em EOF sem nenhum caractere lido, ou erro
 */
bool read_line(std::FILE* f, std::string* line);

} // namespace io
} // namespace navmaze
