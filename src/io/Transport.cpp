/**
 * @file Transport.cpp
 * @brief Implementações de transporte por stream e por caminhos nomeados.
 */
#include "Transport.hpp"
#include "core/Log.hpp"
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <utility>

namespace navmaze {
namespace io {

bool read_line(std::FILE* f, std::string* line) {
    if (!f || !line) return false;
    line->clear();
    int c;
    bool any = false;
    while ((c = std::fgetc(f)) != EOF) {
        any = true;
        if (c == '\n') break;
        line->push_back(static_cast<char>(c));
    }
    if (!any) return false;
    if (!line->empty() && line->back() == '\r') line->pop_back();
    return true;
}

static bool write_line(std::FILE* f, const std::string& line) {
    if (!f) return false;
    if (std::fwrite(line.data(), 1, line.size(), f) != line.size()) return false;
    if (std::fputc('\n', f) == EOF) return false;
    return std::fflush(f) == 0;
}

bool StreamTransport::connect() {
    if (eof_ || !in_ || !out_) return false;
    connected_ = true;
    return true;
}

bool StreamTransport::receive(std::string* line) {
    if (!connected_) return false;
    if (!read_line(in_, line)) {
        eof_ = true;
        connected_ = false;
        return false;
    }
    return true;
}

bool StreamTransport::send(const std::string& line) {
    if (!connected_) return false;
    if (!write_line(out_, line)) {
        std::fprintf(stderr, "TRANSPORT: falha escrevendo na saida\n");
        connected_ = false;
        return false;
    }
    return true;
}

FifoTransport::FifoTransport(std::string in_path, std::string out_path)
    : in_path_(std::move(in_path)), out_path_(std::move(out_path)) {}

FifoTransport::~FifoTransport() { close(); }

bool FifoTransport::connect() {
    close();
    if (eof_) return false;
    std::error_code ec;
    fifo_ = std::filesystem::is_fifo(in_path_, ec);
    in_ = std::fopen(in_path_.c_str(), "r");
    if (!in_) {
        std::fprintf(stderr, "TRANSPORT: nao abriu %s: %s\n", in_path_.c_str(), std::strerror(errno));
        return false;
    }
    out_ = std::fopen(out_path_.c_str(), "a");
    if (!out_) {
        std::fprintf(stderr, "TRANSPORT: nao abriu %s: %s\n", out_path_.c_str(), std::strerror(errno));
        close();
        return false;
    }
    std::fprintf(log_out(), "TRANSPORT: conectado in=%s out=%s\n", in_path_.c_str(), out_path_.c_str());
    return true;
}

bool FifoTransport::receive(std::string* line) {
    if (!connected()) return false;
    if (read_line(in_, line)) return true;
    // FIFO volta quando o escritor reabre; arquivo comum já foi consumido
    if (!fifo_) {
        eof_ = true;
        std::fprintf(log_out(), "TRANSPORT: fim de %s\n", in_path_.c_str());
    }
    return false;
}

bool FifoTransport::send(const std::string& line) {
    if (!connected()) return false;
    if (!write_line(out_, line)) {
        std::fprintf(stderr, "TRANSPORT: falha escrevendo em %s\n", out_path_.c_str());
        return false;
    }
    return true;
}

void FifoTransport::close() {
    if (in_) {
        std::fclose(in_);
        in_ = nullptr;
    }
    if (out_) {
        std::fclose(out_);
        out_ = nullptr;
    }
}

} // namespace io
} // namespace navmaze
