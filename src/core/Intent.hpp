/**
 * @file Intent.hpp
 * @brief Intenção do usuário já estruturada (nome + parâmetros).
 */
#pragma once
#include <functional>
#include <map>
#include <string>

namespace navmaze {

/**
 * @brief Intenção extraída de um pedido do usuário.
 *
 * Parâmetros são guardados como texto; valores monetários ficam em dígitos
 * sem separador (ex.: "50000").
 */
struct Intent {
    std::string name;                          ///< Ex.: "send_money"
    double confidence{0.0};                    ///< 0.0 .. 1.0
    std::map<std::string, std::string> params; ///< amount, recipient, source, service...
    std::string raw_text;                      ///< Texto original (quando houver)
    std::string app;                           ///< Pacote alvo

    /** @brief true se o parâmetro existe e não é vazio. */
    bool has(const std::string& key) const {
        auto it = params.find(key);
        return it != params.end() && !it->second.empty();
    }
    /** @brief Valor do parâmetro ou `def`. */
    std::string param(const std::string& key, const std::string& def = std::string()) const {
        auto it = params.find(key);
        return it == params.end() ? def : it->second;
    }
};

/** @brief Capacidade texto -> intenção; a extração por regras e um modelo externo cumprem o mesmo contrato. */
using IntentExtractorFn = std::function<Intent(const std::string& text)>;

} // namespace navmaze
