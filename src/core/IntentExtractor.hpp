/**
 * @file IntentExtractor.hpp
 * @brief Extração de intenção por regras (espanhol), implementação embutida do contrato `IntentExtractorFn`.
 */
#pragma once
#include <optional>
#include <string>
#include "Intent.hpp"

namespace navmaze {

/**
 * @brief Extrai intenção e parâmetros de uma frase em espanhol.
 *
 * Palavras-chave decidem a intenção (envio 0.85, saldo 0.9, pagamento 0.8,
 * bolsillo 0.8); texto sem palavra conhecida resulta em `unknown` com 0.6.
 * Montante e destinatário são extraídos quando presentes.
 */
Intent extract_intent_rules(const std::string& text);

/**
 * @brief Montante em pesos a partir do texto ("50 mil", "2 millones", "200 lucas", "$50.000", "un millón").
 * @param text texto já em minúsculas
 * @return montante em unidades, ou std::nullopt
 */
std::optional<long long> extract_amount(const std::string& text);

/**
 * @brief Nome próprio depois da palavra "a" ("Envía 50 mil a María" -> "María").
 *
 * Nomes de bancos e produtos são ignorados.
 */
std::optional<std::string> extract_recipient(const std::string& text);

} // namespace navmaze
