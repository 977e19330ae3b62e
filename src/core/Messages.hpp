/**
 * @file Messages.hpp
 * @brief Envelope JSON do protocolo e conversões de intenção/plano.
 *
 * Toda mensagem é um objeto `{type, requestId?, payload}` em uma linha.
 * Campos de entrada são procurados em `payload` e, na falta, no nível de cima.
 */
#pragma once
#include <map>
#include <string>
#include <json/json.h>
#include "Intent.hpp"
#include "Plan.hpp"

namespace navmaze {

/**
 * @brief Lê uma linha JSON.
 * @return false se a linha não é JSON ou não é objeto
 */
bool parse_message(const std::string& line, Json::Value* out, std::string* error = nullptr);

/** @brief Serializa em uma linha (sem indentação, UTF-8 literal). */
std::string write_message(const Json::Value& msg);

/** @brief Monta o envelope; `request_id` vazio é omitido. */
Json::Value make_message(const std::string& type, const std::string& request_id, const Json::Value& payload);

/** @brief Campo de entrada: `payload[key]`, senão `msg[key]`, senão null. */
const Json::Value& message_field(const Json::Value& msg, const char* key);

/** @brief String do campo ou `def` quando ausente ou de outro tipo. */
std::string field_string(const Json::Value& msg, const char* key, const std::string& def = std::string());

/** @brief Parâmetros {k: string|número|bool} como texto; inteiros sem casas decimais. */
std::map<std::string, std::string> params_from_json(const Json::Value& json);

/**
 * @brief Intenção a partir de `intent` (string ou objeto {name, confidence, params})
 *        mais `params`/`confidence` no mesmo nível.
 * @return false se não há nome de intenção
 */
bool intent_from_json(const Json::Value& msg, Intent* out);

/** @brief {name, confidence, params}; `amount` numérico quando é inteiro. */
Json::Value intent_to_json(const Intent& intent);

Json::Value step_to_json(const ActionStep& step);

/** @brief Payload de `execute_plan`. */
Json::Value plan_to_json(const ExecutionPlan& plan);

} // namespace navmaze
