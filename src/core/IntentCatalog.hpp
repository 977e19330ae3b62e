/**
 * @file IntentCatalog.hpp
 * @brief Tabela intenção -> checkpoints, variantes, intenções sensíveis e
 *        regras de preenchimento de parâmetros.
 */
#pragma once
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include <json/json.h>
#include "Intent.hpp"
#include "NavigationGraph.hpp"

namespace navmaze {

/**
 * @brief Rota alternativa escolhida por um parâmetro.
 *
 * Vale quando a intenção é `intent` e o parâmetro `param` começa com `prefix`.
 */
struct RouteVariant {
    std::string intent; ///< Intenção de origem
    std::string param;  ///< Parâmetro inspecionado
    std::string prefix; ///< Prefixo que ativa a variante
    std::string route;  ///< Chave da rota a usar
};

/**
 * @brief Passo de parâmetro emitido ao alcançar um checkpoint.
 *
 * Em `selector`, `value` e `description`, `{value}` é trocado pelo valor do
 * parâmetro (sem `strip_prefix`) e `{money}` pelo valor com separador de milhar.
 */
struct ParamRule {
    std::string param;        ///< Parâmetro da intenção que dispara a regra
    std::string action;       ///< "fill", "tap", ...
    Selector selector;        ///< Seletor (modelo)
    std::string value;        ///< Valor do passo (modelo)
    std::string description;  ///< Descrição (modelo)
    std::string strip_prefix; ///< Prefixo removido do valor antes da troca
};

/**
 * @brief Catálogo de intenções usado pelo resolvedor de checkpoints e pelo montador.
 */
class IntentCatalog {
public:
    /** @brief Catálogo bancário padrão. */
    static IntentCatalog defaults();

    /**
     * @brief Substitui o conteúdo a partir de JSON.
     *
     * Formato: {"hub", "routes": {intent: [ids]}, "variants": [{intent,param,prefix,route}],
     * "sensitive": [intents], "params": {checkpoint: [{param,action,selector,value,description,strip_prefix}]}}.
     * Chaves ausentes mantêm o valor atual.
     * @return false (catálogo intacto) se o JSON é malformado
     */
    bool load_json(const Json::Value& json, std::string* error = nullptr);

    /**
     * @brief Expande a intenção na sequência de checkpoints.
     *
     * A tela atual é prefixada quando não é o primeiro checkpoint e a
     * sequência é deduplicada (o hub pode repetir). Intenção sem rota resulta
     * em `[current_screen]`.
     */
    std::vector<std::string> resolve(const std::string& intent, const std::map<std::string, std::string>& params,
                                     const std::string& current_screen) const;
    std::vector<std::string> resolve(const Intent& intent, const std::string& current_screen) const {
        return resolve(intent.name, intent.params, current_screen);
    }

    /** @brief Chave de rota para a intenção (variante ou o próprio nome). */
    std::string route_key(const std::string& intent, const std::map<std::string, std::string>& params) const;

    /** @brief true para intenções que movimentam dinheiro. */
    bool is_sensitive(const std::string& intent) const { return sensitive_.count(intent) != 0; }

    /** @brief Regras de parâmetros do checkpoint (vazio se não há). */
    const std::vector<ParamRule>& param_rules(const std::string& checkpoint) const;

    const std::string& hub() const { return hub_; }
    void set_hub(std::string hub) { hub_ = std::move(hub); }
    void set_route(const std::string& intent, std::vector<std::string> route) { routes_[intent] = std::move(route); }
    void add_variant(RouteVariant v) { variants_.push_back(std::move(v)); }
    void add_param_rule(const std::string& checkpoint, ParamRule r) { params_[checkpoint].push_back(std::move(r)); }
    void set_sensitive(const std::string& intent, bool on);
    bool has_route(const std::string& intent) const { return routes_.count(intent) != 0; }
    size_t route_count() const { return routes_.size(); }

private:
    std::string hub_{"home"};
    std::map<std::string, std::vector<std::string>> routes_;
    std::vector<RouteVariant> variants_;
    std::set<std::string> sensitive_;
    std::map<std::string, std::vector<ParamRule>> params_;
};

/**
 * @brief Remove checkpoints repetidos mantendo a primeira ocorrência; o hub pode repetir.
 */
std::vector<std::string> dedupe_checkpoints(const std::vector<std::string>& seq, const std::string& hub);

} // namespace navmaze
