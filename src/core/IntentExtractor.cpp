#include "IntentExtractor.hpp"
#include "Log.hpp"
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdio>
#include <cstdlib>
#include <initializer_list>
#include <regex>
#include <set>

namespace navmaze {

static bool contains_any(const std::string& text, std::initializer_list<const char*> words) {
    for (const char* w : words) {
        if (text.find(w) != std::string::npos) return true;
    }
    return false;
}

static std::string to_lower_ascii(const std::string& s) {
    std::string out(s);
    for (char& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

/** @brief Converte dígitos (sem separador) e multiplica; falha em estouro. */
static bool parse_scaled(const std::string& digits, long long scale, long long* out) {
    if (digits.empty()) return false;
    errno = 0;
    char* end = nullptr;
    long long v = std::strtoll(digits.c_str(), &end, 10);
    if (errno == ERANGE || !end || *end != '\0') return false;
    if (v > LLONG_MAX / scale) return false;
    *out = v * scale;
    return true;
}

std::optional<long long> extract_amount(const std::string& text) {
    struct Pattern { std::regex re; long long scale; bool strip; };
    // "millón" antes de "mil": "1 millón" também casaria com "(\d+)\s*mil"
    static const Pattern patterns[] = {
        {std::regex(R"((\d+)\s*mill(?:o|ó)n(?:es)?)"), 1000000LL, false},
        {std::regex(R"((\d+)\s*mil)"), 1000LL, false},
        {std::regex(R"((\d+)\s*lucas?)"), 1000LL, false},
        {std::regex(R"((\d+)\s*palos?)"), 1000000LL, false},
        {std::regex(R"(\$\s*([\d,.]+))"), 1LL, true},
        {std::regex(R"((\d{4,}))"), 1LL, false},
    };
    for (const Pattern& p : patterns) {
        std::smatch m;
        if (!std::regex_search(text, m, p.re)) continue;
        std::string digits = m[1].str();
        if (p.strip) {
            std::string clean;
            for (char c : digits) if (c != ',' && c != '.') clean.push_back(c);
            digits = clean;
        }
        long long v = 0;
        if (parse_scaled(digits, p.scale, &v)) return v;
    }
    if (text.find("un mill") != std::string::npos) return 1000000LL;
    return std::nullopt;
}

// Letras do nome: ASCII ou vogais acentuadas/ñ em UTF-8 (0xC3 xx)
static size_t upper_len(const std::string& s, size_t i) {
    if (i >= s.size()) return 0;
    unsigned char c = static_cast<unsigned char>(s[i]);
    if (c >= 'A' && c <= 'Z') return 1;
    if (c == 0xC3 && i + 1 < s.size()) {
        unsigned char d = static_cast<unsigned char>(s[i + 1]);
        if (d == 0x81 || d == 0x89 || d == 0x8D || d == 0x93 || d == 0x9A || d == 0x91) return 2;
    }
    return 0;
}

static size_t lower_len(const std::string& s, size_t i) {
    if (i >= s.size()) return 0;
    unsigned char c = static_cast<unsigned char>(s[i]);
    if (c >= 'a' && c <= 'z') return 1;
    if (c == 0xC3 && i + 1 < s.size()) {
        unsigned char d = static_cast<unsigned char>(s[i + 1]);
        if (d == 0xA1 || d == 0xA9 || d == 0xAD || d == 0xB3 || d == 0xBA || d == 0xB1) return 2;
    }
    return 0;
}

/** @brief Fim de uma palavra capitalizada começando em `i`, ou npos. */
static size_t match_name_word(const std::string& s, size_t i) {
    size_t n = upper_len(s, i);
    if (!n) return std::string::npos;
    i += n;
    size_t start = i;
    while (size_t l = lower_len(s, i)) i += l;
    return i == start ? std::string::npos : i;
}

static bool is_word_byte(unsigned char c) {
    return std::isalnum(c) || c == '_' || c >= 0x80;
}

static bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

std::optional<std::string> extract_recipient(const std::string& text) {
    static const std::set<std::string> skip = {"Bancolombia", "Nequi", "Daviplata", "Cuenta", "Bolsillo"};
    for (size_t i = 0; i + 1 < text.size(); ++i) {
        if (text[i] != 'a' || !is_space(text[i + 1])) continue;
        if (i > 0 && is_word_byte(static_cast<unsigned char>(text[i - 1]))) continue;
        size_t j = i + 1;
        while (j < text.size() && is_space(text[j])) ++j;
        size_t end = match_name_word(text, j);
        if (end == std::string::npos) continue;
        for (;;) {
            size_t k = end;
            if (k >= text.size() || !is_space(text[k])) break;
            while (k < text.size() && is_space(text[k])) ++k;
            size_t next = match_name_word(text, k);
            if (next == std::string::npos) break;
            end = next;
        }
        std::string name = text.substr(j, end - j);
        if (skip.count(name)) return std::nullopt;
        return name;
    }
    return std::nullopt;
}

Intent extract_intent_rules(const std::string& text) {
    Intent in;
    in.raw_text = text;
    in.name = "unknown";
    in.confidence = 0.6;
    const std::string lower = to_lower_ascii(text);

    if (contains_any(lower, {"envía", "envia", "enviar", "transfiere", "transferir",
                             "manda", "mandar", "pasa", "pasar", "gira", "girar"})) {
        in.name = "send_money";
        in.confidence = 0.85;
    }
    if (contains_any(lower, {"saldo", "cuánto tengo", "cuanto tengo", "balance", "plata tengo", "dinero tengo"})) {
        in.name = "check_balance";
        in.confidence = 0.9;
    }
    if (contains_any(lower, {"paga", "pagar", "servicio", "factura", "recibo"})) {
        in.name = "pay_bill";
        in.confidence = 0.8;
    }
    if (contains_any(lower, {"bolsillo", "pocket", "ahorro"})) {
        if (in.name == "send_money") {
            in.params["source"] = "bolsillo_ahorros";
        } else {
            in.name = "transfer_pocket";
            in.confidence = 0.8;
        }
    }
    if (auto amount = extract_amount(lower)) in.params["amount"] = std::to_string(*amount);
    if (auto who = extract_recipient(text)) in.params["recipient"] = *who;

    std::fprintf(log_out(), "INTENT: %s (confianca %.2f, %zu params)\n", in.name.c_str(), in.confidence, in.params.size());
    return in;
}

} // namespace navmaze
