/**
 * @file Log.hpp
 * @brief Destino das mensagens de progresso e controle de verbosidade.
 *
 * O núcleo escreve linhas no formato `TAG: mensagem` com `std::fprintf`. O
 * progresso vai para `log_out()` (stdout por padrão); diagnósticos vão direto
 * para stderr. O serviço redireciona `log_out()` para stderr quando o stdout
 * transporta o protocolo.
 */
#pragma once
#include <cstdio>

namespace navmaze {

/** @brief Stream atual para linhas de progresso. */
std::FILE* log_out();

/** @brief Redireciona as linhas de progresso (nullptr restaura stdout). */
void set_log_out(std::FILE* f);

/** @brief true quando linhas de depuração devem ser impressas. */
bool verbose();

/** @brief Liga/desliga linhas de depuração. */
void set_verbose(bool on);

} // namespace navmaze
