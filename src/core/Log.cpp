#include "Log.hpp"
#include "Config.hpp"

namespace navmaze {

/** @brief Stream de progresso; nullptr significa stdout. */
static std::FILE* g_log_out = nullptr;
/** @brief Verbosidade corrente. */
static bool g_verbose = CFG_VERBOSE != 0;

std::FILE* log_out() { return g_log_out ? g_log_out : stdout; }

void set_log_out(std::FILE* f) { g_log_out = f; }

bool verbose() { return g_verbose; }

void set_verbose(bool on) { g_verbose = on; }

} // namespace navmaze
