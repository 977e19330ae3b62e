/**
 * @file Config.cpp
 * @brief Leitura de `ServiceConfig` a partir do ambiente.
 */
#include "Config.hpp"
#include <cstdio>
#include <cstdlib>
#include <cerrno>

namespace navmaze {

static void env_string(const char* name, std::string& dst) {
    const char* v = std::getenv(name);
    if (v && *v) dst = v;
}

static void env_int(const char* name, int& dst) {
    const char* v = std::getenv(name);
    if (!v || !*v) return;
    char* end = nullptr;
    errno = 0;
    long parsed = std::strtol(v, &end, 10);
    if (errno != 0 || end == v || *end != '\0' || parsed < 0 || parsed > 0x7fffffffL) {
        std::fprintf(stderr, "CONFIG: %s=\"%s\" invalido, mantendo %d\n", name, v, dst);
        return;
    }
    dst = static_cast<int>(parsed);
}

static void env_bool(const char* name, bool& dst) {
    int v = dst ? 1 : 0;
    env_int(name, v);
    dst = v != 0;
}

ServiceConfig config_from_env() {
    ServiceConfig cfg{};
    env_string("NAVMAZE_INPUT", cfg.input_path);
    env_string("NAVMAZE_OUTPUT", cfg.output_path);
    env_int("NAVMAZE_RECONNECT_DELAY_MS", cfg.reconnect_delay_ms);
    env_int("NAVMAZE_MAX_RECONNECTS", cfg.max_reconnects);
    env_int("NAVMAZE_SOLVER_TIMEOUT_MS", cfg.solver_timeout_ms);
    env_int("NAVMAZE_PLAN_TTL_MS", cfg.plan_ttl_ms);
    env_int("NAVMAZE_MAX_STEP_RETRIES", cfg.max_step_retries);
    env_int("NAVMAZE_EXPLORE_DEPTH", cfg.explore_depth);
    env_string("NAVMAZE_DEFAULT_APP", cfg.default_app);
    env_string("NAVMAZE_DEFAULT_SCREEN", cfg.default_screen);
    env_string("NAVMAZE_CATALOG", cfg.catalog_path);
    env_string("NAVMAZE_STORE_DIR", cfg.store_dir);
    env_bool("NAVMAZE_PERSIST", cfg.persist_graphs);
    env_bool("NAVMAZE_VERBOSE", cfg.verbose);
    return cfg;
}

} // namespace navmaze
