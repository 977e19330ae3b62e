/**
 * @file main.cpp
 * @brief Serviço de planejamento de navegação entre telas.
 *
 * - Lê a configuração (`CFG_*` + variáveis `NAVMAZE_*`).
 * - Carrega o catálogo de intenções (padrão ou `NAVMAZE_CATALOG`).
 * - Recarrega os grafos persistidos e atende o protocolo JSON por linha.
 * - Aceita comandos do operador na mesma entrada (RESET/STATUS).
 */

#include <cstdio>
#include <fstream>
#include <memory>
#include <string>
#include <json/json.h>

#include "core/Config.hpp"
#include "core/GraphStore.hpp"
#include "core/IntentCatalog.hpp"
#include "core/Log.hpp"
#include "core/Messages.hpp"
#include "core/Orchestrator.hpp"
#include "io/ServiceLoop.hpp"
#include "io/Transport.hpp"

using namespace navmaze;

/**
 * @brief Substitui o catálogo padrão pelo JSON em `path`.
 * @return false se o arquivo não abre ou é rejeitado (catálogo padrão mantido)
 */
static bool load_catalog_file(const std::string& path, IntentCatalog* catalog) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        std::fprintf(stderr, "CATALOG: nao abriu %s\n", path.c_str());
        return false;
    }
    Json::CharReaderBuilder b;
    Json::Value root;
    std::string errs;
    if (!Json::parseFromStream(b, ifs, &root, &errs)) {
        std::fprintf(stderr, "CATALOG: %s invalido: %s\n", path.c_str(), errs.c_str());
        return false;
    }
    std::string why;
    if (!catalog->load_json(root, &why)) {
        std::fprintf(stderr, "CATALOG: %s rejeitado: %s\n", path.c_str(), why.c_str());
        return false;
    }
    return true;
}

/**
 * @brief Ponto de entrada do serviço.
 * @return 0 em término normal; 1 quando a conexão não pôde ser restabelecida
 */
int main() {
    ServiceConfig cfg = config_from_env();
    set_verbose(cfg.verbose);

    const bool stdio_out = cfg.output_path.empty() || cfg.output_path == "-";
    const bool stdio_in = cfg.input_path.empty() || cfg.input_path == "-";
    // stdout carrega o protocolo: progresso vai para stderr
    if (stdio_out) set_log_out(stderr);

    std::unique_ptr<io::Transport> transport;
    if (stdio_in && stdio_out) {
        transport = std::make_unique<io::StreamTransport>(stdin, stdout);
    } else if (!stdio_in && !stdio_out) {
        transport = std::make_unique<io::FifoTransport>(cfg.input_path, cfg.output_path);
    } else {
        std::fprintf(stderr, "ERRO: NAVMAZE_INPUT e NAVMAZE_OUTPUT devem ser ambos '-' ou ambos caminhos\n");
        return 2;
    }

    IntentCatalog catalog = IntentCatalog::defaults();
    if (!cfg.catalog_path.empty() && !load_catalog_file(cfg.catalog_path, &catalog)) {
        std::fprintf(stderr, "CATALOG: usando catalogo padrao\n");
    }

    io::Transport& link = *transport;
    Orchestrator orch(cfg, [&link](const Json::Value& msg) {
        if (!link.send(write_message(msg))) {
            std::fprintf(stderr, "ORCH: mensagem '%s' perdida (sem conexao)\n", msg["type"].asCString());
        }
    }, catalog);

    GraphStore store(cfg.store_dir);
    if (cfg.persist_graphs) {
        orch.set_store(&store);
        std::fprintf(log_out(), "GRAPHS restaurados: %zu\n", orch.restore_graphs());
    } else {
        std::fprintf(log_out(), "GRAPHS sem persistencia.\n");
    }

    std::fprintf(log_out(), "START servico (app padrao %s, tela padrao %s)\n",
                 cfg.default_app.c_str(), cfg.default_screen.c_str());

    io::ServiceLoop loop(orch, link, cfg);
    return loop.run();
}
