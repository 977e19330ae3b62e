/**
 * @file GraphStore.cpp
 * @brief Implementação da persistência de grafos em arquivo.
 */
#include "GraphStore.hpp"
#include "GraphJson.hpp"
#include "Log.hpp"
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <json/json.h>
#include <utility>
#include <vector>

namespace navmaze {

namespace fs = std::filesystem;

GraphStore::GraphStore(std::string dir) : dir_(std::move(dir)) {
    if (!dir_.empty()) return;
    const char* home = std::getenv("HOME");
    if (!home) {
        std::fprintf(stderr, "GSTORE[HOST]: HOME not set, persistence disabled\n");
        return;
    }
    dir_ = (fs::path(home) / ".navmaze" / "graphs").string();
}

std::string GraphStore::file_name(const std::string& app) {
    std::string out;
    for (char c : app) {
        unsigned char u = static_cast<unsigned char>(c);
        out.push_back((std::isalnum(u) || c == '.' || c == '-' || c == '_') ? c : '_');
    }
    if (out.empty() || out == "." || out == "..") out = "_" + out;
    return out + ".json";
}

bool GraphStore::save(const NavigationGraph& g) {
    if (!enabled()) return false;
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        std::fprintf(stderr, "GSTORE[HOST]: create dir failed: %s\n", ec.message().c_str());
        return false;
    }
    const fs::path file = fs::path(dir_) / file_name(g.app());
    const fs::path tmp = file.string() + ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs) {
            std::fprintf(stderr, "GSTORE[HOST]: open write failed: %s\n", tmp.string().c_str());
            return false;
        }
        Json::StreamWriterBuilder b;
        b["indentation"] = "  ";
        b["emitUTF8"] = true;
        ofs << Json::writeString(b, graph_to_json(g)) << '\n';
        if (!ofs) {
            std::fprintf(stderr, "GSTORE[HOST]: write failed: %s\n", tmp.string().c_str());
            return false;
        }
    }
    fs::rename(tmp, file, ec);
    if (ec) {
        std::fprintf(stderr, "GSTORE[HOST]: rename failed: %s\n", ec.message().c_str());
        return false;
    }
    std::fprintf(log_out(), "GSTORE[HOST]: save ok -> %s (%zu nodes)\n", file.string().c_str(), g.node_count());
    return true;
}

static bool read_graph_file(const fs::path& file, const std::string& app, NavigationGraph* out) {
    std::ifstream ifs(file, std::ios::binary);
    if (!ifs) return false;
    Json::CharReaderBuilder b;
    Json::Value root;
    std::string errs;
    if (!Json::parseFromStream(b, ifs, &root, &errs)) {
        std::fprintf(stderr, "GSTORE[HOST]: %s invalido: %s\n", file.string().c_str(), errs.c_str());
        return false;
    }
    std::string why;
    if (!load_graph(root, app, out, &why)) {
        std::fprintf(stderr, "GSTORE[HOST]: %s rejeitado: %s\n", file.string().c_str(), why.c_str());
        return false;
    }
    return true;
}

bool GraphStore::load(const std::string& app, NavigationGraph* out) const {
    if (!out || !enabled()) return false;
    const fs::path file = fs::path(dir_) / file_name(app);
    if (!read_graph_file(file, app, out)) return false;
    std::fprintf(log_out(), "GSTORE[HOST]: load ok <- %s\n", file.string().c_str());
    return true;
}

size_t GraphStore::load_all(std::map<std::string, NavigationGraph>* out) const {
    if (!out || !enabled()) return 0;
    std::error_code ec;
    if (!fs::is_directory(dir_, ec)) return 0;
    size_t n = 0;
    for (const fs::directory_entry& e : fs::directory_iterator(dir_, ec)) {
        if (e.path().extension() != ".json") continue;
        NavigationGraph g;
        if (!read_graph_file(e.path(), std::string(), &g)) continue;
        const std::string app = g.app();
        (*out)[app] = std::move(g);
        ++n;
    }
    std::fprintf(log_out(), "GSTORE[HOST]: %zu grafo(s) carregado(s) de %s\n", n, dir_.c_str());
    return n;
}

bool GraphStore::eraseAll() {
    if (!enabled()) return false;
    std::error_code ec;
    if (!fs::exists(dir_, ec)) {
        std::fprintf(log_out(), "GSTORE[HOST]: eraseAll() noop\n");
        return true;
    }
    std::vector<fs::path> files;
    for (const fs::directory_entry& e : fs::directory_iterator(dir_, ec)) {
        if (e.path().extension() == ".json") files.push_back(e.path());
    }
    bool ok = !ec;
    size_t removed = 0;
    for (const fs::path& f : files) {
        std::error_code rec;
        if (fs::remove(f, rec)) ++removed;
        else if (rec) ok = false;
    }
    std::fprintf(log_out(), "GSTORE[HOST]: eraseAll() removed=%zu %s\n", removed, ok ? "ok" : "partial");
    return ok;
}

StoreStatus GraphStore::status() const {
    StoreStatus st{};
    st.dir = dir_;
    if (!enabled()) return st;
    std::error_code ec;
    if (!fs::is_directory(dir_, ec)) return st;
    for (const fs::directory_entry& e : fs::directory_iterator(dir_, ec)) {
        if (e.path().extension() == ".json") ++st.saved_count;
    }
    return st;
}

} // namespace navmaze
