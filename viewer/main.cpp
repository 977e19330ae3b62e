/**
 * @file viewer/main.cpp
 * @brief Visualizador SDL2 do campo espacial compilado de um grafo de navegação.
 *
 * Desenha as paredes (verde escuro), corredores (cinza), células de nó
 * (azul), START (amarelo), TARGET (vermelho) e, opcionalmente, a solução do
 * BFS de referência (branco). O título da janela mostra os extremos e o
 * caminho de telas decodificado.
 *
 * Como executar:
 * - Habilite o alvo no CMake: `-DNAVMAZE_BUILD_VIEWER=ON` (padrão).
 * - Garanta a SDL2 instalada no sistema (dev headers).
 * - `./navmaze_viewer grafo.json [inicio] [destino]`
 *
 * Controles:
 * - ESC: sair
 * - Espaço: próximo nó como destino
 * - S: liga/desliga a solução
 * - R: recompila o campo
 */
#include <SDL2/SDL.h>
#include <cstdio>
#include <fstream>
#include <string>
#include <vector>
#include <json/json.h>
#include "core/GraphJson.hpp"
#include "core/NavigationGraph.hpp"
#include "core/PathDecoder.hpp"
#include "core/PathSolver.hpp"
#include "core/SpatialCompiler.hpp"

using namespace navmaze;

/**
 * @brief Carrega um grafo de um arquivo JSON (`{app, nodes, edges}`).
 */
static bool load_graph_file(const std::string& path, NavigationGraph* out) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        std::fprintf(stderr, "Falha ao abrir %s\n", path.c_str());
        return false;
    }
    Json::CharReaderBuilder b;
    Json::Value root;
    std::string errs;
    if (!Json::parseFromStream(b, ifs, &root, &errs)) {
        std::fprintf(stderr, "JSON invalido em %s: %s\n", path.c_str(), errs.c_str());
        return false;
    }
    std::string why;
    if (!load_graph(root, std::string(), out, &why)) {
        std::fprintf(stderr, "Grafo rejeitado: %s\n", why.c_str());
        return false;
    }
    return true;
}

/** @brief Estado da visualização: extremos, campo e solução correntes. */
struct ViewState {
    std::string start;
    std::string target;
    CompiledField field;
    CompileStatus status{CompileStatus::Ok};
    SolveResult solution;
    std::vector<std::string> screens;
};

/**
 * @brief Compila o campo e resolve com o BFS de referência; imprime o desenho ASCII.
 */
static void recompile(const NavigationGraph& g, ViewState& vs) {
    vs.field = CompiledField{};
    vs.solution = SolveResult{};
    vs.screens.clear();
    vs.status = compile(g, vs.start, vs.target, &vs.field);
    if (vs.status == CompileStatus::Ok) {
        vs.solution = bfs_solve(vs.field.flat(), vs.field.field.width(), vs.field.field.height());
        if (vs.solution.success) vs.screens = decode_path(vs.solution.path, vs.field.positions);
    }
    std::printf("%s -> %s: %s\n", vs.start.c_str(), vs.target.c_str(), to_string(vs.status));
    std::printf("%s", render_field(vs.field, vs.solution.success ? &vs.solution.path : nullptr).c_str());
    if (!vs.field.dropped.empty()) {
        std::printf("fora do campo:");
        for (const std::string& id : vs.field.dropped) std::printf(" %s", id.c_str());
        std::printf("\n");
    }
}

/**
 * @brief Desenha cada célula do campo como um quadrado colorido pelo token.
 *
 * @param ren Renderer SDL2.
 * @param cf Campo compilado.
 * @param ox Offset X em pixels.
 * @param oy Offset Y em pixels.
 * @param cell Tamanho da célula em pixels.
 */
static void draw_field(SDL_Renderer* ren, const CompiledField& cf, int ox, int oy, int cell) {
    for (int r = 0; r < cf.field.height(); ++r) {
        for (int c = 0; c < cf.field.width(); ++c) {
            const Token t = cf.field.at(r, c);
            if (t == Token::Wall) SDL_SetRenderDrawColor(ren, 0, 70, 0, 255);
            else if (t == Token::Start) SDL_SetRenderDrawColor(ren, 230, 200, 0, 255);
            else if (t == Token::Target) SDL_SetRenderDrawColor(ren, 200, 0, 0, 255);
            else if (cf.node_at(GridPos{r, c})) SDL_SetRenderDrawColor(ren, 40, 90, 220, 255);
            else SDL_SetRenderDrawColor(ren, 110, 110, 110, 255);
            SDL_Rect rc{ ox + c*cell + 1, oy + r*cell + 1, cell - 2, cell - 2 };
            SDL_RenderFillRect(ren, &rc);
        }
    }
}

/**
 * @brief Sobrepõe o caminho da solução (pontos brancos no centro das células).
 */
static void draw_solution(SDL_Renderer* ren, const std::vector<GridPos>& path, int ox, int oy, int cell) {
    SDL_SetRenderDrawColor(ren, 255, 255, 255, 255);
    for (const GridPos& p : path) {
        SDL_Rect dot{ ox + p.col*cell + cell/3, oy + p.row*cell + cell/3, cell/3, cell/3 };
        SDL_RenderFillRect(ren, &dot);
    }
}

/**
 * @brief Ponto de entrada do visualizador.
 *
 * @param argc Quantidade de argumentos.
 * @param argv `grafo.json [inicio] [destino]`; sem extremos usa o primeiro e o último nó.
 * @return 0 em término normal; 1 em erro de argumentos, de grafo ou de SDL.
 */
int main(int argc, char** argv) {
    if (argc < 2) {
        std::fprintf(stderr, "uso: %s grafo.json [inicio] [destino]\n", argv[0]);
        return 1;
    }
    NavigationGraph g;
    if (!load_graph_file(argv[1], &g) || g.empty()) {
        std::fprintf(stderr, "Grafo vazio ou invalido: %s\n", argv[1]);
        return 1;
    }
    const std::vector<std::string>& ids = g.node_order();

    ViewState vs;
    vs.start = argc > 2 ? argv[2] : ids.front();
    vs.target = argc > 3 ? argv[3] : ids.back();
    size_t target_idx = 0;
    for (size_t i = 0; i < ids.size(); ++i) {
        if (ids[i] == vs.target) target_idx = i;
    }
    recompile(g, vs);

    if (SDL_Init(SDL_INIT_VIDEO) != 0) {
        std::fprintf(stderr, "SDL_Init error: %s\n", SDL_GetError());
        return 1;
    }
    const int CELL = 22;
    const int OX = 20, OY = 20;
    const int win_w = OX*2 + CELL*vs.field.field.width();
    const int win_h = OY*2 + CELL*vs.field.field.height();
    SDL_Window* win = SDL_CreateWindow("NavMaze Viewer", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED, win_w, win_h, SDL_WINDOW_SHOWN);
    if (!win) {
        std::fprintf(stderr, "SDL_CreateWindow error: %s\n", SDL_GetError());
        SDL_Quit();
        return 1;
    }
    SDL_Renderer* ren = SDL_CreateRenderer(win, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
    if (!ren) {
        std::fprintf(stderr, "SDL_CreateRenderer error: %s\n", SDL_GetError());
        SDL_DestroyWindow(win);
        SDL_Quit();
        return 1;
    }

    bool show_solution = true;
    bool running = true;
    while (running) {
        SDL_Event e;
        while (SDL_PollEvent(&e)) {
            if (e.type == SDL_QUIT) running = false;
            if (e.type == SDL_KEYDOWN) {
                if (e.key.keysym.sym == SDLK_ESCAPE) running = false;
                if (e.key.keysym.sym == SDLK_s) show_solution = !show_solution;
                if (e.key.keysym.sym == SDLK_r) recompile(g, vs);
                if (e.key.keysym.sym == SDLK_SPACE) {
                    target_idx = (target_idx + 1) % ids.size();
                    vs.target = ids[target_idx];
                    recompile(g, vs);
                }
            }
        }

        SDL_SetRenderDrawColor(ren, 0, 0, 0, 255);
        SDL_RenderClear(ren);
        draw_field(ren, vs.field, OX, OY, CELL);
        if (show_solution && vs.solution.success) draw_solution(ren, vs.solution.path, OX, OY, CELL);

        std::string title = "NavMaze Viewer - " + vs.start + " -> " + vs.target + " [" + to_string(vs.status) + "]";
        for (size_t i = 0; i < vs.screens.size(); ++i) title += (i ? " > " : " ") + vs.screens[i];
        SDL_SetWindowTitle(win, title.c_str());
        SDL_RenderPresent(ren);
    }
    SDL_DestroyRenderer(ren);
    SDL_DestroyWindow(win);
    SDL_Quit();
    return 0;
}
