#include "PathSolver.hpp"
#include "Log.hpp"
#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <future>
#include <memory>
#include <queue>
#include <thread>

namespace navmaze {

static constexpr int kWall = static_cast<int>(Token::Wall);
static constexpr int kStart = static_cast<int>(Token::Start);
static constexpr int kTarget = static_cast<int>(Token::Target);

/**
 * @brief Localiza a única célula com o token dado.
 * @return false se o token não aparece ou aparece mais de uma vez
 */
static bool find_unique(const std::vector<int>& grid, int width, int token, GridPos* out) {
    int found = 0;
    for (size_t i = 0; i < grid.size(); ++i) {
        if (grid[i] != token) continue;
        if (++found > 1) return false;
        out->row = static_cast<int>(i) / width;
        out->col = static_cast<int>(i) % width;
    }
    return found == 1;
}

bool grid_dims_ok(size_t cells, int width, int height) {
    if (width <= 0 || height <= 0 || width > CFG_MAX_GRID_SIDE || height > CFG_MAX_GRID_SIDE) return false;
    return cells == static_cast<size_t>(width) * static_cast<size_t>(height);
}

SolveResult bfs_solve(const std::vector<int>& grid, int width, int height) {
    SolveResult res{};
    if (!grid_dims_ok(grid.size(), width, height)) return res;
    GridPos start{}, target{};
    if (!find_unique(grid, width, kStart, &start) || !find_unique(grid, width, kTarget, &target)) return res;

    std::vector<int> prev(grid.size(), -1);
    std::vector<uint8_t> visited(grid.size(), 0);
    auto idx = [&](int r, int c){ return r*width + c; };
    auto passable = [&](int r, int c){
        return r>=0 && c>=0 && r<height && c<width && grid[static_cast<size_t>(idx(r,c))] != kWall;
    };
    std::queue<GridPos> q;
    q.push(start);
    visited[static_cast<size_t>(idx(start.row, start.col))] = 1;

    // cima, baixo, esquerda, direita
    const int dr[4] = {-1, 1, 0, 0};
    const int dc[4] = {0, 0, -1, 1};
    while (!q.empty()) {
        GridPos p = q.front(); q.pop();
        if (p == target) break;
        for (int d = 0; d < 4; ++d) {
            int nr = p.row + dr[d], nc = p.col + dc[d];
            if (!passable(nr, nc)) continue;
            size_t j = static_cast<size_t>(idx(nr, nc));
            if (!visited[j]) { visited[j] = 1; prev[j] = idx(p.row, p.col); q.push({nr, nc}); }
        }
    }
    if (!visited[static_cast<size_t>(idx(target.row, target.col))]) return res;
    for (int cur = idx(target.row, target.col); cur != -1; cur = prev[static_cast<size_t>(cur)]) {
        res.path.push_back({cur / width, cur % width});
        if (cur == idx(start.row, start.col)) break;
    }
    std::reverse(res.path.begin(), res.path.end()); // reconstrói do target ao start
    res.success = true;
    return res;
}

bool is_usable_path(const std::vector<int>& grid, int width, int height, const std::vector<GridPos>& path) {
    if (path.empty() || !grid_dims_ok(grid.size(), width, height)) return false;
    auto token = [&](const GridPos& p){ return grid[static_cast<size_t>(p.row * width + p.col)]; };
    for (size_t i = 0; i < path.size(); ++i) {
        const GridPos& p = path[i];
        if (p.row < 0 || p.col < 0 || p.row >= height || p.col >= width) return false;
        if (token(p) == kWall) return false;
        if (i > 0 && std::abs(p.row - path[i-1].row) + std::abs(p.col - path[i-1].col) != 1) return false;
    }
    return token(path.front()) == kStart && token(path.back()) == kTarget;
}

SolverFn with_fallback(SolverFn oracle) {
    return [oracle = std::move(oracle)](const std::vector<int>& grid, int width, int height) -> SolveResult {
        if (oracle) {
            SolveResult r = oracle(grid, width, height);
            if (r.success && is_usable_path(grid, width, height, r.path)) return r;
            std::fprintf(log_out(), "SOLVER: oraculo sem caminho utilizavel (success=%d, len=%zu), usando BFS\n",
                         r.success ? 1 : 0, r.path.size());
        }
        return bfs_solve(grid, width, height);
    };
}

SolverFn with_timeout(SolverFn solver, std::chrono::milliseconds timeout) {
    return [solver = std::move(solver), timeout](const std::vector<int>& grid, int width, int height) -> SolveResult {
        if (!solver) return SolveResult{};
        auto task = std::make_shared<std::packaged_task<SolveResult()>>(
            [solver, grid, width, height]() { return solver(grid, width, height); });
        std::future<SolveResult> fut = task->get_future();
        std::thread([task]() { (*task)(); }).detach();
        if (fut.wait_for(timeout) != std::future_status::ready) {
            std::fprintf(stderr, "SOLVER: timeout apos %lld ms\n", static_cast<long long>(timeout.count()));
            return SolveResult{};
        }
        try {
            return fut.get();
        } catch (const std::exception& e) {
            std::fprintf(stderr, "SOLVER: falha no solver: %s\n", e.what());
            return SolveResult{};
        } catch (...) {
            std::fprintf(stderr, "SOLVER: falha no solver: excecao desconhecida\n");
            return SolveResult{};
        }
    };
}

} // namespace navmaze
