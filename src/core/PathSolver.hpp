#pragma once
#include <chrono>
#include <cstddef>
#include <functional>
#include <vector>
#include "SpatialField.hpp"

/**
 * @file PathSolver.hpp
 * @brief Contrato do solver de caminhos em grade e a implementação BFS de referência.
 *
 * Contrato (fronteira com o oráculo, não pode mudar):
 * `solve(grid, width, height) -> (caminho de células, sucesso)`, onde `grid` é a
 * sequência plana linha-major de tokens 0..5 e o caminho é uma lista de
 * (linha, coluna) do START ao TARGET.
 */

namespace navmaze {

/** @brief Resultado de um solver: caminho de células e flag de sucesso. */
struct SolveResult {
    std::vector<GridPos> path; ///< Células do START ao TARGET (vazio em falha)
    bool success{false};       ///< true se `path` é uma resposta
};

/** @brief Capacidade de resolver um campo; o oráculo neural e o BFS cumprem o mesmo contrato. */
using SolverFn = std::function<SolveResult(const std::vector<int>& grid, int width, int height)>;

/**
 * @brief Confere as dimensões de um grid plano.
 * @return true se 0 < width, height <= CFG_MAX_GRID_SIDE e `cells == width*height`
 */
bool grid_dims_ok(size_t cells, int width, int height);

/**
 * @brief Solver de referência: BFS 4-direções sobre o vocabulário de tokens.
 *
 * WALL é intransponível; os vizinhos são testados na ordem cima, baixo,
 * esquerda, direita, o que torna o primeiro caminho mais curto encontrado
 * determinístico.
 *
 * @return falha se o grid não tem tamanho width*height ou não tem exatamente
 *         um START e um TARGET, ou se o TARGET é inalcançável
 */
SolveResult bfs_solve(const std::vector<int>& grid, int width, int height);

/**
 * @brief Valida a resposta de um oráculo contra o grid.
 *
 * O caminho precisa começar no START, terminar no TARGET, andar uma célula
 * por vez (4-vizinhança) dentro dos limites e nunca pisar em WALL.
 */
bool is_usable_path(const std::vector<int>& grid, int width, int height, const std::vector<GridPos>& path);

/**
 * @brief Solver que consulta o oráculo e cai para o BFS quando ele falta ou falha.
 * @param oracle oráculo (pode ser vazio)
 */
SolverFn with_fallback(SolverFn oracle);

/**
 * @brief Executa o solver atrás de uma fronteira de future com tempo limite.
 *
 * Se a resposta não chega em `timeout`, retorna falha; a tarefa atrasada
 * termina sozinha e seu resultado é descartado. Exceções do solver viram falha.
 */
SolverFn with_timeout(SolverFn solver, std::chrono::milliseconds timeout);

} // namespace navmaze
