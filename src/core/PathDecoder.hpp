/**
 * @file PathDecoder.hpp
 * @brief Converte o caminho de células do solver em sequência de telas.
 */
#pragma once
#include <map>
#include <string>
#include <vector>
#include "SpatialField.hpp"

namespace navmaze {

/**
 * @brief Decodifica um caminho de células em ids de nós.
 *
 * Células de corredor não mapeiam para nó e são ignoradas; repetições
 * consecutivas do mesmo nó são colapsadas.
 *
 * @param cells caminho (linha, coluna) devolvido pelo solver
 * @param positions mapeamento id -> célula do campo compilado
 * @return ids na ordem do caminho (vazio se nenhuma célula é de nó)
 */
std::vector<std::string> decode_path(const std::vector<GridPos>& cells,
                                     const std::map<std::string, GridPos>& positions);

} // namespace navmaze
