/**
 * @file SpatialCompiler.hpp
 * @brief Compilador grafo -> campo espacial NxN pronto para o solver.
 *
 * Etapas: layout dos nós em grade (ordem BFS), traçado de corredores em "L"
 * entre nós conectados e marcação de START/TARGET.
 */
#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include "NavigationGraph.hpp"
#include "SpatialField.hpp"

namespace navmaze {

/** @brief Parâmetros do layout (lado do campo, espaçamento mínimo e margem). */
struct LayoutParams {
    int size{kFieldSize};          ///< Lado N do campo
    int spacing{CFG_NODE_SPACING}; ///< Espaçamento mínimo entre nós
    int border{CFG_FIELD_BORDER};  ///< Margem a partir da borda
};

/**
 * @brief Resultado da compilação.
 *
 * `*Missing`: o nó não existe no grafo (o salto é descartado).
 * `*Dropped`: o nó existe mas não coube no campo (o chamador pode buscar
 * direto no grafo).
 */
enum class CompileStatus : uint8_t { Ok, StartMissing, TargetMissing, StartDropped, TargetDropped };

/** @brief Nome curto do status para logs. */
const char* to_string(CompileStatus s);

/** @brief Posicionamento dos nós: mapa id->célula e nós que não couberam. */
struct FieldLayout {
    std::vector<std::string> order;           ///< Ordem de posicionamento (BFS + desconexos)
    std::map<std::string, GridPos> positions; ///< Nós posicionados
    std::vector<std::string> dropped;         ///< Nós descartados por falta de espaço
};

/**
 * @brief Campo compilado com o mapeamento nó<->célula.
 */
struct CompiledField {
    SpatialField field{};                     ///< Grade de tokens
    std::map<std::string, GridPos> positions; ///< id -> célula
    std::map<GridPos, std::string> cells;     ///< célula -> id
    std::vector<std::string> dropped;         ///< Nós que ficaram fora do campo
    GridPos start{};                          ///< Célula START (válida se status Ok)
    GridPos target{};                         ///< Célula TARGET (válida se status Ok)

    /** @brief Tokens em sequência plana linha-major (fronteira do solver). */
    std::vector<int> flat() const { return field.flat(); }
    /** @brief Id do nó na célula, ou nullptr se a célula não é de nó. */
    const std::string* node_at(GridPos p) const {
        auto it = cells.find(p);
        return it == cells.end() ? nullptr : &it->second;
    }
};

/**
 * @brief Calcula a posição de cada nó no campo.
 *
 * Ordem BFS a partir do primeiro nó inserido, seguida dos nós não alcançados
 * na ordem de inserção. A grade de colunas x linhas é aproximadamente
 * quadrada; colisões são resolvidas avançando a coluna e, no fim da linha,
 * passando à linha seguinte. Nós que não cabem vão para `dropped`.
 */
FieldLayout layout_nodes(const NavigationGraph& g, const LayoutParams& p = {});

/**
 * @brief Compila o grafo em um campo com START em `start` e TARGET em `target`.
 *
 * O layout e os corredores são gravados em `out` mesmo quando a marcação
 * falha, para inspeção.
 *
 * @param g grafo de navegação
 * @param start tela atual
 * @param target tela destino
 * @param out campo compilado (obrigatório)
 * @param p parâmetros do layout
 * @return `CompileStatus::Ok` se START e TARGET foram marcados
 */
CompileStatus compile(const NavigationGraph& g, const std::string& start, const std::string& target,
                      CompiledField* out, const LayoutParams& p = {});

/**
 * @brief Desenho ASCII do campo.
 *
 * `#` parede, `.` corredor, `S`/`T` extremos, `*` solução, `x` erro e a
 * primeira letra do id nas células de nó.
 * @param cf campo compilado
 * @param solution caminho a sobrepor (opcional)
 */
std::string render_field(const CompiledField& cf, const std::vector<GridPos>* solution = nullptr);

} // namespace navmaze
