#pragma once
#include <vector>
#include <cstdint>
#include <cstddef>
#include "Config.hpp"

/**
 * @file SpatialField.hpp
 * @brief Campo espacial NxN de tokens entregue ao solver de caminhos.
 */

namespace navmaze {

/** @brief Lado do campo espacial compilado (constante de compilação). */
constexpr int kFieldSize = CFG_FIELD_SIZE;

/**
 * @brief Vocabulário de tokens de uma célula.
 *
 * Os valores numéricos fazem parte do contrato com o solver e não podem mudar.
 */
enum class Token : uint8_t {
    Wall = 0,     ///< Sem transição possível
    Path = 1,     ///< Célula caminhável (nó ou corredor)
    Start = 2,    ///< Tela atual
    Target = 3,   ///< Tela destino
    Solution = 4, ///< Saída do oráculo: caminho encontrado
    Error = 5     ///< Saída do oráculo: erro de inferência
};

/**
 * @brief Posição (linha, coluna) no campo.
 */
struct GridPos {
    int row{0}; ///< Linha
    int col{0}; ///< Coluna
};

inline bool operator==(const GridPos& a, const GridPos& b) { return a.row == b.row && a.col == b.col; }
inline bool operator!=(const GridPos& a, const GridPos& b) { return !(a == b); }
inline bool operator<(const GridPos& a, const GridPos& b) {
    return a.row < b.row || (a.row == b.row && a.col < b.col);
}

/**
 * @brief Grade de tokens (largura x altura), inicializada com paredes.
 */
class SpatialField {
public:
    /**
     * @brief Constrói um campo todo em `Token::Wall`.
     * @param w largura (colunas)
     * @param h altura (linhas)
     */
    SpatialField(int w = kFieldSize, int h = kFieldSize) : w_(w), h_(h), grid_(static_cast<size_t>(w * h), Token::Wall) {}

    /** @brief Retorna a largura do campo. */
    int width() const { return w_; }
    /** @brief Retorna a altura do campo. */
    int height() const { return h_; }
    /** @brief Verifica se (row,col) está dentro dos limites. */
    bool in_bounds(int row, int col) const { return row>=0 && col>=0 && row<h_ && col<w_; }

    /** @brief Token da célula (row,col). */
    Token at(int row, int col) const { return grid_[static_cast<size_t>(row * w_ + col)]; }
    /** @brief Sobrescreve a célula (row,col); ignora posições fora do campo. */
    void set(int row, int col, Token t) {
        if (!in_bounds(row, col)) return;
        grid_[static_cast<size_t>(row * w_ + col)] = t;
    }

    /** @brief Quantidade de células com o token dado. */
    int count(Token t) const {
        int n = 0;
        for (Token c : grid_) if (c == t) ++n;
        return n;
    }

    /** @brief Sequência plana (linha-major) de tokens numéricos, formato do solver. */
    std::vector<int> flat() const {
        std::vector<int> out;
        out.reserve(grid_.size());
        for (Token c : grid_) out.push_back(static_cast<int>(c));
        return out;
    }

private:
    int w_;                   ///< Largura em células
    int h_;                   ///< Altura em células
    std::vector<Token> grid_; ///< Armazenamento linear (linha-major)
};

} // namespace navmaze
