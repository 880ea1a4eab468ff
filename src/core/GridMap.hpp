#pragma once
#include <vector>
#include <cstddef>
#include <optional>
#include "Config.hpp"

/**
 * @file GridMap.hpp
 * @brief Representação do labirinto como matriz de códigos de célula.
 */

namespace gridnav {

/**
 * @brief Códigos de célula aceitos na grade.
 *
 * Contrato fixo de codificação: 0 = livre, 1 = parede, 3 = objetivo.
 */
enum CellCode : int {
    CELL_OPEN = 0, ///< Célula livre
    CELL_WALL = 1, ///< Parede
    CELL_GOAL = 3  ///< Marcador de objetivo
};

/**
 * @brief Posição de célula (linha, coluna) na grade.
 */
struct CellPos {
    int row{0}; ///< Linha
    int col{0}; ///< Coluna
};

inline bool operator==(CellPos a, CellPos b) { return a.row == b.row && a.col == b.col; }
inline bool operator!=(CellPos a, CellPos b) { return !(a == b); }

/**
 * @brief Posição em pixels (x, y). Nunca misturar com `CellPos` sem conversão.
 */
struct PixelPos {
    int x{0}; ///< Coordenada horizontal em pixels
    int y{0}; ///< Coordenada vertical em pixels
};

inline bool operator==(PixelPos a, PixelPos b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(PixelPos a, PixelPos b) { return !(a == b); }

/** @brief Sequência ordenada de células do início até o objetivo (inclusive). */
using Path = std::vector<CellPos>;

/** @brief Converte célula em pixel: x = col*TILE_SIZE, y = row*TILE_SIZE. */
inline PixelPos to_pixel(CellPos c) { return PixelPos{c.col * TILE_SIZE, c.row * TILE_SIZE}; }

/**
 * @brief Converte pixel em célula por divisão inteira.
 *
 * Coordenadas negativas arredondam para baixo, de modo que caiam fora da grade.
 */
inline CellPos to_cell(PixelPos p) {
    auto floor_div = [](int v) { return v >= 0 ? v / TILE_SIZE : -((-v + TILE_SIZE - 1) / TILE_SIZE); };
    return CellPos{floor_div(p.y), floor_div(p.x)};
}

/** @brief Distância de Manhattan entre duas células. */
inline int manhattan(CellPos a, CellPos b) {
    const int dr = a.row > b.row ? a.row - b.row : b.row - a.row;
    const int dc = a.col > b.col ? a.col - b.col : b.col - a.col;
    return dr + dc;
}

/**
 * @brief Grade retangular (linhas x colunas) de códigos de célula.
 *
 * Somente leitura para o núcleo de navegação durante a busca.
 */
class GridMap {
public:
    /**
     * @brief Constrói uma grade totalmente livre com as dimensões fornecidas.
     * @param rows número de linhas
     * @param cols número de colunas
     */
    GridMap(int rows, int cols)
        : rows_(rows > 0 ? rows : 0), cols_(cols > 0 ? cols : 0),
          cells_(static_cast<size_t>(rows_) * static_cast<size_t>(cols_), CELL_OPEN) {}

    /**
     * @brief Constrói a grade a partir de linhas aninhadas (`[row][col]`).
     * @param rows matriz de códigos
     * @return grade construída, ou std::nullopt se as linhas tiverem larguras diferentes
     */
    static std::optional<GridMap> from_rows(const std::vector<std::vector<int>>& rows) {
        const int h = static_cast<int>(rows.size());
        const int w = h > 0 ? static_cast<int>(rows.front().size()) : 0;
        GridMap g(h, w);
        for (int r = 0; r < h; ++r) {
            if (static_cast<int>(rows[r].size()) != w) return std::nullopt;
            for (int c = 0; c < w; ++c) g.set({r, c}, rows[r][c]);
        }
        return g;
    }

    /** @brief Número de linhas. */
    int rows() const { return rows_; }
    /** @brief Número de colunas. */
    int cols() const { return cols_; }

    /** @brief Verifica se a célula está dentro de [0,rows) x [0,cols). */
    bool in_bounds(CellPos c) const { return c.row>=0 && c.col>=0 && c.row<rows_ && c.col<cols_; }

    /** @brief Célula dentro dos limites e diferente de parede. */
    bool is_walkable(CellPos c) const { return in_bounds(c) && at(c) != CELL_WALL; }

    /** @brief Célula dentro dos limites e marcada como objetivo. */
    bool is_goal(CellPos c) const { return in_bounds(c) && at(c) == CELL_GOAL; }

    /** @brief Código da célula (sem verificação de limites). */
    int at(CellPos c) const { return cells_[index(c)]; }

    /** @brief Altera o código da célula; ignora posições fora da grade. */
    void set(CellPos c, int code) {
        if (!in_bounds(c)) return;
        cells_[index(c)] = code;
    }

    /** @brief Índice linear (linha-major), útil para vetores auxiliares de busca. */
    int index(CellPos c) const { return c.row * cols_ + c.col; }
    /** @brief Célula correspondente a um índice linear. */
    CellPos cell_of(int idx) const { return CellPos{idx / cols_, idx % cols_}; }
    /** @brief Total de células. */
    int size() const { return rows_ * cols_; }

private:
    int rows_;               ///< Altura em células
    int cols_;               ///< Largura em células
    std::vector<int> cells_; ///< Armazenamento linear de códigos (linha-major)
};

} // namespace gridnav
