#pragma once
#include <optional>
#include "GridMap.hpp"

/**
 * @file GoalLocator.hpp
 * @brief Localização do marcador de objetivo na grade.
 */

namespace gridnav {

/**
 * @brief Varre a grade em ordem linha-major procurando o código de objetivo.
 *
 * Com vários objetivos, retorna o menor (linha, coluna). Sem cache: quem
 * precisa de consultas repetidas deve guardar o resultado.
 *
 * @param map grade a varrer
 * @return célula do objetivo, ou std::nullopt se não houver marcador
 */
inline std::optional<CellPos> find_goal(const GridMap& map) {
    for (int r = 0; r < map.rows(); ++r) {
        for (int c = 0; c < map.cols(); ++c) {
            if (map.at({r, c}) == CELL_GOAL) return CellPos{r, c};
        }
    }
    return std::nullopt;
}

} // namespace gridnav
