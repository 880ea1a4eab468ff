#include "Navigator.hpp"
#include "GoalLocator.hpp"
#include <cstdio>

namespace gridnav {

const char* nav_status_name(NavStatus s) {
    switch (s) {
        case NavStatus::Reached:             return "reached";
        case NavStatus::SolverNotConfigured: return "solver not configured";
        case NavStatus::GoalNotFound:        return "goal not found";
        case NavStatus::NoPath:              return "no path";
        case NavStatus::Stalled:             return "stalled";
        case NavStatus::Cancelled:           return "cancelled";
    }
    return "?";
}

Navigator::Navigator(GridMap map, RenderSurface* surface)
    : map_(std::move(map)), surface_(surface) {
    solvers_[slot(Strategy::DFS)] = std::make_unique<DfsSolver>();
    solvers_[slot(Strategy::BFS)] = std::make_unique<BfsSolver>();
    resetPosition();
}

/**
 * @brief Aplica um passo de um tile após as verificações em células e em pixels.
 *
 * As duas verificações usam a mesma posição de origem (pixels), mas são
 * calculadas de forma independente: a célula prospectiva a partir da célula
 * atual e a célula derivada dos pixels prospectivos. Ambas precisam aprovar.
 *
 * @param d direção (None não faz nada)
 * @return true se a posição foi alterada
 */
bool Navigator::moveByDirection(Direction d) {
    CellPos next_cell = cell();
    PixelPos next_px = agent_;
    switch (d) {
        case Direction::Up:    next_cell.row -= 1; next_px.y -= TILE_SIZE; break;
        case Direction::Down:  next_cell.row += 1; next_px.y += TILE_SIZE; break;
        case Direction::Left:  next_cell.col -= 1; next_px.x -= TILE_SIZE; break;
        case Direction::Right: next_cell.col += 1; next_px.x += TILE_SIZE; break;
        case Direction::None:  return false;
    }
    const bool cell_ok  = map_.is_walkable(next_cell);
    const bool pixel_ok = map_.is_walkable(to_cell(next_px));
    if (!cell_ok || !pixel_ok) return false; // colisão: nada muda
    agent_ = next_px;
    return true;
}

bool Navigator::moveByKeys(const KeyState& keys) {
    Direction d = Direction::None;
    if (keys.up)         d = Direction::Up;
    else if (keys.down)  d = Direction::Down;
    else if (keys.left)  d = Direction::Left;
    else if (keys.right) d = Direction::Right;
    return moveByDirection(d);
}

void Navigator::resetPosition() {
    agent_ = to_pixel(CellPos{SPAWN_ROW, SPAWN_COL});
}

void Navigator::setSolver(std::unique_ptr<Solver> solver) {
    if (!solver) return;
    const size_t i = slot(solver->strategy());
    solvers_[i] = std::move(solver);
}

/**
 * @brief Fluxo completo: célula atual -> objetivo -> caminho -> replay.
 *
 * O A* usa sua própria localização de objetivo; as demais estratégias usam
 * `find_goal` diretamente.
 */
NavStatus Navigator::moveToGoal(Strategy s) {
    Solver* sv = solver(s);
    if (!sv) {
        std::printf("NAV: %s solver not configured\n", strategy_name(s));
        return NavStatus::SolverNotConfigured;
    }

    const CellPos start = cell();
    std::optional<CellPos> goal;
    if (auto* astar = dynamic_cast<AStarSolver*>(sv)) goal = astar->findGoal(map_);
    else goal = find_goal(map_);
    if (!goal) {
        std::printf("NAV: goal not found\n");
        return NavStatus::GoalNotFound;
    }

    auto path = sv->solve(map_, start, *goal);
    if (!path) {
        std::printf("NAV: %s found no path (%d,%d)->(%d,%d)\n", sv->name(),
                    start.row, start.col, goal->row, goal->col);
        return NavStatus::NoPath;
    }
    std::printf("NAV: %s path len=%d visited=%d\n", sv->name(),
                static_cast<int>(path->size()), sv->visitedCount());

    PathReplayer replayer(map_, surface_, step_delay_ms_);
    last_replay_ = replayer.follow(*path, agent_, cancel_);
    switch (last_replay_.status) {
        case ReplayStatus::Completed: return NavStatus::Reached;
        case ReplayStatus::Stalled:   return NavStatus::Stalled;
        case ReplayStatus::Cancelled: return NavStatus::Cancelled;
    }
    return NavStatus::Stalled;
}

} // namespace gridnav
