#include "Solver.hpp"
#include "GoalLocator.hpp"
#include <algorithm>

namespace gridnav {

const char* strategy_name(Strategy s) {
    switch (s) {
        case Strategy::DFS:      return "DFS";
        case Strategy::BFS:      return "BFS";
        case Strategy::Dijkstra: return "Dijkstra";
        case Strategy::AStar:    return "A*";
    }
    return "?";
}

/**
 * @brief Executa a busca concreta e guarda caminho/visitados no cache.
 *
 * Em caso de falha o caminho em cache fica vazio, mas as células expandidas
 * são mantidas.
 */
std::optional<Path> Solver::solve(const GridMap& map, CellPos start, CellPos goal) {
    last_visited_.assign(map.size(), 0);
    auto p = search(map, start, goal, last_visited_);
    if (!p) { last_path_.clear(); return std::nullopt; }
    last_path_ = *p;
    return p;
}

int Solver::visitedCount() const {
    return static_cast<int>(std::count(last_visited_.begin(), last_visited_.end(), uint8_t{1}));
}

std::optional<Path> DfsSolver::search(const GridMap& map, CellPos start, CellPos goal,
                                      std::vector<uint8_t>& visited) {
    return Planner::dfs_path(map, start, goal, &visited);
}

std::optional<Path> BfsSolver::search(const GridMap& map, CellPos start, CellPos goal,
                                      std::vector<uint8_t>& visited) {
    return Planner::bfs_path(map, start, goal, &visited);
}

std::optional<Path> DijkstraSolver::search(const GridMap& map, CellPos start, CellPos goal,
                                           std::vector<uint8_t>& visited) {
    return Planner::dijkstra_path(map, start, goal, cost_, &visited);
}

std::optional<Path> AStarSolver::search(const GridMap& map, CellPos start, CellPos goal,
                                        std::vector<uint8_t>& visited) {
    return Planner::astar_path(map, start, goal, heuristic_, &visited);
}

std::optional<CellPos> AStarSolver::findGoal(const GridMap& map) const {
    return find_goal(map);
}

} // namespace gridnav
