#include "Planner.hpp"
#include <algorithm>
#include <queue>
#include <limits>

namespace gridnav {

namespace {

/** @brief Deslocamentos dos vizinhos: cima, direita, baixo, esquerda. */
constexpr int DR[4] = {-1, 0, 1, 0};
constexpr int DC[4] = {0, 1, 0, -1};

/** @brief Início e objetivo precisam estar na grade e fora de paredes. */
bool endpoints_ok(const GridMap& map, CellPos start, CellPos goal) {
    return map.is_walkable(start) && map.is_walkable(goal);
}

/** @brief Reconstrói o caminho seguindo `prev` do objetivo ao início. */
Path rebuild(const GridMap& map, const std::vector<int>& prev, CellPos start, CellPos goal) {
    Path path;
    const int s = map.index(start);
    for (int cur = map.index(goal); cur != -1; cur = prev[cur]) {
        path.push_back(map.cell_of(cur));
        if (cur == s) break;
    }
    std::reverse(path.begin(), path.end()); // reconstrói do goal ao start
    return path;
}

/** @brief Nó da fronteira priorizada (Dijkstra/A*). */
struct Frontier {
    int f;   ///< prioridade (custo ou custo + heurística)
    int h;   ///< desempate: menor estimativa restante primeiro
    int idx; ///< índice linear da célula
    bool operator>(const Frontier& o) const {
        if (f != o.f) return f > o.f;
        if (h != o.h) return h > o.h;
        return idx > o.idx;
    }
};

using MinQueue = std::priority_queue<Frontier, std::vector<Frontier>, std::greater<Frontier>>;

} // namespace

std::optional<Path> Planner::dfs_path(const GridMap& map, CellPos start, CellPos goal,
                                      std::vector<uint8_t>* visited_out) {
    if (!endpoints_ok(map, start, goal)) return std::nullopt;
    std::vector<uint8_t> visited(map.size(), 0);

    // Cada entrada guarda a célula e o próximo vizinho a tentar (0..3)
    struct Frame { CellPos cell; int next; };
    std::vector<Frame> stack;
    stack.push_back({start, 0});
    visited[map.index(start)] = 1;

    bool found = (start == goal);
    while (!found && !stack.empty()) {
        Frame& top = stack.back();
        if (top.next >= 4) { stack.pop_back(); continue; } // beco sem saída: retrocede
        const int d = top.next++;
        CellPos n{top.cell.row + DR[d], top.cell.col + DC[d]};
        if (!map.is_walkable(n)) continue;
        int j = map.index(n);
        if (visited[j]) continue;
        visited[j] = 1;
        stack.push_back({n, 0});
        if (n == goal) found = true;
    }
    if (visited_out) *visited_out = visited;
    if (!found) return std::nullopt;

    Path path;
    path.reserve(stack.size());
    for (const Frame& f : stack) path.push_back(f.cell);
    return path;
}

std::optional<Path> Planner::bfs_path(const GridMap& map, CellPos start, CellPos goal,
                                      std::vector<uint8_t>* visited_out) {
    if (!endpoints_ok(map, start, goal)) return std::nullopt;
    std::vector<int> prev(map.size(), -1);
    std::vector<uint8_t> visited(map.size(), 0);
    std::queue<CellPos> q;
    q.push(start);
    visited[map.index(start)] = 1;

    while (!q.empty()) {
        CellPos p = q.front(); q.pop();
        if (p == goal) break;
        for (int d = 0; d < 4; ++d) {
            CellPos n{p.row + DR[d], p.col + DC[d]};
            if (!map.is_walkable(n)) continue;
            int j = map.index(n);
            if (!visited[j]) { visited[j] = 1; prev[j] = map.index(p); q.push(n); }
        }
    }
    if (visited_out) *visited_out = visited;
    if (!visited[map.index(goal)]) return std::nullopt;
    return rebuild(map, prev, start, goal);
}

std::optional<Path> Planner::dijkstra_path(const GridMap& map, CellPos start, CellPos goal,
                                           const CostFn& cost, std::vector<uint8_t>* visited_out) {
    if (!endpoints_ok(map, start, goal)) return std::nullopt;
    const int INF = std::numeric_limits<int>::max();
    std::vector<int> dist(map.size(), INF);
    std::vector<int> prev(map.size(), -1);
    std::vector<uint8_t> done(map.size(), 0);
    const int s = map.index(start);
    const int g = map.index(goal);

    MinQueue open;
    dist[s] = 0;
    open.push({0, 0, s});
    while (!open.empty()) {
        Frontier cur = open.top(); open.pop();
        if (done[cur.idx]) continue; // entrada obsoleta
        done[cur.idx] = 1;
        if (cur.idx == g) break;
        CellPos p = map.cell_of(cur.idx);
        for (int d = 0; d < 4; ++d) {
            CellPos n{p.row + DR[d], p.col + DC[d]};
            if (!map.is_walkable(n)) continue;
            int j = map.index(n);
            if (done[j]) continue;
            int step = cost ? std::max(1, cost(map, n)) : 1;
            step = std::min(step, INF - 1 - dist[cur.idx]); // custo acumulado satura em INF-1
            int nd = dist[cur.idx] + step;
            if (nd < dist[j]) {
                dist[j] = nd;
                prev[j] = cur.idx;
                open.push({nd, 0, j});
            }
        }
    }
    if (visited_out) *visited_out = done;
    if (dist[g] == INF) return std::nullopt;
    return rebuild(map, prev, start, goal);
}

std::optional<Path> Planner::astar_path(const GridMap& map, CellPos start, CellPos goal,
                                        Heuristic h, std::vector<uint8_t>* visited_out) {
    if (!endpoints_ok(map, start, goal)) return std::nullopt;
    if (!h) h = &manhattan;
    const int INF = std::numeric_limits<int>::max();
    std::vector<int> g_score(map.size(), INF);
    std::vector<int> prev(map.size(), -1);
    std::vector<uint8_t> closed(map.size(), 0);
    const int s = map.index(start);
    const int g = map.index(goal);

    MinQueue open;
    g_score[s] = 0;
    int h0 = h(start, goal);
    open.push({h0, h0, s});
    while (!open.empty()) {
        Frontier cur = open.top(); open.pop();
        if (closed[cur.idx]) continue;
        closed[cur.idx] = 1;
        if (cur.idx == g) break;
        CellPos p = map.cell_of(cur.idx);
        for (int d = 0; d < 4; ++d) {
            CellPos n{p.row + DR[d], p.col + DC[d]};
            if (!map.is_walkable(n)) continue;
            int j = map.index(n);
            if (closed[j]) continue;
            int ng = g_score[cur.idx] + 1;
            if (ng < g_score[j]) {
                g_score[j] = ng;
                prev[j] = cur.idx;
                int hn = h(n, goal);
                open.push({ng + hn, hn, j});
            }
        }
    }
    if (visited_out) *visited_out = closed;
    if (g_score[g] == INF) return std::nullopt;
    return rebuild(map, prev, start, goal);
}

bool Planner::is_valid_path(const GridMap& map, const Path& path) {
    for (size_t i = 0; i < path.size(); ++i) {
        if (!map.is_walkable(path[i])) return false;
        if (i > 0 && manhattan(path[i-1], path[i]) != 1) return false;
    }
    return true;
}

} // namespace gridnav
