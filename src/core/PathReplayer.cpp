#include "PathReplayer.hpp"
#include <cstdio>
#include <cstdlib>

namespace gridnav {

/**
 * @brief Número de passos de um tile entre duas posições em pixels.
 */
static int tile_steps_between(PixelPos a, PixelPos b) {
    return (std::abs(a.x - b.x) + std::abs(a.y - b.y)) / TILE_SIZE;
}

ReplayResult PathReplayer::follow(const Path& path, PixelPos& agent, const std::atomic<bool>* cancel) {
    ReplayResult res{};
    for (size_t i = 0; i < path.size(); ++i) {
        const CellPos target = path[i];
        const PixelPos tp = to_pixel(target);
        res.last_target = target;

        int budget = tile_steps_between(agent, tp) + 1;
        while (agent != tp) {
            if (budget-- <= 0) {
                std::printf("REPLAY: stalled at (%d,%d) heading to (%d,%d)\n",
                            to_cell(agent).row, to_cell(agent).col, target.row, target.col);
                res.status = ReplayStatus::Stalled;
                return res;
            }
            if (cancel && cancel->load()) {
                std::printf("REPLAY: cancelled after %d steps\n", res.steps);
                res.status = ReplayStatus::Cancelled;
                return res;
            }
            // x primeiro enquanto desalinhado, depois y: um único eixo por passo
            PixelPos next = agent;
            if (agent.x != tp.x) next.x += (tp.x > agent.x) ? TILE_SIZE : -TILE_SIZE;
            else                 next.y += (tp.y > agent.y) ? TILE_SIZE : -TILE_SIZE;

            if (!map_.is_walkable(to_cell(next))) continue; // passo bloqueado: ignora nesta iteração

            agent = next;
            res.steps++;
            redraw(path, i, agent);
        }
    }
    res.status = ReplayStatus::Completed;
    return res;
}

void PathReplayer::drawPath(const Path& path, size_t from) {
    if (!surface_) return;
    for (size_t i = from; i < path.size(); ++i) {
        const PixelPos p = to_pixel(path[i]);
        surface_->fillRect(p.x, p.y, TILE_SIZE, TILE_SIZE, PATH_COLOR);
    }
}

void PathReplayer::redraw(const Path& path, size_t from, PixelPos agent) {
    if (!surface_) return;
    surface_->drawLevel(map_);
    drawPath(path, from);
    // corpo do agente centralizado no tile
    surface_->fillRect(agent.x + TILE_SIZE/4, agent.y + TILE_SIZE/4, TILE_SIZE/2, TILE_SIZE/2, AGENT_COLOR);
    surface_->present();
    surface_->delayMs(delay_ms_);
}

} // namespace gridnav
