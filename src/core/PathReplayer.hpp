/**
 * @file PathReplayer.hpp
 * @brief Reprodução de um caminho de células como passos unitários em pixels.
 */
#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include "Config.hpp"
#include "GridMap.hpp"
#include "RenderSurface.hpp"

namespace gridnav {

/** @brief Resultado do replay. */
enum class ReplayStatus : uint8_t {
    Completed, ///< Agente chegou à última célula do caminho
    Stalled,   ///< Um alvo não foi alcançado dentro do limite de iterações
    Cancelled  ///< Cancelado externamente antes de um passo
};

/** @brief Resumo de uma execução de replay. */
struct ReplayResult {
    ReplayStatus status{ReplayStatus::Completed}; ///< Como o replay terminou
    int steps{0};                                 ///< Passos efetivamente aplicados
    CellPos last_target{};                        ///< Último alvo tentado
};

/**
 * @brief Converte um caminho em movimentos de um tile por vez.
 *
 * Para cada célula alvo, em ordem, move no eixo x enquanto desalinhado e
 * depois no eixo y, nunca na diagonal. Cada passo é validado contra a grade
 * (pixel / TILE_SIZE) antes de ser aplicado; um passo inválido é apenas
 * ignorado naquela iteração. Cada alvo tem orçamento de
 * `manhattan(atual, alvo) + 1` iterações; esgotado, o replay termina com
 * `ReplayStatus::Stalled`.
 *
 * Após cada passo aplicado: redesenha o nível, a sobreposição do caminho
 * restante e o agente, apresenta o quadro e aguarda `step_delay_ms`.
 */
class PathReplayer {
public:
    /**
     * @param map grade (somente leitura)
     * @param surface superfície de desenho; nullptr executa sem desenhar
     * @param step_delay_ms pausa após cada passo
     */
    PathReplayer(const GridMap& map, RenderSurface* surface, uint32_t step_delay_ms = STEP_DELAY_MS)
        : map_(map), surface_(surface), delay_ms_(step_delay_ms) {}

    /**
     * @brief Percorre o caminho atualizando a posição do agente.
     * @param path células a visitar (a primeira pode ser a atual)
     * @param agent posição em pixels do agente (modificada a cada passo)
     * @param cancel flag opcional verificada antes de cada passo
     */
    ReplayResult follow(const Path& path, PixelPos& agent, const std::atomic<bool>* cancel = nullptr);

    /** @brief Desenha a sobreposição do caminho a partir do índice `from`. */
    void drawPath(const Path& path, size_t from = 0);

private:
    void redraw(const Path& path, size_t from, PixelPos agent);

    const GridMap& map_;
    RenderSurface* surface_;
    uint32_t delay_ms_;
};

} // namespace gridnav
