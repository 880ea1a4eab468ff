/**
 * @file Navigator.hpp
 * @brief Controlador de navegação do agente na grade (plataforma-agnóstico).
 */
#pragma once
#include <array>
#include <atomic>
#include <cstdint>
#include <memory>
#include <utility>
#include "Config.hpp"
#include "GridMap.hpp"
#include "PathReplayer.hpp"
#include "RenderSurface.hpp"
#include "Solver.hpp"

namespace gridnav {

/** @brief Entrada direcional única. */
enum class Direction : uint8_t { None, Up, Down, Left, Right };

/** @brief Resultado de `Navigator::moveToGoal`. */
enum class NavStatus : uint8_t {
    Reached,             ///< Caminho encontrado e percorrido até o objetivo
    SolverNotConfigured, ///< Estratégia pedida sem solver instalado
    GoalNotFound,        ///< Grade sem marcador de objetivo
    NoPath,              ///< Objetivo inalcançável a partir da posição atual
    Stalled,             ///< Replay interrompido por passo bloqueado
    Cancelled            ///< Replay cancelado externamente
};

/** @brief Nome legível do status (para logs). */
const char* nav_status_name(NavStatus s);

/**
 * @brief Dono da posição do agente e da tabela de solvers.
 *
 * A posição em pixels é a única fonte de verdade; a célula é sempre derivada
 * por divisão inteira pelo tamanho do tile.
 */
class Navigator {
public:
    /**
     * @brief Cria o navegador com o agente no ponto de nascimento.
     *
     * Solvers DFS e BFS vêm instalados; Dijkstra e A* começam vazios.
     *
     * @param map grade do nível atual (copiada)
     * @param surface superfície de desenho usada no replay (pode ser nullptr)
     */
    explicit Navigator(GridMap map, RenderSurface* surface = nullptr);

    // ---------- Movimento direto ----------
    /**
     * @brief Move um tile na direção dada, se permitido.
     *
     * O movimento só é aplicado se a célula prospectiva estiver na grade e
     * livre (verificação em células) e se a célula recalculada a partir dos
     * pixels prospectivos também não for parede (verificação em pixels).
     *
     * @return true se o agente se moveu
     */
    bool moveByDirection(Direction d);

    /** @brief Move a partir do estado das teclas (prioridade: cima, baixo, esquerda, direita). */
    bool moveByKeys(const KeyState& keys);

    /** @brief Coloca o agente no ponto de nascimento (um tile a partir da origem). */
    void resetPosition();

    // ---------- Navegação até o objetivo ----------
    /**
     * @brief Localiza o objetivo, calcula o caminho e o percorre.
     *
     * Sem solver instalado para a estratégia, ou sem objetivo na grade, nada
     * se move e o motivo é registrado no log.
     */
    NavStatus moveToGoal(Strategy s);
    NavStatus moveToGoalDfs()      { return moveToGoal(Strategy::DFS); }
    NavStatus moveToGoalBfs()      { return moveToGoal(Strategy::BFS); }
    NavStatus moveToGoalDijkstra() { return moveToGoal(Strategy::Dijkstra); }
    NavStatus moveToGoalAStar()    { return moveToGoal(Strategy::AStar); }

    // ---------- Solvers ----------
    /** @brief Instala o solver no slot da sua própria estratégia (substitui o anterior). */
    void setSolver(std::unique_ptr<Solver> solver);
    /** @brief Remove o solver da estratégia. */
    void clearSolver(Strategy s) { solvers_[slot(s)].reset(); }
    /** @brief Indica se há solver para a estratégia. */
    bool hasSolver(Strategy s) const { return solvers_[slot(s)] != nullptr; }
    /** @brief Acesso ao solver (nullptr se ausente). */
    Solver* solver(Strategy s) const { return solvers_[slot(s)].get(); }

    // ---------- Estado ----------
    /** @brief Posição em pixels (fonte de verdade). */
    PixelPos position() const { return agent_; }
    /** @brief Célula atual, derivada da posição em pixels. */
    CellPos cell() const { return to_cell(agent_); }

    /** @brief Troca o nível; o agente volta ao ponto de nascimento. */
    void setMap(GridMap map) { map_ = std::move(map); resetPosition(); }
    /** @brief Grade atual (somente leitura). */
    const GridMap& map() const { return map_; }

    /** @brief Define a superfície de desenho usada no replay. */
    void setSurface(RenderSurface* surface) { surface_ = surface; }
    /** @brief Flag de cancelamento verificada antes de cada passo do replay. */
    void setCancelToken(const std::atomic<bool>* cancel) { cancel_ = cancel; }
    /** @brief Pausa entre passos do replay. */
    void setStepDelay(uint32_t ms) { step_delay_ms_ = ms; }

    /** @brief Resumo do último replay executado. */
    const ReplayResult& lastReplay() const { return last_replay_; }

private:
    static size_t slot(Strategy s) { return static_cast<size_t>(s); }

    GridMap map_;                                                 ///< Nível atual
    RenderSurface* surface_{nullptr};                             ///< Destino do desenho
    PixelPos agent_{};                                            ///< Posição do agente em pixels
    std::array<std::unique_ptr<Solver>, STRATEGY_COUNT> solvers_; ///< Um slot por estratégia
    const std::atomic<bool>* cancel_{nullptr};                    ///< Cancelamento opcional
    uint32_t step_delay_ms_{STEP_DELAY_MS};                       ///< Cadência do replay
    ReplayResult last_replay_{};                                  ///< Último replay
};

} // namespace gridnav
