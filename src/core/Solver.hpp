/**
 * @file Solver.hpp
 * @brief Estratégias de busca nomeadas, intercambiáveis pelo controlador.
 */
#pragma once
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>
#include "GridMap.hpp"
#include "Planner.hpp"

namespace gridnav {

/** @brief Estratégias de busca disponíveis. */
enum class Strategy : uint8_t { DFS, BFS, Dijkstra, AStar };

/** @brief Quantidade de estratégias (tamanho da tabela de solvers). */
constexpr int STRATEGY_COUNT = 4;

/** @brief Nome legível da estratégia (para logs e título da janela). */
const char* strategy_name(Strategy s);

/**
 * @brief Solver de caminho ligado a um algoritmo.
 *
 * Sem estado entre chamadas além do cache do último caminho e do conjunto de
 * células expandidas, úteis para visualização e diagnóstico.
 */
class Solver {
public:
    virtual ~Solver() = default;

    /** @brief Estratégia implementada (define o slot no controlador). */
    virtual Strategy strategy() const = 0;

    /** @brief Nome da estratégia. */
    const char* name() const { return strategy_name(strategy()); }

    /**
     * @brief Calcula um caminho e atualiza o cache.
     * @return caminho do início ao objetivo, ou std::nullopt se não houver
     */
    std::optional<Path> solve(const GridMap& map, CellPos start, CellPos goal);

    /** @brief Último caminho encontrado (vazio se a última busca falhou). */
    const Path& lastPath() const { return last_path_; }
    /** @brief Marcação (0/1) das células expandidas na última busca. */
    const std::vector<uint8_t>& lastVisited() const { return last_visited_; }
    /** @brief Número de células expandidas na última busca. */
    int visitedCount() const;

protected:
    /** @brief Executa o algoritmo concreto. */
    virtual std::optional<Path> search(const GridMap& map, CellPos start, CellPos goal,
                                       std::vector<uint8_t>& visited) = 0;

private:
    Path last_path_{};                  ///< Cache do último caminho
    std::vector<uint8_t> last_visited_; ///< Cache das células expandidas
};

/** @brief Busca em profundidade. */
class DfsSolver : public Solver {
public:
    Strategy strategy() const override { return Strategy::DFS; }
protected:
    std::optional<Path> search(const GridMap& map, CellPos start, CellPos goal,
                               std::vector<uint8_t>& visited) override;
};

/** @brief Busca em largura. */
class BfsSolver : public Solver {
public:
    Strategy strategy() const override { return Strategy::BFS; }
protected:
    std::optional<Path> search(const GridMap& map, CellPos start, CellPos goal,
                               std::vector<uint8_t>& visited) override;
};

/**
 * @brief Dijkstra com custo por célula opcional (uniforme por padrão).
 */
class DijkstraSolver : public Solver {
public:
    DijkstraSolver() = default;
    explicit DijkstraSolver(CostFn cost) : cost_(std::move(cost)) {}

    Strategy strategy() const override { return Strategy::Dijkstra; }
    /** @brief Define o custo por célula; vazio volta ao custo uniforme. */
    void setCost(CostFn cost) { cost_ = std::move(cost); }

protected:
    std::optional<Path> search(const GridMap& map, CellPos start, CellPos goal,
                               std::vector<uint8_t>& visited) override;

private:
    CostFn cost_{};
};

/**
 * @brief A* com heurística configurável (Manhattan por padrão).
 *
 * Também expõe a localização do objetivo, pois a escolha da heurística
 * depende do objetivo escolhido.
 */
class AStarSolver : public Solver {
public:
    AStarSolver() = default;
    explicit AStarSolver(Heuristic h) : heuristic_(h ? h : &manhattan) {}

    Strategy strategy() const override { return Strategy::AStar; }

    /** @brief Define a heurística; nullptr volta para Manhattan. */
    void setHeuristic(Heuristic h) { heuristic_ = h ? h : &manhattan; }
    /** @brief Heurística atual. */
    Heuristic heuristic() const { return heuristic_; }

    /** @brief Localiza o objetivo na grade (delegando a `find_goal`). */
    std::optional<CellPos> findGoal(const GridMap& map) const;

protected:
    std::optional<Path> search(const GridMap& map, CellPos start, CellPos goal,
                               std::vector<uint8_t>& visited) override;

private:
    Heuristic heuristic_{&manhattan};
};

} // namespace gridnav
