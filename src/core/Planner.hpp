#pragma once
#include <vector>
#include <optional>
#include <functional>
#include <cstdint>
#include "GridMap.hpp"

/**
 * @file Planner.hpp
 * @brief Algoritmos de busca de caminho em grade (DFS, BFS, Dijkstra, A*).
 *
 * Todos compartilham o mesmo contrato: dada a grade, a célula inicial e a
 * célula objetivo, retornam a sequência de células do início ao objetivo
 * (ambos inclusos) ou std::nullopt quando não há caminho. Movimento em 4
 * direções (cima, direita, baixo, esquerda) com custo unitário.
 *
 * "Sem caminho" é um resultado normal: objetivo inalcançável, início/objetivo
 * fora da grade ou sobre parede. Nenhuma função lança exceção.
 */

namespace gridnav {

/**
 * @brief Custo de entrar em uma célula (Dijkstra). Deve ser >= 1.
 *
 * Quando vazio, o custo é uniforme (1 por passo). O custo acumulado satura
 * em `INT_MAX - 1`, então custos muito grandes não estouram.
 */
using CostFn = std::function<int(const GridMap&, CellPos)>;

/**
 * @brief Heurística de distância restante para o A*.
 *
 * Precisa ser admissível (nunca superestimar) para garantir o caminho mínimo.
 */
using Heuristic = int (*)(CellPos from, CellPos goal);

/**
 * @brief Planejador de caminhos sobre `GridMap`.
 *
 * Os parâmetros `visited` opcionais recebem, ao final, uma marcação (0/1) por
 * célula indicando o que foi expandido pela busca.
 */
class Planner {
public:
    /**
     * @brief Busca em profundidade com pilha explícita e retrocesso.
     *
     * Ordem fixa de vizinhos: cima, direita, baixo, esquerda. Retorna algum
     * caminho válido, não necessariamente o mais curto.
     */
    static std::optional<Path> dfs_path(const GridMap& map, CellPos start, CellPos goal,
                                        std::vector<uint8_t>* visited = nullptr);

    /**
     * @brief Busca em largura (fila FIFO); caminho com número mínimo de passos.
     */
    static std::optional<Path> bfs_path(const GridMap& map, CellPos start, CellPos goal,
                                        std::vector<uint8_t>* visited = nullptr);

    /**
     * @brief Dijkstra com fila de prioridade por custo acumulado.
     * @param cost custo por célula; vazio = uniforme
     */
    static std::optional<Path> dijkstra_path(const GridMap& map, CellPos start, CellPos goal,
                                             const CostFn& cost = CostFn{},
                                             std::vector<uint8_t>* visited = nullptr);

    /**
     * @brief A* ordenando a fronteira por g + h.
     * @param h heurística admissível (Manhattan por padrão)
     */
    static std::optional<Path> astar_path(const GridMap& map, CellPos start, CellPos goal,
                                          Heuristic h = &manhattan,
                                          std::vector<uint8_t>* visited = nullptr);

    /**
     * @brief Verifica se o caminho é contínuo: passos unitários sobre células livres.
     */
    static bool is_valid_path(const GridMap& map, const Path& path);
};

} // namespace gridnav
