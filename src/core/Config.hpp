/**
 * @file Config.hpp
 * @brief Parâmetros de configuração em tempo de compilação (CFG_*).
 *
 * Podem ser sobrepostos via opções `-D` no CMake, por exemplo:
 * `cmake -DCFG_TILE_SIZE=32 -DCFG_STEP_DELAY_MS=50 ..`
 *
 * - `CFG_TILE_SIZE`: tamanho de uma célula em pixels (escala célula <-> pixel).
 * - `CFG_STEP_DELAY_MS`: pausa entre passos durante o replay do caminho.
 * - `CFG_SPAWN_ROW`/`CFG_SPAWN_COL`: célula de nascimento do agente.
 */
#pragma once

#ifndef CFG_TILE_SIZE
#define CFG_TILE_SIZE 40
#endif
#ifndef CFG_STEP_DELAY_MS
#define CFG_STEP_DELAY_MS 100
#endif
#ifndef CFG_SPAWN_ROW
#define CFG_SPAWN_ROW 1
#endif
#ifndef CFG_SPAWN_COL
#define CFG_SPAWN_COL 1
#endif

namespace gridnav {

constexpr int TILE_SIZE     = CFG_TILE_SIZE;     ///< Pixels por célula
constexpr int STEP_DELAY_MS = CFG_STEP_DELAY_MS; ///< Pausa entre passos do replay
constexpr int SPAWN_ROW     = CFG_SPAWN_ROW;     ///< Linha de nascimento
constexpr int SPAWN_COL     = CFG_SPAWN_COL;     ///< Coluna de nascimento

static_assert(TILE_SIZE > 0, "CFG_TILE_SIZE must be positive");

} // namespace gridnav
