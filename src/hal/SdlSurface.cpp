/**
 * @file SdlSurface.cpp
 * @brief Desenho da grade, sobreposições e pausa com processamento de eventos.
 *
 * Cores:
 * - Fundo: preto; linhas da grade: cinza escuro.
 * - Paredes: azul; objetivo: amarelo.
 *
 * @since 0.1
 */
#include "hal/SdlSurface.hpp"

namespace hal {

using gridnav::CellPos;
using gridnav::TILE_SIZE;

void SdlSurface::drawLevel(const gridnav::GridMap& map) {
    SDL_SetRenderDrawColor(ren_, 0, 0, 0, 255);
    SDL_RenderClear(ren_);
    for (int r = 0; r < map.rows(); ++r) {
        for (int c = 0; c < map.cols(); ++c) {
            const int code = map.at(CellPos{r, c});
            if (code == gridnav::CELL_OPEN) continue;
            if (code == gridnav::CELL_WALL) SDL_SetRenderDrawColor(ren_, 40, 60, 200, 255);
            else SDL_SetRenderDrawColor(ren_, 230, 200, 0, 255);
            SDL_Rect rc{ ox_ + c*TILE_SIZE, oy_ + r*TILE_SIZE, TILE_SIZE, TILE_SIZE };
            SDL_RenderFillRect(ren_, &rc);
        }
    }
    // grade para orientar a visualização
    SDL_SetRenderDrawColor(ren_, 40, 40, 40, 255);
    const int w = map.cols() * TILE_SIZE;
    const int h = map.rows() * TILE_SIZE;
    for (int r = 0; r <= map.rows(); ++r) SDL_RenderDrawLine(ren_, ox_, oy_ + r*TILE_SIZE, ox_ + w, oy_ + r*TILE_SIZE);
    for (int c = 0; c <= map.cols(); ++c) SDL_RenderDrawLine(ren_, ox_ + c*TILE_SIZE, oy_, ox_ + c*TILE_SIZE, oy_ + h);
}

void SdlSurface::fillRect(int x, int y, int w, int h, gridnav::Color color) {
    SDL_SetRenderDrawColor(ren_, color.r, color.g, color.b, color.a);
    SDL_Rect rc{ ox_ + x, oy_ + y, w, h };
    SDL_RenderFillRect(ren_, &rc);
}

void SdlSurface::present() {
    SDL_RenderPresent(ren_);
}

/**
 * @brief Aguarda `ms` milissegundos mantendo a janela responsiva.
 *
 * Eventos consumidos aqui não voltam ao laço principal; só ESC e fechar a
 * janela têm efeito (cancelamento do replay).
 */
void SdlSurface::delayMs(uint32_t ms) {
    SDL_Delay(ms);
    SDL_Event e;
    while (SDL_PollEvent(&e)) {
        if (e.type == SDL_QUIT) { quit_ = true; cancel_.store(true); }
        if (e.type == SDL_KEYDOWN && e.key.keysym.sym == SDLK_ESCAPE) cancel_.store(true);
    }
}

gridnav::KeyState SdlSurface::readKeys() const {
    const Uint8* ks = SDL_GetKeyboardState(nullptr);
    gridnav::KeyState k;
    k.up    = ks[SDL_SCANCODE_UP] != 0;
    k.down  = ks[SDL_SCANCODE_DOWN] != 0;
    k.left  = ks[SDL_SCANCODE_LEFT] != 0;
    k.right = ks[SDL_SCANCODE_RIGHT] != 0;
    return k;
}

} // namespace hal
