/**
 * @file SdlSurface.hpp
 * @brief Implementação de `gridnav::RenderSurface` e leitura de teclado com SDL2.
 *
 * A janela e o renderer são criados pelo chamador (simulador); esta classe
 * apenas desenha sobre o `SDL_Renderer` recebido, aplicando um deslocamento
 * (ox, oy) a todas as coordenadas em pixels do núcleo.
 *
 * Durante `delayMs()` os eventos pendentes são processados: ESC ou fechar a
 * janela levantam a flag de cancelamento, permitindo interromper um replay
 * longo.
 *
 * @since 0.1
 */
#pragma once
#include <SDL2/SDL.h>
#include <atomic>
#include <cstdint>
#include "core/RenderSurface.hpp"

namespace hal {

/**
 * @brief Superfície de desenho SDL2.
 *
 * Thread-safety: SDL exige uso a partir da thread que criou a janela.
 */
class SdlSurface : public gridnav::RenderSurface {
public:
    /**
     * @param ren renderer já inicializado (não é destruído por esta classe)
     * @param ox deslocamento horizontal da origem da grade
     * @param oy deslocamento vertical da origem da grade
     */
    SdlSurface(SDL_Renderer* ren, int ox, int oy) : ren_(ren), ox_(ox), oy_(oy) {}

    void drawLevel(const gridnav::GridMap& map) override;
    void fillRect(int x, int y, int w, int h, gridnav::Color color) override;
    void present() override;
    void delayMs(uint32_t ms) override;

    /** @brief Estado atual das setas (SDL_GetKeyboardState). */
    gridnav::KeyState readKeys() const;

    /** @brief Flag levantada por ESC/fechar durante um replay. */
    const std::atomic<bool>* cancelFlag() const { return &cancel_; }
    /** @brief Baixa a flag de cancelamento antes de um novo replay. */
    void clearCancel() { cancel_.store(false); }
    /** @brief Indica se o usuário pediu para fechar a janela durante um replay. */
    bool quitRequested() const { return quit_; }

private:
    SDL_Renderer* ren_;
    int ox_, oy_;
    std::atomic<bool> cancel_{false};
    bool quit_{false};
};

} // namespace hal
