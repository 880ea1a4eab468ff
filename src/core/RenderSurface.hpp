/**
 * @file RenderSurface.hpp
 * @brief Interface da superfície de desenho/entrada usada pelo núcleo.
 *
 * O núcleo de navegação não cria janelas nem lê o teclado diretamente: ele
 * recebe uma implementação desta interface (ex.: SDL2 no simulador, ou um
 * registrador em memória nos testes).
 *
 * Thread-safety: não é thread-safe; o núcleo e a superfície compartilham o
 * mesmo contexto de execução.
 *
 * @since 0.1
 */
#pragma once
#include <cstdint>
#include "GridMap.hpp"

namespace gridnav {

/** @brief Cor RGBA de 8 bits por canal. */
struct Color {
    uint8_t r{0}, g{0}, b{0}, a{255};
};

/** @brief Verde usado na sobreposição do caminho. */
constexpr Color PATH_COLOR{0, 255, 0, 255};
/** @brief Vermelho usado no corpo do agente. */
constexpr Color AGENT_COLOR{200, 0, 0, 255};

/** @brief Estado das teclas direcionais no quadro atual. */
struct KeyState {
    bool up{false};    ///< Seta para cima pressionada
    bool down{false};  ///< Seta para baixo pressionada
    bool left{false};  ///< Seta para a esquerda pressionada
    bool right{false}; ///< Seta para a direita pressionada
};

/**
 * @brief Primitivas de desenho e temporização consumidas pelo núcleo.
 */
class RenderSurface {
public:
    virtual ~RenderSurface() = default;

    /** @brief Redesenha o nível atual (fundo, paredes, objetivo). */
    virtual void drawLevel(const GridMap& map) = 0;

    /**
     * @brief Preenche um retângulo em coordenadas de pixel.
     * @param x canto esquerdo
     * @param y canto superior
     * @param w largura
     * @param h altura
     * @param color cor de preenchimento
     */
    virtual void fillRect(int x, int y, int w, int h, Color color) = 0;

    /** @brief Apresenta o quadro desenhado. */
    virtual void present() = 0;

    /** @brief Pausa fixa em milissegundos (cadência do replay). */
    virtual void delayMs(uint32_t ms) = 0;
};

} // namespace gridnav
