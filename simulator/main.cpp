/**
 * @file simulator/main.cpp
 * @brief Simulador SDL2 do navegador em grade (visualização 2D).
 *
 * Mostra o agente (vermelho) em um labirinto de paredes (azul) com objetivo
 * (amarelo). O caminho calculado é sobreposto em verde durante o replay.
 *
 * Como executar:
 * - Habilite o alvo do simulador no CMake: `-DBUILD_SIM=ON`.
 * - Garanta a dependência da SDL2 instalada no sistema (dev headers).
 * - Rode `./gridnav_sim [nivel.txt]`. Sem argumento, escolha um nível de
 *   `maze/*.txt` ou o nível padrão embutido.
 *
 * Controles:
 * - Setas: mover o agente
 * - 1/2/3/4: ir ao objetivo com DFS/BFS/Dijkstra/A*
 * - R: voltar ao ponto de nascimento
 * - ESC: sair (durante um replay, cancela o replay)
 *
 * @since 0.1
 */
#include <SDL2/SDL.h>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <string>
#include <vector>
#include "core/GridMap.hpp"
#include "core/LevelLoader.hpp"
#include "core/Navigator.hpp"
#include "hal/SdlSurface.hpp"

using namespace gridnav;

/** @brief Diretório onde o menu procura níveis. */
static const char* LEVEL_DIR = "maze";

/** @brief Intervalo mínimo entre movimentos por tecla mantida (ms). */
static constexpr Uint32 KEY_REPEAT_MS = 120;

/**
 * @brief Nível embutido usado quando nenhum arquivo é escolhido.
 */
static GridMap default_level() {
    static const char* text =
        "1111111111111\n"
        "1000001000001\n"
        "1011101011101\n"
        "1010001010001\n"
        "1010111010111\n"
        "1000100000101\n"
        "1110101110101\n"
        "1000101000101\n"
        "1011101011101\n"
        "1000000000031\n"
        "1111111111111\n";
    auto g = LevelLoader::parse(text);
    return g ? *g : GridMap(3, 3);
}

/**
 * @brief Menu mínimo via título da janela: setas escolhem, Enter confirma.
 *
 * @param win janela para exibir a opção atual no título
 * @param ren renderer para limpar a tela enquanto o menu está ativo
 * @param level saída com o nível escolhido
 * @return false se o usuário fechou a janela ou apertou ESC
 */
static bool choose_level(SDL_Window* win, SDL_Renderer* ren, GridMap& level) {
    auto files = LevelLoader::listLevels(LEVEL_DIR);
    std::vector<std::string> items;
    items.push_back("Nivel padrao");
    for (auto& f : files) items.push_back(f);
    if (items.size() == 1) { level = default_level(); return true; }

    int sel = 0;
    SDL_SetWindowTitle(win, ("Escolha: " + items[sel]).c_str());
    for (;;) {
        SDL_Event e;
        while (SDL_PollEvent(&e)) {
            if (e.type == SDL_QUIT) return false;
            if (e.type != SDL_KEYDOWN) continue;
            const SDL_Keycode k = e.key.keysym.sym;
            if (k == SDLK_ESCAPE) return false;
            if (k == SDLK_UP || k == SDLK_DOWN) {
                const int n = static_cast<int>(items.size());
                sel = (k == SDLK_UP) ? (sel + n - 1) % n : (sel + 1) % n;
                SDL_SetWindowTitle(win, ("Escolha: " + items[sel]).c_str());
            } else if (k == SDLK_RETURN || k == SDLK_KP_ENTER) {
                if (sel == 0 || !LevelLoader::loadFile(files[sel-1], &level)) {
                    if (sel != 0) std::fprintf(stderr, "Falha ao carregar %s, usando nivel padrao.\n", items[sel].c_str());
                    level = default_level();
                }
                return true;
            }
        }
        SDL_SetRenderDrawColor(ren, 0, 0, 0, 255);
        SDL_RenderClear(ren);
        SDL_RenderPresent(ren);
        SDL_Delay(16);
    }
}

/**
 * @brief Ponto de entrada do simulador 2D com SDL2.
 *
 * @param argc Quantidade de argumentos.
 * @param argv argv[1] opcional: arquivo de nível.
 * @return 0 em término normal; 1 se ocorrer erro de inicialização SDL ou de nível.
 */
int main(int argc, char** argv) {
    if (SDL_Init(SDL_INIT_VIDEO) != 0) {
        std::fprintf(stderr, "SDL_Init error: %s\n", SDL_GetError());
        return 1;
    }
    const int OX = 20, OY = 20;
    SDL_Window* win = SDL_CreateWindow("Grid Navigator", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED, 800, 600, SDL_WINDOW_SHOWN);
    if (!win) {
        std::fprintf(stderr, "SDL_CreateWindow error: %s\n", SDL_GetError());
        SDL_Quit();
        return 1;
    }
    SDL_Renderer* ren = SDL_CreateRenderer(win, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
    if (!ren) {
        std::fprintf(stderr, "SDL_CreateRenderer error: %s\n", SDL_GetError());
        SDL_DestroyWindow(win);
        SDL_Quit();
        return 1;
    }

    GridMap level(1, 1);
    bool ok = true;
    if (argc > 1) {
        ok = LevelLoader::loadFile(argv[1], &level);
        if (!ok) std::fprintf(stderr, "Nivel invalido: %s\n", argv[1]);
    } else {
        ok = choose_level(win, ren, level);
    }
    if (!ok) {
        SDL_DestroyRenderer(ren);
        SDL_DestroyWindow(win);
        SDL_Quit();
        return argc > 1 ? 1 : 0;
    }
    SDL_SetWindowSize(win, level.cols()*TILE_SIZE + 2*OX, level.rows()*TILE_SIZE + 2*OY);

    hal::SdlSurface surface(ren, OX, OY);
    Navigator nav(level, &surface);
    nav.setSolver(std::make_unique<DijkstraSolver>());
    nav.setSolver(std::make_unique<AStarSolver>());
    nav.setCancelToken(surface.cancelFlag());

    const char* last_action = "-";
    Uint32 last_move = SDL_GetTicks();
    bool running = true;
    while (running) {
        SDL_Event e;
        while (SDL_PollEvent(&e)) {
            if (e.type == SDL_QUIT) running = false;
            if (e.type != SDL_KEYDOWN) continue;
            const SDL_Keycode k = e.key.keysym.sym;
            Strategy s{};
            bool go = true;
            switch (k) {
                case SDLK_ESCAPE: running = false; go = false; break;
                case SDLK_r: nav.resetPosition(); last_action = "reset"; go = false; break;
                case SDLK_1: s = Strategy::DFS; break;
                case SDLK_2: s = Strategy::BFS; break;
                case SDLK_3: s = Strategy::Dijkstra; break;
                case SDLK_4: s = Strategy::AStar; break;
                default: go = false; break;
            }
            if (!go) continue;
            surface.clearCancel();
            NavStatus st = nav.moveToGoal(s);
            std::printf("SIM: %s -> %s (steps=%d)\n", strategy_name(s), nav_status_name(st), nav.lastReplay().steps);
            last_action = nav_status_name(st);
            if (surface.quitRequested()) running = false;
        }

        Uint32 now = SDL_GetTicks();
        if (now - last_move >= KEY_REPEAT_MS) {
            if (nav.moveByKeys(surface.readKeys())) last_move = now;
        }

        surface.drawLevel(nav.map());
        const PixelPos p = nav.position();
        surface.fillRect(p.x + TILE_SIZE/4, p.y + TILE_SIZE/4, TILE_SIZE/2, TILE_SIZE/2, AGENT_COLOR);
        char title[160];
        const CellPos c = nav.cell();
        std::snprintf(title, sizeof(title), "Grid Navigator - cell=(%d,%d) last=%s", c.row, c.col, last_action);
        SDL_SetWindowTitle(win, title);
        surface.present();
        SDL_Delay(16);
    }
    SDL_DestroyRenderer(ren);
    SDL_DestroyWindow(win);
    SDL_Quit();
    return 0;
}
