/**
 * @file tests/test_path_replayer.cpp
 * @brief Testes do replay: passos unitários, ordem x-antes-de-y, desenho e travamento.
 *
 * Como executar:
 * - Via CTest: `ctest -R test_path_replayer`
 */
#include "unity.h"
#include "core/PathReplayer.hpp"
#include <atomic>
#include <vector>

using namespace gridnav;

void setUp() {}
void tearDown() {}

/** @brief Superfície que grava a sequência de posições do agente desenhadas. */
struct RecordingSurface : RenderSurface {
    std::vector<PixelPos> agent_frames;
    int path_rects{0};
    int presents{0};
    int delays{0};
    void drawLevel(const GridMap&) override {}
    void fillRect(int x, int y, int w, int h, Color color) override {
        if (color.r == AGENT_COLOR.r && color.g == AGENT_COLOR.g) {
            agent_frames.push_back(PixelPos{x - TILE_SIZE/4, y - TILE_SIZE/4});
        } else {
            TEST_ASSERT_EQUAL_INT(TILE_SIZE, w);
            TEST_ASSERT_EQUAL_INT(TILE_SIZE, h);
            path_rects++;
        }
    }
    void present() override { presents++; }
    void delayMs(uint32_t) override { delays++; }
};

static PixelPos px(int row, int col) { return to_pixel(CellPos{row, col}); }

void test_follow_moves_one_tile_per_step() {
    GridMap m(4,4);
    RecordingSurface s;
    PathReplayer rp(m, &s, 0);
    PixelPos agent = px(0,0);
    Path p{{0,0},{0,1},{1,1},{2,1},{2,2}};
    ReplayResult r = rp.follow(p, agent);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)ReplayStatus::Completed, (uint8_t)r.status);
    TEST_ASSERT_EQUAL_INT(4, r.steps);
    TEST_ASSERT_TRUE(agent == px(2,2));
    TEST_ASSERT_EQUAL_INT(4, (int)s.agent_frames.size());
    for (size_t i = 1; i < s.agent_frames.size(); ++i) {
        CellPos a = to_cell(s.agent_frames[i-1]);
        CellPos b = to_cell(s.agent_frames[i]);
        TEST_ASSERT_EQUAL_INT(1, manhattan(a, b));
    }
    TEST_ASSERT_EQUAL_INT(4, s.presents);
    TEST_ASSERT_EQUAL_INT(4, s.delays);
}

void test_overlay_draws_remaining_path_only() {
    GridMap m(1,4);
    RecordingSurface s;
    PathReplayer rp(m, &s, 0);
    PixelPos agent = px(0,0);
    Path p{{0,0},{0,1},{0,2},{0,3}};
    rp.follow(p, agent);
    // passos para alvos de índice 1, 2 e 3: sobreposição com 3, 2 e 1 células
    TEST_ASSERT_EQUAL_INT(3 + 2 + 1, s.path_rects);
}

void test_non_adjacent_target_moves_x_before_y() {
    GridMap m(3,3);
    RecordingSurface s;
    PathReplayer rp(m, &s, 0);
    PixelPos agent = px(0,0);
    ReplayResult r = rp.follow(Path{{2,2}}, agent);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)ReplayStatus::Completed, (uint8_t)r.status);
    TEST_ASSERT_EQUAL_INT(4, (int)s.agent_frames.size());
    TEST_ASSERT_TRUE(s.agent_frames[0] == px(0,1));
    TEST_ASSERT_TRUE(s.agent_frames[1] == px(0,2));
    TEST_ASSERT_TRUE(s.agent_frames[2] == px(1,2));
    TEST_ASSERT_TRUE(s.agent_frames[3] == px(2,2));
}

void test_blocked_step_stalls_instead_of_looping() {
    // Alvo além de uma parede: o eixo x é tentado primeiro e está bloqueado
    GridMap m(3,3);
    m.set({0,1}, CELL_WALL);
    RecordingSurface s;
    PathReplayer rp(m, &s, 0);
    PixelPos agent = px(0,0);
    ReplayResult r = rp.follow(Path{{0,0},{1,2}}, agent);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)ReplayStatus::Stalled, (uint8_t)r.status);
    TEST_ASSERT_EQUAL_INT(0, r.steps);
    TEST_ASSERT_EQUAL_INT(1, r.last_target.row);
    TEST_ASSERT_EQUAL_INT(2, r.last_target.col);
    TEST_ASSERT_TRUE(agent == px(0,0));
    TEST_ASSERT_EQUAL_INT(0, s.presents);
}

void test_empty_and_current_cell_paths_do_nothing() {
    GridMap m(3,3);
    RecordingSurface s;
    PathReplayer rp(m, &s, 0);
    PixelPos agent = px(1,1);
    ReplayResult r1 = rp.follow(Path{}, agent);
    ReplayResult r2 = rp.follow(Path{{1,1}}, agent);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)ReplayStatus::Completed, (uint8_t)r1.status);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)ReplayStatus::Completed, (uint8_t)r2.status);
    TEST_ASSERT_EQUAL_INT(0, r1.steps + r2.steps);
    TEST_ASSERT_EQUAL_INT(0, s.presents);
}

void test_cancel_is_checked_before_each_step() {
    GridMap m(1,5);
    std::atomic<bool> cancel{false};

    // Cancela de dentro da pausa do segundo passo
    struct CancellingSurface : RenderSurface {
        std::atomic<bool>* flag{nullptr};
        int delays{0};
        void drawLevel(const GridMap&) override {}
        void fillRect(int, int, int, int, Color) override {}
        void present() override {}
        void delayMs(uint32_t) override { if (++delays == 2) flag->store(true); }
    } s;
    s.flag = &cancel;

    PathReplayer rp(m, &s, 0);
    PixelPos agent = px(0,0);
    ReplayResult r = rp.follow(Path{{0,0},{0,1},{0,2},{0,3},{0,4}}, agent, &cancel);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)ReplayStatus::Cancelled, (uint8_t)r.status);
    TEST_ASSERT_EQUAL_INT(2, r.steps);
    TEST_ASSERT_TRUE(agent == px(0,2));
}

void test_null_surface_replays_headless() {
    GridMap m(2,2);
    PathReplayer rp(m, nullptr);
    PixelPos agent = px(0,0);
    ReplayResult r = rp.follow(Path{{0,0},{1,0},{1,1}}, agent);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)ReplayStatus::Completed, (uint8_t)r.status);
    TEST_ASSERT_TRUE(agent == px(1,1));
}

int main(int argc, char** argv) {
    UNITY_BEGIN();
    RUN_TEST(test_follow_moves_one_tile_per_step);
    RUN_TEST(test_overlay_draws_remaining_path_only);
    RUN_TEST(test_non_adjacent_target_moves_x_before_y);
    RUN_TEST(test_blocked_step_stalls_instead_of_looping);
    RUN_TEST(test_empty_and_current_cell_paths_do_nothing);
    RUN_TEST(test_cancel_is_checked_before_each_step);
    RUN_TEST(test_null_surface_replays_headless);
    return UNITY_END();
}
