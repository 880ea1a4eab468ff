/**
 * @file tests/test_grid_map.cpp
 * @brief Testes de limites, caminhabilidade e conversão célula <-> pixel.
 *
 * Como executar:
 * - Via CTest: `ctest -R test_grid_map`
 * - Ou executando diretamente o binário deste teste.
 */
#include "unity.h"
#include "core/GridMap.hpp"

using namespace gridnav;

void setUp() {}
void tearDown() {}

static GridMap small_map() {
    auto g = GridMap::from_rows({
        {0, 1, 0},
        {0, 3, 1},
    });
    return *g;
}

void test_in_bounds_is_independent_of_cell_code() {
    GridMap m = small_map();
    TEST_ASSERT_EQUAL_INT(2, m.rows());
    TEST_ASSERT_EQUAL_INT(3, m.cols());
    TEST_ASSERT_TRUE(m.in_bounds({0,1}));   // parede, mas dentro
    TEST_ASSERT_TRUE(m.in_bounds({1,2}));
    TEST_ASSERT_FALSE(m.in_bounds({2,0}));
    TEST_ASSERT_FALSE(m.in_bounds({0,3}));
    TEST_ASSERT_FALSE(m.in_bounds({-1,0}));
    TEST_ASSERT_FALSE(m.in_bounds({0,-1}));
}

void test_walkable_excludes_walls_and_out_of_bounds() {
    GridMap m = small_map();
    TEST_ASSERT_TRUE(m.is_walkable({0,0}));
    TEST_ASSERT_FALSE(m.is_walkable({0,1}));
    TEST_ASSERT_TRUE(m.is_walkable({1,1}));  // objetivo é caminhável
    TEST_ASSERT_FALSE(m.is_walkable({1,2}));
    TEST_ASSERT_FALSE(m.is_walkable({5,5}));
    TEST_ASSERT_FALSE(m.is_walkable({-1,-1}));
    TEST_ASSERT_TRUE(m.is_goal({1,1}));
    TEST_ASSERT_FALSE(m.is_goal({0,0}));
}

void test_from_rows_rejects_ragged_rows() {
    auto g = GridMap::from_rows({ {0,0,0}, {0,0} });
    TEST_ASSERT_FALSE(g.has_value());
}

void test_set_ignores_out_of_bounds() {
    GridMap m(2,2);
    m.set({3,3}, CELL_WALL);
    m.set({1,0}, CELL_WALL);
    TEST_ASSERT_EQUAL_INT(CELL_WALL, m.at({1,0}));
    TEST_ASSERT_EQUAL_INT(CELL_OPEN, m.at({0,0}));
}

void test_cell_pixel_round_trip_for_all_cells() {
    GridMap m(7, 9);
    for (int r = 0; r < m.rows(); ++r) {
        for (int c = 0; c < m.cols(); ++c) {
            PixelPos p = to_pixel({r,c});
            TEST_ASSERT_EQUAL_INT(c * TILE_SIZE, p.x);
            TEST_ASSERT_EQUAL_INT(r * TILE_SIZE, p.y);
            CellPos back = to_cell(p);
            TEST_ASSERT_EQUAL_INT(r, back.row);
            TEST_ASSERT_EQUAL_INT(c, back.col);
        }
    }
}

void test_negative_pixels_map_outside_grid() {
    CellPos c = to_cell(PixelPos{-TILE_SIZE, 0});
    TEST_ASSERT_EQUAL_INT(-1, c.col);
    TEST_ASSERT_EQUAL_INT(0, c.row);
    c = to_cell(PixelPos{0, -1});
    TEST_ASSERT_EQUAL_INT(-1, c.row);
}

void test_manhattan_distance() {
    TEST_ASSERT_EQUAL_INT(0, manhattan({2,2}, {2,2}));
    TEST_ASSERT_EQUAL_INT(8, manhattan({0,0}, {4,4}));
    TEST_ASSERT_EQUAL_INT(5, manhattan({3,1}, {0,3}));
}

int main(int argc, char** argv) {
    UNITY_BEGIN();
    RUN_TEST(test_in_bounds_is_independent_of_cell_code);
    RUN_TEST(test_walkable_excludes_walls_and_out_of_bounds);
    RUN_TEST(test_from_rows_rejects_ragged_rows);
    RUN_TEST(test_set_ignores_out_of_bounds);
    RUN_TEST(test_cell_pixel_round_trip_for_all_cells);
    RUN_TEST(test_negative_pixels_map_outside_grid);
    RUN_TEST(test_manhattan_distance);
    return UNITY_END();
}
