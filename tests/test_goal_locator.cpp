/**
 * @file tests/test_goal_locator.cpp
 * @brief Testes da localização do objetivo na grade.
 *
 * Como executar:
 * - Via CTest: `ctest -R test_goal_locator`
 */
#include "unity.h"
#include "core/GoalLocator.hpp"

using namespace gridnav;

void setUp() {}
void tearDown() {}

void test_find_goal_returns_marked_cell() {
    GridMap m(4, 7);
    m.set({2,5}, CELL_GOAL);
    auto g = find_goal(m);
    TEST_ASSERT_TRUE(g.has_value());
    TEST_ASSERT_EQUAL_INT(2, g->row);
    TEST_ASSERT_EQUAL_INT(5, g->col);
}

void test_find_goal_without_marker_returns_none() {
    GridMap m(4, 7);
    m.set({1,1}, CELL_WALL);
    TEST_ASSERT_FALSE(find_goal(m).has_value());
}

void test_find_goal_picks_first_in_row_major_order() {
    GridMap m(5, 5);
    m.set({3,0}, CELL_GOAL);
    m.set({1,4}, CELL_GOAL);
    m.set({1,2}, CELL_GOAL);
    auto g = find_goal(m);
    TEST_ASSERT_TRUE(g.has_value());
    TEST_ASSERT_EQUAL_INT(1, g->row);
    TEST_ASSERT_EQUAL_INT(2, g->col);
}

int main(int argc, char** argv) {
    UNITY_BEGIN();
    RUN_TEST(test_find_goal_returns_marked_cell);
    RUN_TEST(test_find_goal_without_marker_returns_none);
    RUN_TEST(test_find_goal_picks_first_in_row_major_order);
    return UNITY_END();
}
