#include "minekb/game/grid.h"

#include <set>

#include <gtest/gtest.h>

namespace minekb {
namespace {

std::set<Cell> Adjacent(std::size_t rows, std::size_t cols,
                        const Cell& center) {
  std::set<Cell> cells;
  ForEachAdjacent(rows, cols, center, [&cells](const Cell& cell) {
    cells.insert(cell);
    return false;
  });
  return cells;
}

TEST(ForEachAdjacentTest, Corner) {
  EXPECT_EQ(Adjacent(3, 3, {0, 0}), (std::set<Cell>{{0, 1}, {1, 0}, {1, 1}}));
  EXPECT_EQ(Adjacent(3, 3, {2, 2}), (std::set<Cell>{{1, 1}, {1, 2}, {2, 1}}));
}

TEST(ForEachAdjacentTest, Edge) {
  EXPECT_EQ(Adjacent(3, 3, {0, 1}),
            (std::set<Cell>{{0, 0}, {0, 2}, {1, 0}, {1, 1}, {1, 2}}));
}

TEST(ForEachAdjacentTest, Center) {
  EXPECT_EQ(Adjacent(3, 3, {1, 1}).size(), 8u);
  EXPECT_EQ(Adjacent(3, 3, {1, 1}).count(Cell{1, 1}), 0u);
}

TEST(ForEachAdjacentTest, SingleCellHasNoNeighbors) {
  EXPECT_TRUE(Adjacent(1, 1, {0, 0}).empty());
}

TEST(ForEachAdjacentTest, CountsTrueResults) {
  const std::size_t count =
      ForEachAdjacent(3, 3, Cell{1, 1}, [](const Cell& cell) {
        return cell.row == 0;
      });
  EXPECT_EQ(count, 3u);
}

TEST(GridTest, DimensionsAndValidity) {
  Grid<int> grid(2, 3);
  EXPECT_EQ(grid.GetRows(), 2u);
  EXPECT_EQ(grid.GetCols(), 3u);
  EXPECT_TRUE(grid.IsValid({1, 2}));
  EXPECT_FALSE(grid.IsValid({2, 0}));
  EXPECT_FALSE(grid.IsValid({0, 3}));
}

TEST(GridTest, ValuesAreStoredPerCell) {
  Grid<int> grid(2, 2);
  grid({0, 1}) = 5;
  grid({1, 0}) = 7;

  int sum = 0;
  grid.ForEach([&sum](const Cell& cell, int value) {
    sum += value;
    if (cell == Cell{0, 0}) {
      EXPECT_EQ(value, 0);
    }
  });
  EXPECT_EQ(sum, 12);
  EXPECT_EQ(grid({0, 1}), 5);
}

TEST(GridTest, ResetClearsValues) {
  Grid<int> grid(2, 2);
  grid({1, 1}) = 3;
  grid.Reset(1, 4);
  EXPECT_EQ(grid.GetRows(), 1u);
  EXPECT_EQ(grid.GetCols(), 4u);
  EXPECT_EQ(grid({0, 3}), 0);
}

TEST(GridTest, MemberForEachAdjacentStaysInBounds) {
  const Grid<int> grid(2, 2);
  const std::size_t visited =
      grid.ForEachAdjacent(Cell{0, 0}, [](const Cell&) { return true; });
  EXPECT_EQ(visited, 3u);
}

}  // namespace
}  // namespace minekb
