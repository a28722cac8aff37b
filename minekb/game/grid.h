#ifndef MINEKB_GAME_GRID_H_
#define MINEKB_GAME_GRID_H_

#include <cstddef>
#include <vector>

#include "minekb/game/cell.h"

namespace minekb {

// Visits the in-bounds neighbors of center on a rows x cols board, not center
// itself, and returns how many visits fn answered true.
template <class Fn>
std::size_t ForEachAdjacent(std::size_t rows, std::size_t cols,
                            const Cell& center, Fn fn) {
  // At the top and left edges center - 1 wraps around and fails the bounds
  // check.
  std::size_t count = 0;
  for (std::size_t row = center.row - 1; row != center.row + 2; ++row) {
    for (std::size_t col = center.col - 1; col != center.col + 2; ++col) {
      if (row >= rows || col >= cols) {
        continue;
      }
      if (row == center.row && col == center.col) {
        continue;
      }
      count += fn(Cell{row, col}) ? 1 : 0;
    }
  }
  return count;
}

// Represents a two dimensional grid of values, one per cell.
template <typename T>
class Grid {
 public:
  Grid() : Grid(0, 0) {}

  Grid(std::size_t rows, std::size_t cols) { Reset(rows, cols); }

  ~Grid() = default;

  Grid(const Grid&) = default;
  Grid& operator=(const Grid&) = default;
  Grid(Grid&&) = default;
  Grid& operator=(Grid&&) = default;

  // Resets the grid to default constructed values at the specified
  // dimensions.
  void Reset(std::size_t rows, std::size_t cols) {
    rows_ = rows;
    cols_ = cols;
    values_.assign(rows * cols, T());
  }

  std::size_t GetRows() const { return rows_; }

  std::size_t GetCols() const { return cols_; }

  // Returns true if the given cell lies within the grid.
  bool IsValid(const Cell& cell) const {
    return cell.row < rows_ && cell.col < cols_;
  }

  const T& operator()(const Cell& cell) const {
    return values_[cell.row * cols_ + cell.col];
  }

  T& operator()(const Cell& cell) {
    return values_[cell.row * cols_ + cell.col];
  }

  // Calls fn(cell, value) for every cell in row-major order.
  template <class Fn>
  void ForEach(Fn fn) {
    for (std::size_t row = 0; row < rows_; ++row) {
      for (std::size_t col = 0; col < cols_; ++col) {
        fn(Cell{row, col}, values_[row * cols_ + col]);
      }
    }
  }

  template <class Fn>
  void ForEach(Fn fn) const {
    for (std::size_t row = 0; row < rows_; ++row) {
      for (std::size_t col = 0; col < cols_; ++col) {
        fn(Cell{row, col}, values_[row * cols_ + col]);
      }
    }
  }

  // As the free ForEachAdjacent, bounded by this grid.
  template <class Fn>
  std::size_t ForEachAdjacent(const Cell& cell, Fn fn) const {
    return ::minekb::ForEachAdjacent(rows_, cols_, cell, fn);
  }

 private:
  std::size_t rows_;
  std::size_t cols_;
  std::vector<T> values_;
};

}  // namespace minekb

#endif  // MINEKB_GAME_GRID_H_
