#ifndef MINEKB_GAME_CELL_H_
#define MINEKB_GAME_CELL_H_

#include <cstddef>
#include <functional>
#include <ostream>
#include <string>

namespace minekb {

// Represents the row/col location of a cell.
struct Cell {
  std::size_t row;
  std::size_t col;
};

inline bool operator==(const Cell& a, const Cell& b) {
  return a.row == b.row && a.col == b.col;
}

inline bool operator!=(const Cell& a, const Cell& b) {
  return a.row != b.row || a.col != b.col;
}

// Orders cells row by row.
inline bool operator<(const Cell& a, const Cell& b) {
  return a.row < b.row || (a.row == b.row && a.col < b.col);
}

// Returns the cell formatted as "(row, col)".
std::string ToString(const Cell& cell);

std::ostream& operator<<(std::ostream& out, const Cell& cell);

}  // namespace minekb

namespace std {

// Hash function for Cell.
template <>
struct hash<minekb::Cell> {
  // This is 2^64 / phi. Any irrational number would do. The goal is just
  // "random" bits.
  static constexpr std::size_t magic = 0x9e3779b97f4a7a97;

  std::size_t operator()(const minekb::Cell& cell) const {
    const std::hash<std::size_t> h;
    std::size_t seed = h(cell.row);
    seed ^= h(cell.col) + magic + (seed << 6) + (seed >> 2);
    return seed;
  }
};

}  // namespace std

#endif  // MINEKB_GAME_CELL_H_
