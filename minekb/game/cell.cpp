#include "minekb/game/cell.h"

#include <fmt/format.h>

namespace minekb {

std::string ToString(const Cell& cell) {
  return fmt::format("({}, {})", cell.row, cell.col);
}

std::ostream& operator<<(std::ostream& out, const Cell& cell) {
  return out << ToString(cell);
}

}  // namespace minekb
