#include "minekb/solver/sentence.h"

#include <algorithm>
#include <iterator>

#include <fmt/format.h>

namespace minekb {
namespace solver {

bool Sentence::IsConsistent() const {
  return count_ >= 0 && static_cast<std::size_t>(count_) <= cells_.size();
}

bool Sentence::IsSubsetOf(const Sentence& other) const {
  return cells_.size() <= other.cells_.size() &&
         std::includes(other.cells_.begin(), other.cells_.end(),
                       cells_.begin(), cells_.end());
}

bool Sentence::KnownMines(std::set<Cell>* mines) const {
  if (count_ < 0 || static_cast<std::size_t>(count_) != cells_.size()) {
    return false;
  }
  *mines = cells_;
  return true;
}

bool Sentence::KnownSafes(std::set<Cell>* safes) const {
  if (count_ != 0) {
    return false;
  }
  *safes = cells_;
  return true;
}

void Sentence::MarkMine(const Cell& cell) {
  if (cells_.erase(cell) != 0) {
    --count_;
  }
}

void Sentence::MarkSafe(const Cell& cell) { cells_.erase(cell); }

Sentence Sentence::Difference(const Sentence& subset) const {
  std::set<Cell> cells;
  std::set_difference(cells_.begin(), cells_.end(), subset.cells_.begin(),
                      subset.cells_.end(), std::inserter(cells, cells.end()));
  return Sentence(std::move(cells), count_ - subset.count_);
}

std::string ToString(const Sentence& sentence) {
  std::string out = "{";
  bool first = true;
  for (const Cell& cell : sentence.GetCells()) {
    if (!first) {
      out += ", ";
    }
    first = false;
    out += minekb::ToString(cell);
  }
  return fmt::format("{}}} = {}", out, sentence.GetCount());
}

std::ostream& operator<<(std::ostream& out, const Sentence& sentence) {
  return out << ToString(sentence);
}

}  // namespace solver
}  // namespace minekb
