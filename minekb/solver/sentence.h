#ifndef MINEKB_SOLVER_SENTENCE_H_
#define MINEKB_SOLVER_SENTENCE_H_

#include <cstddef>
#include <ostream>
#include <set>
#include <string>
#include <utility>

#include "minekb/game/cell.h"

namespace minekb {
namespace solver {

// A logical statement about a game: a set of cells, and the number of those
// cells that are mines.
//
// Sentences compare by value. Two sentences are equal when they hold the same
// cells and the same count.
//
// The count is signed so that a contradictory observation (a negative count,
// or more mines than cells) can be represented and detected instead of
// wrapping around.
class Sentence {
 public:
  Sentence() : count_(0) {}

  Sentence(std::set<Cell> cells, int count)
      : cells_(std::move(cells)), count_(count) {}

  // Returns the cells of the sentence.
  const std::set<Cell>& GetCells() const { return cells_; }

  // Returns the number of mines among the cells.
  int GetCount() const { return count_; }

  // Returns true if the sentence has no cells.
  bool IsEmpty() const { return cells_.empty(); }

  // Returns true if 0 <= count <= |cells|.
  bool IsConsistent() const;

  // Returns true if every cell of this sentence is also a cell of other.
  bool IsSubsetOf(const Sentence& other) const;

  // If every cell of the sentence is a mine (count == |cells|), stores the
  // cells in mines and returns true. Otherwise returns false.
  //
  // An empty sentence with a zero count yields an empty set.
  bool KnownMines(std::set<Cell>* mines) const;

  // If every cell of the sentence is safe (count == 0), stores the cells in
  // safes and returns true. Otherwise returns false.
  bool KnownSafes(std::set<Cell>* safes) const;

  // Updates the sentence given that cell is a mine. If the cell is part of the
  // sentence it is removed and the count drops by one.
  void MarkMine(const Cell& cell);

  // Updates the sentence given that cell is safe. If the cell is part of the
  // sentence it is removed; the count is unchanged.
  void MarkSafe(const Cell& cell);

  // Returns the sentence with the cells of subset removed and the count of
  // subset subtracted.
  //
  // Only meaningful when subset.IsSubsetOf(*this).
  Sentence Difference(const Sentence& subset) const;

 private:
  std::set<Cell> cells_;
  int count_;
};

inline bool operator==(const Sentence& a, const Sentence& b) {
  return a.GetCount() == b.GetCount() && a.GetCells() == b.GetCells();
}

inline bool operator!=(const Sentence& a, const Sentence& b) {
  return !(a == b);
}

// Returns the sentence formatted as "{(r, c), ...} = count".
std::string ToString(const Sentence& sentence);

std::ostream& operator<<(std::ostream& out, const Sentence& sentence);

}  // namespace solver
}  // namespace minekb

#endif  // MINEKB_SOLVER_SENTENCE_H_
