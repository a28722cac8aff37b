#include "minekb/solver/move_selector.h"

#include <set>
#include <vector>

namespace minekb {
namespace solver {

namespace {

// Returns a uniformly chosen element of candidates, which must not be empty.
Cell Choose(const std::vector<Cell>& candidates,
            std::default_random_engine& rng) {
  std::uniform_int_distribution<std::size_t> d(0, candidates.size() - 1);
  return candidates[d(rng)];
}

}  // namespace

MoveSelector::MoveSelector(const KnowledgeBase& knowledge, std::size_t rows,
                           std::size_t cols, unsigned seed)
    : knowledge_(knowledge), rows_(rows), cols_(cols), rng_(seed) {}

bool MoveSelector::MakeSafeMove(Cell* cell) {
  const std::set<Cell> safes = knowledge_.GetConfirmedSafe();
  if (safes.empty()) {
    return false;
  }
  *cell = Choose(std::vector<Cell>(safes.begin(), safes.end()), rng_);
  return true;
}

bool MoveSelector::MakeRandomMove(Cell* cell) {
  std::vector<Cell> candidates;
  for (std::size_t row = 0; row < rows_; ++row) {
    for (std::size_t col = 0; col < cols_; ++col) {
      const Cell candidate{row, col};
      if (!knowledge_.HasMadeMove(candidate) && !knowledge_.IsMine(candidate)) {
        candidates.push_back(candidate);
      }
    }
  }
  if (candidates.empty()) {
    return false;
  }
  *cell = Choose(candidates, rng_);
  return true;
}

}  // namespace solver
}  // namespace minekb
