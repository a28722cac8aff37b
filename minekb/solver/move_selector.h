#ifndef MINEKB_SOLVER_MOVE_SELECTOR_H_
#define MINEKB_SOLVER_MOVE_SELECTOR_H_

#include <cstddef>
#include <random>

#include "minekb/game/cell.h"
#include "minekb/solver/knowledge_base.h"

namespace minekb {
namespace solver {

// Chooses the next cell to uncover from what a knowledge base knows.
//
// The selector only reads the knowledge base, which must outlive it.
class MoveSelector {
 public:
  MoveSelector(const KnowledgeBase& knowledge, std::size_t rows,
               std::size_t cols, unsigned seed);

  // Picks a random cell that is known to be safe and has not been played.
  //
  // Returns false if no such cell exists.
  bool MakeSafeMove(Cell* cell);

  // Picks a random cell that has not been played and is not a known mine.
  //
  // Returns false if no such cell exists.
  bool MakeRandomMove(Cell* cell);

 private:
  const KnowledgeBase& knowledge_;
  const std::size_t rows_;
  const std::size_t cols_;
  std::default_random_engine rng_;
};

}  // namespace solver
}  // namespace minekb

#endif  // MINEKB_SOLVER_MOVE_SELECTOR_H_
