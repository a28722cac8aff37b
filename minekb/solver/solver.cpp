#include "minekb/solver/solver.h"

#include "minekb/solver/knowledge.h"
#include "minekb/solver/nop.h"

namespace minekb {
namespace solver {

std::unique_ptr<Solver> New(Algorithm alg, Game& game, unsigned seed) {
  std::unique_ptr<Solver> solver;
  switch (alg) {
    case Algorithm::NONE:
      solver = nop::New();
      break;
    case Algorithm::KNOWLEDGE_BASE:
      solver = knowledge::New(game, seed);
      break;
    default:
      return nullptr;
  }
  game.Subscribe(solver.get());
  return solver;
}

}  // namespace solver
}  // namespace minekb
