#ifndef MINEKB_SOLVER_SOLVER_H_
#define MINEKB_SOLVER_SOLVER_H_

#include <memory>
#include <vector>

#include "minekb/game/cell.h"
#include "minekb/game/game.h"

namespace minekb {
namespace solver {

// Available solvers.
enum class Algorithm {
  // Never acts; the player does everything.
  NONE,

  // Deduce safe cells and mines with a knowledge base of sentences.
  KNOWLEDGE_BASE,
};

// A cell the solver recommends uncovering when Analyze has nothing to offer.
struct Suggestion {
  Cell cell;

  // True if the cell is not known to be safe.
  bool guess;
};

class Solver : public EventSubscriber {
 public:
  virtual ~Solver() = default;

  // Returns actions that are certain to be correct given what the solver has
  // seen. An empty result means nothing is certain; the caller then asks the
  // player, or calls Suggest.
  virtual std::vector<Action> Analyze() = 0;

  // Recommends a single cell to uncover, guessing if nothing is known to be
  // safe.
  //
  // Returns false if the Solver has no recommendation.
  virtual bool Suggest(Suggestion* suggestion) = 0;
};

// Creates a new solver for the specified algorithm. The seed drives any random
// choices the solver makes.
//
// The solver is subscribed to game before it is returned.
std::unique_ptr<Solver> New(Algorithm alg, Game& game, unsigned seed);

}  // namespace solver
}  // namespace minekb

#endif  // MINEKB_SOLVER_SOLVER_H_
