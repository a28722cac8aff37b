#ifndef MINEKB_SOLVER_KNOWLEDGE_H_
#define MINEKB_SOLVER_KNOWLEDGE_H_

#include <cstdio>
#include <memory>

#include "minekb/game/game.h"
#include "minekb/solver/solver.h"

namespace minekb {
namespace solver {
namespace knowledge {

// Provides a solver that keeps a knowledge base of sentences about the game.
//
// Every uncovered cell becomes an observation for an InferenceEngine, which
// deduces which covered cells are safe and which are mines. The solver:
//  - Uncovers every cell known to be safe.
//  - Flags every cell known to be a mine.
//  - Suggests a random known-safe cell, or failing that a random cell that is
//    not a known mine.
//
// Flags placed by the player are not treated as knowledge.
//
// If the observations ever contradict each other the solver stops producing
// actions and suggestions for the rest of the game.
std::unique_ptr<Solver> New(const Game& game, unsigned seed);

// As above, and writes the engine's inference trace to trace.
std::unique_ptr<Solver> New(const Game& game, unsigned seed,
                            std::FILE* trace);

}  // namespace knowledge
}  // namespace solver
}  // namespace minekb

#endif  // MINEKB_SOLVER_KNOWLEDGE_H_
