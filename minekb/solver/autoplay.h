#ifndef MINEKB_SOLVER_AUTOPLAY_H_
#define MINEKB_SOLVER_AUTOPLAY_H_

#include <cstddef>

#include "minekb/game/game.h"
#include "minekb/solver/solver.h"

namespace minekb {
namespace solver {

// Summary of a game played by a solver alone.
struct AutoplayResult {
  // WIN or LOSS, or PLAYING if the solver ran out of moves.
  Game::State state;

  // Actions executed, including flags.
  std::size_t actions;

  // Cells uncovered without being known to be safe.
  std::size_t guesses;

  // True if the game was lost on a guess. A loss on a move the solver claimed
  // was safe means the solver deduced something false.
  bool lost_on_guess;
};

// Lets the solver play the game to the end. Whenever analysis yields no
// actions the solver's suggestion is uncovered.
//
// The solver must already be subscribed to the game.
AutoplayResult Autoplay(Game& game, Solver& solver);

}  // namespace solver
}  // namespace minekb

#endif  // MINEKB_SOLVER_AUTOPLAY_H_
