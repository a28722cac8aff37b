#ifndef MINEKB_UI_TEXT_UI_H_
#define MINEKB_UI_TEXT_UI_H_

#include <iosfwd>
#include <memory>

#include "minekb/game/game.h"
#include "minekb/solver/solver.h"

namespace minekb {
namespace ui {

// A text user interface based on iostreams.
//
// Commands, one per line:
//   u <row> <col>   Uncover a cell.
//   c <row> <col>   Chord a cell.
//   f <row> <col>   Toggle the flag on a cell.
//   a               Uncover the cell the solver suggests.
//   q               Quit.
class TextUi {
 public:
  virtual ~TextUi() = default;

  // Plays the game until it is over, the player quits, or input ends.
  //
  // Before each prompt the solver is queried, and any actions it recommends
  // are executed. If the solver does not recommend any actions, the user is
  // prompted for an action.
  virtual void Play(Game& game, solver::Solver& solver) = 0;
};

// Returns a new text user interface for the given iostreams.
std::unique_ptr<TextUi> NewTextUi(std::istream& in, std::ostream& out);

}  // namespace ui
}  // namespace minekb

#endif  // MINEKB_UI_TEXT_UI_H_
