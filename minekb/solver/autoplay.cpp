#include "minekb/solver/autoplay.h"

#include <vector>

namespace minekb {
namespace solver {

AutoplayResult Autoplay(Game& game, Solver& solver) {
  AutoplayResult result{Game::State::NEW, 0, 0, false};

  while (!game.IsGameOver()) {
    std::vector<Action> actions = solver.Analyze();
    bool guess = false;
    if (actions.empty()) {
      Suggestion suggestion;
      if (!solver.Suggest(&suggestion)) {
        break;
      }
      guess = suggestion.guess;
      actions.push_back(Action{Action::Type::UNCOVER, suggestion.cell});
    }

    for (const Action& action : actions) {
      if (game.IsGameOver()) {
        break;
      }
      game.Execute(action);
      ++result.actions;
    }
    if (guess) {
      ++result.guesses;
      result.lost_on_guess = game.GetState() == Game::State::LOSS;
    }
  }

  result.state = game.GetState();
  return result;
}

}  // namespace solver
}  // namespace minekb
