// Main program that lets the knowledge-base solver play a game by itself.
//
// The solver uncovers cells it can prove safe and flags cells it can prove to
// be mines. When nothing is certain it guesses a cell that is not a known
// mine.
//
// Usage: minekb_autoplay [--trace] [difficulty] [seed]

#include <cstdio>
#include <ctime>
#include <memory>
#include <string>

#include <fmt/format.h>

#include "minekb/game/game.h"
#include "minekb/game/options.h"
#include "minekb/solver/autoplay.h"
#include "minekb/solver/knowledge.h"
#include "minekb/solver/solver.h"

int main(int argc, char** argv) {
  minekb::Options options{minekb::kClassicDifficulty,
                          static_cast<unsigned>(std::time(nullptr)), false};
  std::string error;
  if (!minekb::ParseOptions(argc, argv, &options, &error)) {
    fmt::print(stderr, "{}\n", error);
    return 2;
  }

  const minekb::Difficulty& d = options.difficulty;
  auto game = minekb::NewGame(d.rows, d.cols, d.mines, options.seed);
  std::unique_ptr<minekb::solver::Solver> solver =
      minekb::solver::knowledge::New(*game, options.seed,
                                     options.trace ? stderr : nullptr);
  game->Subscribe(solver.get());

  const minekb::solver::AutoplayResult result =
      minekb::solver::Autoplay(*game, *solver);

  const char* outcome = "gave up";
  if (result.state == minekb::Game::State::WIN) {
    outcome = "won";
  } else if (result.state == minekb::Game::State::LOSS) {
    outcome = "lost";
  }
  fmt::print("{}x{} board, {} mines, seed {}: {} after {} actions, {} "
             "guesses\n",
             d.rows, d.cols, d.mines, options.seed, outcome, result.actions,
             result.guesses);

  if (result.state == minekb::Game::State::LOSS && !result.lost_on_guess) {
    fmt::print(stderr, "error: lost on a move deduced to be safe\n");
    return 1;
  }
  return 0;
}
