// Main program to play with a text user interface.
//
// Uses a solver that keeps a knowledge base of the board: cells it can prove
// safe are uncovered and cells it can prove to be mines are flagged. The "a"
// command asks it for a move when nothing is certain.
//
// Usage: minekb_assisted_tui [--trace] [difficulty] [seed]

#include <cstdio>
#include <ctime>
#include <iostream>
#include <memory>
#include <string>

#include <fmt/format.h>

#include "minekb/game/game.h"
#include "minekb/game/options.h"
#include "minekb/solver/knowledge.h"
#include "minekb/solver/solver.h"
#include "minekb/ui/text_ui.h"

int main(int argc, char** argv) {
  minekb::Options options{minekb::kBeginnerDifficulty,
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
  auto ui = minekb::ui::NewTextUi(std::cin, std::cout);

  ui->Play(*game, *solver);

  return 0;
}
