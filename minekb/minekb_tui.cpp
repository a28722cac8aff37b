// Main program to play with a text user interface.
//
// Usage: minekb_tui [difficulty] [seed]

#include <cstdio>
#include <ctime>
#include <iostream>
#include <memory>
#include <string>

#include <fmt/format.h>

#include "minekb/game/game.h"
#include "minekb/game/options.h"
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
  auto solver =
      minekb::solver::New(minekb::solver::Algorithm::NONE, *game, options.seed);
  auto ui = minekb::ui::NewTextUi(std::cin, std::cout);

  ui->Play(*game, *solver);

  return 0;
}
