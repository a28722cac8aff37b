#ifndef MINEKB_GAME_OPTIONS_H_
#define MINEKB_GAME_OPTIONS_H_

#include <cstddef>
#include <string>

namespace minekb {

// The dimensions and mine count of a game.
struct Difficulty {
  std::size_t rows;
  std::size_t cols;
  std::size_t mines;
};

// Premade common difficulties.
extern const Difficulty kClassicDifficulty;
extern const Difficulty kBeginnerDifficulty;
extern const Difficulty kIntermediateDifficulty;
extern const Difficulty kExpertDifficulty;

// Maps "classic", "beginner", "intermediate" or "expert" to the matching
// premade difficulty.
//
// Returns false (and leaves difficulty untouched) for any other name.
bool ParseDifficulty(const std::string& name, Difficulty* difficulty);

// Settings shared by the command line programs.
struct Options {
  Difficulty difficulty;

  // Seed for mine placement and for random moves.
  unsigned seed;

  // Write the inference trace to stderr.
  bool trace;
};

// Parses the command line:
//   program [--trace] [difficulty] [seed]
//
// Missing arguments keep the values already in options. On failure returns
// false and describes the problem in error.
bool ParseOptions(int argc, const char* const argv[], Options* options,
                  std::string* error);

}  // namespace minekb

#endif  // MINEKB_GAME_OPTIONS_H_
