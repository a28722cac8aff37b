#include "minekb/game/options.h"

#include <cerrno>
#include <cstdlib>
#include <limits>
#include <vector>

#include <fmt/format.h>

namespace minekb {

const Difficulty kClassicDifficulty = {8, 8, 8};
const Difficulty kBeginnerDifficulty = {9, 9, 10};
const Difficulty kIntermediateDifficulty = {16, 16, 40};
const Difficulty kExpertDifficulty = {16, 30, 99};

namespace {

// Parses a non-negative decimal number that fits in an unsigned.
bool ParseSeed(const std::string& text, unsigned* seed) {
  if (text.empty() || text[0] < '0' || text[0] > '9') {
    return false;
  }
  char* end = nullptr;
  errno = 0;
  const unsigned long value = std::strtoul(text.c_str(), &end, 10);
  if (*end != '\0' || errno == ERANGE ||
      value > std::numeric_limits<unsigned>::max()) {
    return false;
  }
  *seed = static_cast<unsigned>(value);
  return true;
}

}  // namespace

bool ParseDifficulty(const std::string& name, Difficulty* difficulty) {
  if (name == "classic") {
    *difficulty = kClassicDifficulty;
  } else if (name == "beginner") {
    *difficulty = kBeginnerDifficulty;
  } else if (name == "intermediate") {
    *difficulty = kIntermediateDifficulty;
  } else if (name == "expert") {
    *difficulty = kExpertDifficulty;
  } else {
    return false;
  }
  return true;
}

bool ParseOptions(int argc, const char* const argv[], Options* options,
                  std::string* error) {
  std::vector<std::string> positional;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--trace") {
      options->trace = true;
    } else if (arg.size() > 1 && arg[0] == '-') {
      *error = fmt::format("unknown flag '{}'", arg);
      return false;
    } else {
      positional.push_back(arg);
    }
  }

  if (positional.size() > 2) {
    *error = fmt::format(
        "usage: {} [--trace] [classic|beginner|intermediate|expert] [seed]",
        argc > 0 ? argv[0] : "minekb");
    return false;
  }

  if (!positional.empty() &&
      !ParseDifficulty(positional[0], &options->difficulty)) {
    *error = fmt::format("unknown difficulty '{}'", positional[0]);
    return false;
  }

  if (positional.size() > 1 && !ParseSeed(positional[1], &options->seed)) {
    *error = fmt::format("invalid seed '{}'", positional[1]);
    return false;
  }
  return true;
}

}  // namespace minekb
