#include "minekb/solver/autoplay.h"

#include <memory>
#include <vector>

#include <gtest/gtest.h>

#include "minekb/game/game.h"
#include "minekb/game/options.h"
#include "minekb/solver/solver.h"

namespace minekb {
namespace solver {
namespace {

TEST(AutoplayTest, EmptyBoardIsWonWithOneMove) {
  std::unique_ptr<Game> game = NewGame(4, 4, std::vector<Cell>{});
  ASSERT_NE(game, nullptr);
  std::unique_ptr<Solver> solver = New(Algorithm::KNOWLEDGE_BASE, *game, 1);

  const AutoplayResult result = Autoplay(*game, *solver);
  EXPECT_EQ(result.state, Game::State::WIN);
  EXPECT_EQ(result.actions, 1u);
  EXPECT_EQ(result.guesses, 1u);
  EXPECT_FALSE(result.lost_on_guess);
}

TEST(AutoplayTest, BoardOfMinesIsLostOnTheFirstGuess) {
  std::unique_ptr<Game> game = NewGame(2, 2, 4, 3);
  ASSERT_NE(game, nullptr);
  std::unique_ptr<Solver> solver = New(Algorithm::KNOWLEDGE_BASE, *game, 3);

  const AutoplayResult result = Autoplay(*game, *solver);
  EXPECT_EQ(result.state, Game::State::LOSS);
  EXPECT_EQ(result.guesses, 1u);
  EXPECT_TRUE(result.lost_on_guess);
}

TEST(AutoplayTest, NopSolverStopsImmediately) {
  std::unique_ptr<Game> game = NewGame(3, 3, 1, 0);
  ASSERT_NE(game, nullptr);
  std::unique_ptr<Solver> solver = New(Algorithm::NONE, *game, 0);

  const AutoplayResult result = Autoplay(*game, *solver);
  EXPECT_EQ(result.state, Game::State::NEW);
  EXPECT_EQ(result.actions, 0u);
}

class AutoplaySeedTest : public ::testing::TestWithParam<unsigned> {};

// Deductions are sound, so a game can only be lost on a guess.
TEST_P(AutoplaySeedTest, NeverLosesOnADeducedMove) {
  const Difficulty& difficulty = kBeginnerDifficulty;
  std::unique_ptr<Game> game = NewGame(difficulty.rows, difficulty.cols,
                                       difficulty.mines, GetParam());
  ASSERT_NE(game, nullptr);
  std::unique_ptr<Solver> solver =
      New(Algorithm::KNOWLEDGE_BASE, *game, GetParam());

  const AutoplayResult result = Autoplay(*game, *solver);
  ASSERT_TRUE(game->IsGameOver());
  EXPECT_GE(result.guesses, 1u);
  if (result.state == Game::State::LOSS) {
    EXPECT_TRUE(result.lost_on_guess);
  }
}

INSTANTIATE_TEST_SUITE_P(Seeds, AutoplaySeedTest, ::testing::Range(0u, 30u));

}  // namespace
}  // namespace solver
}  // namespace minekb
