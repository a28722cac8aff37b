#include "minekb/solver/sentence.h"

#include <set>

#include <gtest/gtest.h>

namespace minekb {
namespace solver {
namespace {

const Cell kA{0, 0};
const Cell kB{0, 1};
const Cell kC{0, 2};
const Cell kD{1, 0};

TEST(SentenceTest, MarkMineRemovesCellAndDecrementsCount) {
  Sentence sentence({kA, kB, kC}, 2);
  sentence.MarkMine(kB);
  EXPECT_EQ(sentence.GetCells(), (std::set<Cell>{kA, kC}));
  EXPECT_EQ(sentence.GetCount(), 1);
}

TEST(SentenceTest, MarkMineIgnoresOtherCells) {
  Sentence sentence({kA, kB}, 1);
  sentence.MarkMine(kD);
  EXPECT_EQ(sentence, Sentence({kA, kB}, 1));
}

TEST(SentenceTest, MarkSafeRemovesCellAndKeepsCount) {
  Sentence sentence({kA, kB, kC}, 2);
  sentence.MarkSafe(kA);
  EXPECT_EQ(sentence.GetCells(), (std::set<Cell>{kB, kC}));
  EXPECT_EQ(sentence.GetCount(), 2);

  // Marking again changes nothing.
  sentence.MarkSafe(kA);
  EXPECT_EQ(sentence, Sentence({kB, kC}, 2));
}

TEST(SentenceTest, KnownMinesWhenCountMatchesSize) {
  std::set<Cell> mines;
  EXPECT_TRUE(Sentence({kA, kB}, 2).KnownMines(&mines));
  EXPECT_EQ(mines, (std::set<Cell>{kA, kB}));

  EXPECT_FALSE(Sentence({kA, kB}, 1).KnownMines(&mines));
  EXPECT_FALSE(Sentence({kA, kB}, 0).KnownMines(&mines));
}

TEST(SentenceTest, KnownMinesOfEmptySentenceIsEmpty) {
  std::set<Cell> mines{kD};
  EXPECT_TRUE(Sentence({}, 0).KnownMines(&mines));
  EXPECT_TRUE(mines.empty());
}

TEST(SentenceTest, KnownSafesWhenCountIsZero) {
  std::set<Cell> safes;
  EXPECT_TRUE(Sentence({kA, kC}, 0).KnownSafes(&safes));
  EXPECT_EQ(safes, (std::set<Cell>{kA, kC}));

  EXPECT_FALSE(Sentence({kA, kC}, 1).KnownSafes(&safes));
}

TEST(SentenceTest, EqualityIsByValue) {
  EXPECT_EQ(Sentence({kA, kB}, 1), Sentence({kB, kA}, 1));
  EXPECT_NE(Sentence({kA, kB}, 1), Sentence({kA, kB}, 2));
  EXPECT_NE(Sentence({kA, kB}, 1), Sentence({kA, kC}, 1));
}

TEST(SentenceTest, Consistency) {
  EXPECT_TRUE(Sentence({}, 0).IsConsistent());
  EXPECT_TRUE(Sentence({kA, kB}, 2).IsConsistent());
  EXPECT_FALSE(Sentence({kA, kB}, 3).IsConsistent());
  EXPECT_FALSE(Sentence({kA}, -1).IsConsistent());
  EXPECT_FALSE(Sentence({}, 1).IsConsistent());

  // Marking a mine in a zero count sentence breaks the invariant.
  Sentence sentence({kA, kB}, 0);
  sentence.MarkMine(kA);
  EXPECT_FALSE(sentence.IsConsistent());
}

TEST(SentenceTest, SubsetAndDifference) {
  const Sentence superset({kA, kB, kC}, 2);
  const Sentence subset({kA, kB}, 1);

  EXPECT_TRUE(subset.IsSubsetOf(superset));
  EXPECT_TRUE(superset.IsSubsetOf(superset));
  EXPECT_FALSE(superset.IsSubsetOf(subset));
  EXPECT_FALSE(Sentence({kA, kD}, 1).IsSubsetOf(superset));
  EXPECT_TRUE(Sentence({}, 0).IsSubsetOf(superset));

  EXPECT_EQ(superset.Difference(subset), Sentence({kC}, 1));
}

TEST(SentenceTest, ToString) {
  EXPECT_EQ(ToString(Sentence({kB, kA}, 1)), "{(0, 0), (0, 1)} = 1");
  EXPECT_EQ(ToString(Sentence({}, 0)), "{} = 0");
}

}  // namespace
}  // namespace solver
}  // namespace minekb
