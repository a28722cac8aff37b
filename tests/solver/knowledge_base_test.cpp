#include "minekb/solver/knowledge_base.h"

#include <set>
#include <vector>

#include <gtest/gtest.h>

namespace minekb {
namespace solver {
namespace {

const Cell kA{0, 0};
const Cell kB{0, 1};
const Cell kC{0, 2};
const Cell kD{1, 0};

TEST(KnowledgeBaseTest, MarkMineUpdatesEverySentence) {
  KnowledgeBase knowledge;
  knowledge.AddSentence(Sentence({kA, kB}, 1));
  knowledge.AddSentence(Sentence({kA, kC, kD}, 2));

  knowledge.MarkMine(kA);

  EXPECT_TRUE(knowledge.IsMine(kA));
  EXPECT_EQ(knowledge.GetSentences(),
            (std::vector<Sentence>{Sentence({kB}, 0), Sentence({kC, kD}, 1)}));
}

TEST(KnowledgeBaseTest, MarkSafeUpdatesEverySentence) {
  KnowledgeBase knowledge;
  knowledge.AddSentence(Sentence({kA, kB}, 1));
  knowledge.AddSentence(Sentence({kB, kC}, 1));

  knowledge.MarkSafe(kB);

  EXPECT_TRUE(knowledge.IsSafe(kB));
  EXPECT_EQ(knowledge.GetSentences(),
            (std::vector<Sentence>{Sentence({kA}, 1), Sentence({kC}, 1)}));
}

TEST(KnowledgeBaseTest, MarkingTwiceIsIdempotent) {
  KnowledgeBase once;
  KnowledgeBase twice;
  for (KnowledgeBase* knowledge : {&once, &twice}) {
    knowledge->AddSentence(Sentence({kA, kB, kC}, 2));
  }

  once.MarkMine(kA);
  once.MarkSafe(kB);
  twice.MarkMine(kA);
  twice.MarkMine(kA);
  twice.MarkSafe(kB);
  twice.MarkSafe(kB);

  EXPECT_EQ(once.GetMines(), twice.GetMines());
  EXPECT_EQ(once.GetSafes(), twice.GetSafes());
  EXPECT_EQ(once.GetSentences(), twice.GetSentences());
  EXPECT_EQ(twice.GetSentences(), (std::vector<Sentence>{Sentence({kC}, 1)}));
}

TEST(KnowledgeBaseTest, AddSentenceRejectsDuplicatesAndEmpty) {
  KnowledgeBase knowledge;
  EXPECT_TRUE(knowledge.AddSentence(Sentence({kA, kB}, 1)));
  EXPECT_FALSE(knowledge.AddSentence(Sentence({kB, kA}, 1)));
  EXPECT_FALSE(knowledge.AddSentence(Sentence({}, 0)));
  EXPECT_TRUE(knowledge.AddSentence(Sentence({kA, kB}, 2)));

  EXPECT_EQ(knowledge.GetSentences().size(), 2u);
  EXPECT_TRUE(knowledge.Contains(Sentence({kA, kB}, 1)));
  EXPECT_FALSE(knowledge.Contains(Sentence({kA}, 1)));
}

TEST(KnowledgeBaseTest, PruneDropsEmptyAndDuplicateSentences) {
  KnowledgeBase knowledge;
  knowledge.AddSentence(Sentence({kA, kC}, 1));
  knowledge.AddSentence(Sentence({kB, kC}, 1));
  knowledge.AddSentence(Sentence({kD}, 0));
  knowledge.AddSentence(Sentence({kA, kD}, 0));

  // Both of the first two sentences become {kC} = 1; the last two become
  // empty.
  knowledge.MarkSafe(kA);
  knowledge.MarkSafe(kB);
  knowledge.MarkSafe(kD);
  knowledge.Prune();

  EXPECT_EQ(knowledge.GetSentences(),
            (std::vector<Sentence>{Sentence({kC}, 1)}));
  EXPECT_TRUE(knowledge.IsConsistent());
}

TEST(KnowledgeBaseTest, ResolveAppliesKnownFacts) {
  KnowledgeBase knowledge;
  knowledge.MarkMine(kA);
  knowledge.MarkSafe(kB);

  Sentence sentence({kA, kB, kC}, 2);
  knowledge.Resolve(&sentence);
  EXPECT_EQ(sentence, Sentence({kC}, 1));
}

TEST(KnowledgeBaseTest, ConfirmedSafeExcludesMovesMade) {
  KnowledgeBase knowledge;
  knowledge.RecordMove(kA);
  knowledge.MarkSafe(kA);
  knowledge.MarkSafe(kB);

  EXPECT_TRUE(knowledge.HasMadeMove(kA));
  EXPECT_FALSE(knowledge.HasMadeMove(kB));
  EXPECT_EQ(knowledge.GetConfirmedSafe(), (std::set<Cell>{kB}));
  EXPECT_EQ(knowledge.GetSafes(), (std::set<Cell>{kA, kB}));
}

TEST(KnowledgeBaseTest, CellBothSafeAndMineIsInconsistent) {
  KnowledgeBase knowledge;
  knowledge.MarkSafe(kA);
  EXPECT_TRUE(knowledge.IsConsistent());
  knowledge.MarkMine(kA);
  EXPECT_FALSE(knowledge.IsConsistent());
}

TEST(KnowledgeBaseTest, ContradictorySentenceIsInconsistent) {
  KnowledgeBase knowledge;
  knowledge.AddSentence(Sentence({kA, kB}, 1));
  knowledge.MarkSafe(kA);
  knowledge.MarkSafe(kB);
  EXPECT_FALSE(knowledge.IsConsistent());

  // The empty sentence disappears, but the contradiction is remembered.
  knowledge.Prune();
  EXPECT_TRUE(knowledge.GetSentences().empty());
  EXPECT_FALSE(knowledge.IsConsistent());
}

}  // namespace
}  // namespace solver
}  // namespace minekb
