#ifndef MINEKB_SOLVER_KNOWLEDGE_BASE_H_
#define MINEKB_SOLVER_KNOWLEDGE_BASE_H_

#include <cstddef>
#include <set>
#include <vector>

#include "minekb/game/cell.h"
#include "minekb/solver/sentence.h"

namespace minekb {
namespace solver {

// Everything known about one game: the sentences believed true, and the cells
// that have been played, confirmed safe or confirmed mines.
//
// Once a cell is confirmed safe or a mine it is removed from every live
// sentence, so no sentence ever refers to a resolved cell. Live sentences are
// distinct and never empty once Prune has run.
//
// The knowledge base only records facts. Deriving new facts is the job of
// InferenceEngine.
class KnowledgeBase {
 public:
  KnowledgeBase() = default;
  ~KnowledgeBase() = default;

  // Not copyable. A game session owns exactly one knowledge base.
  KnowledgeBase(const KnowledgeBase&) = delete;
  KnowledgeBase& operator=(const KnowledgeBase&) = delete;

  // Records that the cell has been played.
  void RecordMove(const Cell& cell) { moves_made_.insert(cell); }

  // Returns true if the cell has been played.
  bool HasMadeMove(const Cell& cell) const {
    return moves_made_.count(cell) != 0;
  }

  // Records that the cell is a mine and removes it from every sentence.
  // Idempotent.
  void MarkMine(const Cell& cell);

  // Records that the cell is safe and removes it from every sentence.
  // Idempotent.
  void MarkSafe(const Cell& cell);

  // Adds the sentence unless it is empty or an equal sentence is already
  // present.
  //
  // Returns true if the sentence was added.
  bool AddSentence(const Sentence& sentence);

  // Returns true if an equal sentence is present.
  bool Contains(const Sentence& sentence) const;

  // Removes empty sentences and collapses duplicates, keeping the first copy
  // of each. Dropping an empty sentence whose count is not zero makes the
  // knowledge base inconsistent.
  void Prune();

  // Applies every confirmed mine and safe cell to a sentence that is not
  // (yet) part of the knowledge base.
  void Resolve(Sentence* sentence) const;

  // Returns true if the cell is a confirmed mine.
  bool IsMine(const Cell& cell) const { return mines_.count(cell) != 0; }

  // Returns true if the cell is confirmed safe.
  bool IsSafe(const Cell& cell) const { return safes_.count(cell) != 0; }

  // Returns the cells known to be safe that have not been played yet.
  std::set<Cell> GetConfirmedSafe() const;

  // Returns the confirmed mines.
  const std::set<Cell>& GetMines() const { return mines_; }

  // Returns every confirmed safe cell, played or not.
  const std::set<Cell>& GetSafes() const { return safes_; }

  // Returns the cells that have been played.
  const std::set<Cell>& GetMovesMade() const { return moves_made_; }

  // Returns the live sentences.
  const std::vector<Sentence>& GetSentences() const { return sentences_; }

  // Returns false if some cell was confirmed both safe and a mine, or if some
  // sentence has a count outside [0, |cells|].
  bool IsConsistent() const;

 private:
  std::set<Cell> moves_made_;
  std::set<Cell> safes_;
  std::set<Cell> mines_;
  std::vector<Sentence> sentences_;

  // Set when a cell ends up in both safes_ and mines_, or when Prune drops an
  // empty sentence with a nonzero count.
  bool conflict_ = false;
};

}  // namespace solver
}  // namespace minekb

#endif  // MINEKB_SOLVER_KNOWLEDGE_BASE_H_
