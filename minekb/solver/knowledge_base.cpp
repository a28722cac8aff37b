#include "minekb/solver/knowledge_base.h"

#include <algorithm>
#include <iterator>
#include <utility>

namespace minekb {
namespace solver {

void KnowledgeBase::MarkMine(const Cell& cell) {
  mines_.insert(cell);
  if (safes_.count(cell) != 0) {
    conflict_ = true;
  }
  for (Sentence& sentence : sentences_) {
    sentence.MarkMine(cell);
  }
}

void KnowledgeBase::MarkSafe(const Cell& cell) {
  safes_.insert(cell);
  if (mines_.count(cell) != 0) {
    conflict_ = true;
  }
  for (Sentence& sentence : sentences_) {
    sentence.MarkSafe(cell);
  }
}

bool KnowledgeBase::AddSentence(const Sentence& sentence) {
  if (sentence.IsEmpty() || Contains(sentence)) {
    return false;
  }
  sentences_.push_back(sentence);
  return true;
}

bool KnowledgeBase::Contains(const Sentence& sentence) const {
  return std::find(sentences_.begin(), sentences_.end(), sentence) !=
         sentences_.end();
}

void KnowledgeBase::Prune() {
  std::vector<Sentence> kept;
  kept.reserve(sentences_.size());
  for (Sentence& sentence : sentences_) {
    if (sentence.IsEmpty()) {
      // An empty sentence that still claims mines contradicts the facts that
      // emptied it.
      if (sentence.GetCount() != 0) {
        conflict_ = true;
      }
      continue;
    }
    if (std::find(kept.begin(), kept.end(), sentence) != kept.end()) {
      continue;
    }
    kept.push_back(std::move(sentence));
  }
  sentences_ = std::move(kept);
}

void KnowledgeBase::Resolve(Sentence* sentence) const {
  // Marking shrinks the sentence, so walk a copy of its cells.
  const std::set<Cell> cells = sentence->GetCells();
  for (const Cell& cell : cells) {
    if (IsMine(cell)) {
      sentence->MarkMine(cell);
    } else if (IsSafe(cell)) {
      sentence->MarkSafe(cell);
    }
  }
}

std::set<Cell> KnowledgeBase::GetConfirmedSafe() const {
  std::set<Cell> confirmed;
  std::set_difference(safes_.begin(), safes_.end(), moves_made_.begin(),
                      moves_made_.end(),
                      std::inserter(confirmed, confirmed.end()));
  return confirmed;
}

bool KnowledgeBase::IsConsistent() const {
  if (conflict_) {
    return false;
  }
  return std::all_of(
      sentences_.begin(), sentences_.end(),
      [](const Sentence& sentence) { return sentence.IsConsistent(); });
}

}  // namespace solver
}  // namespace minekb
