#include "minekb/solver/inference_engine.h"

#include <algorithm>
#include <set>
#include <string>
#include <utility>

#include <fmt/format.h>

#include "minekb/game/grid.h"

namespace minekb {
namespace solver {

namespace {

// Formats a set of cells as "{(r, c), ...}".
std::string CellsToString(const std::set<Cell>& cells) {
  std::string out = "{";
  for (const Cell& cell : cells) {
    if (out.size() > 1) {
      out += ", ";
    }
    out += minekb::ToString(cell);
  }
  return out + "}";
}

bool Contains(const std::vector<Sentence>& sentences,
              const Sentence& sentence) {
  return std::find(sentences.begin(), sentences.end(), sentence) !=
         sentences.end();
}

}  // namespace

InferenceEngine::InferenceEngine(std::size_t rows, std::size_t cols,
                                 KnowledgeBase& knowledge)
    : rows_(rows), cols_(cols), knowledge_(knowledge) {}

ObserveResult InferenceEngine::Observe(const Cell& cell, int count) {
  if (inconsistent_) {
    return ObserveResult::INCONSISTENT;
  }
  if (cell.row >= rows_ || cell.col >= cols_) {
    return ObserveResult::INVALID_CELL;
  }
  if (knowledge_.HasMadeMove(cell)) {
    return ObserveResult::OK;
  }

  knowledge_.RecordMove(cell);
  knowledge_.MarkSafe(cell);

  std::vector<Sentence> pending;
  pending.push_back(MakeSentence(cell, count));

  // Removing the cell from existing sentences may already settle some of
  // them.
  InferFromSubsets(&pending);
  if (!Saturate(&pending)) {
    return Fail(cell, "contradiction after marking the cell safe");
  }

  while (!pending.empty()) {
    Sentence sentence = std::move(pending.back());
    pending.pop_back();

    knowledge_.Resolve(&sentence);
    if (!sentence.IsConsistent()) {
      return Fail(cell, ToString(sentence).c_str());
    }
    if (!knowledge_.AddSentence(sentence)) {
      // Empty or already known.
      continue;
    }

    InferFromSubsets(&pending);
    if (!Saturate(&pending)) {
      return Fail(cell, "contradiction while marking mines and safes");
    }
    TraceState(fmt::format("added {}", ToString(sentence)), pending);
  }

  TraceState(fmt::format("fixpoint after observing {} = {}",
                         minekb::ToString(cell), count),
             pending);
  return ObserveResult::OK;
}

Sentence InferenceEngine::MakeSentence(const Cell& cell, int count) const {
  std::set<Cell> cells;
  int known_mines = 0;
  ForEachAdjacent(rows_, cols_, cell, [&](const Cell& neighbor) {
    if (knowledge_.IsMine(neighbor)) {
      ++known_mines;
    } else if (!knowledge_.IsSafe(neighbor)) {
      cells.insert(neighbor);
    }
    return false;
  });
  return Sentence(std::move(cells), count - known_mines);
}

void InferenceEngine::InferFromSubsets(std::vector<Sentence>* pending) const {
  const std::vector<Sentence>& sentences = knowledge_.GetSentences();
  for (const Sentence& superset : sentences) {
    if (superset.GetCount() == 0) {
      continue;
    }
    for (const Sentence& subset : sentences) {
      if (&subset == &superset || subset.GetCount() == 0 ||
          !subset.IsSubsetOf(superset)) {
        continue;
      }
      Sentence inferred = superset.Difference(subset);
      if (inferred.IsEmpty() || Contains(*pending, inferred) ||
          knowledge_.Contains(inferred)) {
        continue;
      }
      pending->push_back(std::move(inferred));
    }
  }
}

bool InferenceEngine::Saturate(std::vector<Sentence>* pending) {
  for (;;) {
    const std::size_t mines = knowledge_.GetMines().size();
    const std::size_t safes = knowledge_.GetSafes().size();

    // Marking rewrites the live sentences, so conclusions are read from a
    // snapshot. Every sentence in it was true when taken, so anything it
    // proves is still true.
    const std::vector<Sentence> snapshot = knowledge_.GetSentences();
    std::set<Cell> cells;
    for (const Sentence& sentence : snapshot) {
      if (sentence.KnownMines(&cells)) {
        for (const Cell& cell : cells) {
          knowledge_.MarkMine(cell);
        }
      }
      if (sentence.KnownSafes(&cells)) {
        for (const Cell& cell : cells) {
          knowledge_.MarkSafe(cell);
        }
      }
    }

    knowledge_.Prune();
    if (!knowledge_.IsConsistent() || !PrunePending(pending)) {
      return false;
    }

    if (knowledge_.GetMines().size() == mines &&
        knowledge_.GetSafes().size() == safes) {
      return true;
    }
    InferFromSubsets(pending);
  }
}

bool InferenceEngine::PrunePending(std::vector<Sentence>* pending) const {
  std::vector<Sentence> kept;
  kept.reserve(pending->size());
  for (Sentence& sentence : *pending) {
    knowledge_.Resolve(&sentence);
    if (!sentence.IsConsistent()) {
      return false;
    }
    if (sentence.IsEmpty() || knowledge_.Contains(sentence) ||
        Contains(kept, sentence)) {
      continue;
    }
    kept.push_back(std::move(sentence));
  }
  *pending = std::move(kept);
  return true;
}

ObserveResult InferenceEngine::Fail(const Cell& cell, const char* reason) {
  inconsistent_ = true;
  if (trace_ != nullptr) {
    fmt::print(trace_, "inconsistent observation at {}: {}\n",
               minekb::ToString(cell), reason);
  }
  return ObserveResult::INCONSISTENT;
}

void InferenceEngine::TraceState(const std::string& heading,
                                 const std::vector<Sentence>& pending) const {
  if (trace_ == nullptr) {
    return;
  }
  fmt::print(trace_, "{}\n", heading);
  fmt::print(trace_, "  knowledge:\n");
  for (const Sentence& sentence : knowledge_.GetSentences()) {
    fmt::print(trace_, "    {}\n", ToString(sentence));
  }
  fmt::print(trace_, "  pending:\n");
  for (const Sentence& sentence : pending) {
    fmt::print(trace_, "    {}\n", ToString(sentence));
  }
  fmt::print(trace_, "  safe: {}\n",
             CellsToString(knowledge_.GetConfirmedSafe()));
  fmt::print(trace_, "  mines: {}\n", CellsToString(knowledge_.GetMines()));
}

}  // namespace solver
}  // namespace minekb
