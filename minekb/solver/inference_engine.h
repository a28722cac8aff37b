#ifndef MINEKB_SOLVER_INFERENCE_ENGINE_H_
#define MINEKB_SOLVER_INFERENCE_ENGINE_H_

#include <cstddef>
#include <cstdio>
#include <string>
#include <vector>

#include "minekb/game/cell.h"
#include "minekb/solver/knowledge_base.h"
#include "minekb/solver/sentence.h"

namespace minekb {
namespace solver {

// The outcome of an observation.
enum class ObserveResult {
  // The knowledge base reached a fixpoint with every invariant intact.
  OK,

  // The cell lies outside the grid. Nothing was changed.
  INVALID_CELL,

  // The observation contradicts what was already known, or some earlier
  // observation did. Propagation stopped where the contradiction was found.
  INCONSISTENT,
};

// Derives safe cells and mines from observations of uncovered cells.
//
// Each observation becomes a sentence over the cell's unresolved neighbors.
// The engine then repeats two rules until nothing new follows:
//  - A sentence whose count is zero makes all its cells safe; a sentence whose
//    count equals its size makes all its cells mines.
//  - If the cells of B are a subset of the cells of A, the remaining cells of
//    A hold A.count - B.count mines.
//
// The engine never guesses. It works on a knowledge base owned by the caller,
// which must outlive the engine.
//
// Once a contradiction is detected the engine refuses further observations.
// A new game needs a new knowledge base and a new engine.
class InferenceEngine {
 public:
  InferenceEngine(std::size_t rows, std::size_t cols,
                  KnowledgeBase& knowledge);

  // Not copyable.
  InferenceEngine(const InferenceEngine&) = delete;
  InferenceEngine& operator=(const InferenceEngine&) = delete;

  // Adds the knowledge that cell is safe and that count of its neighbors are
  // mines, then draws every conclusion that follows.
  //
  // Observing a cell that was already observed is a no-op.
  ObserveResult Observe(const Cell& cell, int count);

  // Returns false once a contradiction has been detected.
  bool IsConsistent() const { return !inconsistent_; }

  // Writes a trace of every inference step to out. Pass nullptr to disable
  // tracing (the default).
  void SetTrace(std::FILE* out) { trace_ = out; }

 private:
  // Builds the sentence for an observation: the unresolved neighbors of cell,
  // with the count reduced by the neighbors already known to be mines.
  Sentence MakeSentence(const Cell& cell, int count) const;

  // Queues every sentence that follows from a pair of live sentences where one
  // is a subset of the other and that is not already known or queued.
  void InferFromSubsets(std::vector<Sentence>* pending) const;

  // Marks every cell that some sentence proves to be safe or a mine, and
  // repeats until no new cell is resolved. New subset inferences are queued
  // after each round that resolved something.
  //
  // Returns false on a contradiction.
  bool Saturate(std::vector<Sentence>* pending);

  // Applies the resolved cells to the queued sentences and drops those that
  // are empty, duplicated or already known.
  //
  // Returns false if a queued sentence has become contradictory.
  bool PrunePending(std::vector<Sentence>* pending) const;

  // Latches the inconsistent state.
  ObserveResult Fail(const Cell& cell, const char* reason);

  // Writes the knowledge base and the queue to the trace, if enabled.
  void TraceState(const std::string& heading,
                  const std::vector<Sentence>& pending) const;

  const std::size_t rows_;
  const std::size_t cols_;
  KnowledgeBase& knowledge_;
  bool inconsistent_ = false;
  std::FILE* trace_ = nullptr;
};

}  // namespace solver
}  // namespace minekb

#endif  // MINEKB_SOLVER_INFERENCE_ENGINE_H_
