#include "minekb/solver/knowledge.h"

#include <unordered_set>
#include <vector>

#include <fmt/format.h>

#include "minekb/solver/inference_engine.h"
#include "minekb/solver/knowledge_base.h"
#include "minekb/solver/move_selector.h"

namespace minekb {
namespace solver {
namespace knowledge {

namespace {

class KnowledgeSolver : public Solver {
 public:
  KnowledgeSolver(const Game& game, unsigned seed, std::FILE* trace)
      : engine_(game.GetRows(), game.GetCols(), knowledge_),
        selector_(knowledge_, game.GetRows(), game.GetCols(), seed) {
    engine_.SetTrace(trace);
  }

  ~KnowledgeSolver() final = default;

  void NotifyEvent(const Event& event) final {
    switch (event.type) {
      case Event::Type::UNCOVER:
        Observe(event.cell, event.adjacent_mines);
        break;
      case Event::Type::FLAG:
        flagged_.insert(event.cell);
        break;
      case Event::Type::UNFLAG:
        flagged_.erase(event.cell);
        break;
      case Event::Type::WIN:
      case Event::Type::LOSS:
        game_over_ = true;
        break;
      case Event::Type::IDENTIFY_MINE:
      case Event::Type::IDENTIFY_BAD_FLAG:
        // Only sent once the game is lost.
        break;
    }
  }

  std::vector<Action> Analyze() final {
    if (game_over_ || !engine_.IsConsistent()) {
      return std::vector<Action>();
    }

    std::vector<Action> actions;
    for (const Cell& cell : knowledge_.GetConfirmedSafe()) {
      // A flagged cell must be unflagged before it can be uncovered.
      if (flagged_.count(cell) != 0) {
        actions.push_back(Action{Action::Type::FLAG, cell});
      }
      actions.push_back(Action{Action::Type::UNCOVER, cell});
    }

    // FLAG is a toggle, so cells that already carry a flag are skipped.
    for (const Cell& cell : knowledge_.GetMines()) {
      if (flagged_.count(cell) == 0) {
        actions.push_back(Action{Action::Type::FLAG, cell});
      }
    }
    return actions;
  }

  bool Suggest(Suggestion* suggestion) final {
    if (game_over_ || !engine_.IsConsistent()) {
      return false;
    }
    if (selector_.MakeSafeMove(&suggestion->cell)) {
      suggestion->guess = false;
      return true;
    }
    if (selector_.MakeRandomMove(&suggestion->cell)) {
      suggestion->guess = true;
      return true;
    }
    return false;
  }

 private:
  void Observe(const Cell& cell, std::size_t adjacent_mines) {
    const ObserveResult result =
        engine_.Observe(cell, static_cast<int>(adjacent_mines));
    if (result == ObserveResult::INCONSISTENT && !reported_inconsistency_) {
      reported_inconsistency_ = true;
      fmt::print(stderr,
                 "minekb: observation {} = {} contradicts earlier "
                 "observations; deductions stopped\n",
                 ToString(cell), adjacent_mines);
    }
  }

  KnowledgeBase knowledge_;
  InferenceEngine engine_;
  MoveSelector selector_;

  // Cells currently carrying a flag, whoever placed it.
  std::unordered_set<Cell> flagged_;

  bool game_over_ = false;
  bool reported_inconsistency_ = false;
};

}  // namespace

std::unique_ptr<Solver> New(const Game& game, unsigned seed) {
  return New(game, seed, nullptr);
}

std::unique_ptr<Solver> New(const Game& game, unsigned seed,
                            std::FILE* trace) {
  return std::make_unique<KnowledgeSolver>(game, seed, trace);
}

}  // namespace knowledge
}  // namespace solver
}  // namespace minekb
