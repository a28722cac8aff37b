#include "minekb/solver/nop.h"

#include <vector>

namespace minekb {
namespace solver {
namespace nop {

namespace {

class NopSolver : public Solver {
 public:
  NopSolver() = default;
  ~NopSolver() final = default;

  void NotifyEvent(const Event&) final {}

  std::vector<Action> Analyze() final { return std::vector<Action>(); }

  bool Suggest(Suggestion*) final { return false; }
};

}  // namespace

std::unique_ptr<Solver> New() { return std::make_unique<NopSolver>(); }

}  // namespace nop
}  // namespace solver
}  // namespace minekb
