#ifndef MINEKB_SOLVER_NOP_H_
#define MINEKB_SOLVER_NOP_H_

#include <memory>

#include "minekb/solver/solver.h"

namespace minekb {
namespace solver {
namespace nop {

// Provides a solver that neither acts nor suggests.
//
// This is useful for playing a game manually.
std::unique_ptr<Solver> New();

}  // namespace nop
}  // namespace solver
}  // namespace minekb

#endif  // MINEKB_SOLVER_NOP_H_
