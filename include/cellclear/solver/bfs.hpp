#ifndef CELLCLEAR_SOLVER_BFS_HPP
#define CELLCLEAR_SOLVER_BFS_HPP

#include <vector>

#include "cellclear/solver/base.hpp"

namespace cellclear {
namespace BFS {

// Plain breadth-first expansion: every valid direction is a branch, zero cells included
class Solver : public BaseSolver {
   protected:
    void next_choices(const SolveStep& step, std::vector<SolveStep>& out) const override;

   public:
    explicit Solver(int num_threads = 0) : BaseSolver(num_threads) {}
};

}  // namespace BFS
}  // namespace cellclear

#endif  // CELLCLEAR_SOLVER_BFS_HPP
