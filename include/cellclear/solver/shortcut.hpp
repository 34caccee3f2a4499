#ifndef CELLCLEAR_SOLVER_SHORTCUT_HPP
#define CELLCLEAR_SOLVER_SHORTCUT_HPP

#include <memory>
#include <vector>

#include "cellclear/marks.hpp"
#include "cellclear/shortcut_cache.hpp"
#include "cellclear/solver/base.hpp"

namespace cellclear {
namespace Shortcut {

// Breadth-first expansion that only walks shortest zero-cell paths towards occupied cells.
// Standing on a zero cell, a step either keeps heading to its pending end or branches once per
// reachable end; standing on an occupied cell, every direction is a branch.
class Solver : public BaseSolver {
   private:
    std::shared_ptr<const ShortcutCache> cache;

    void continue_towards(const SolveStep& step, const Marks& marks, const Coord& end,
                          std::vector<SolveStep>& out) const;

   protected:
    void next_choices(const SolveStep& step, std::vector<SolveStep>& out) const override;

   public:
    // @throws std::invalid_argument if `cache` is null
    explicit Solver(std::shared_ptr<const ShortcutCache> cache, int num_threads = 0);

    const ShortcutCache& shortcut_cache() const { return *cache; }
};

}  // namespace Shortcut
}  // namespace cellclear

#endif  // CELLCLEAR_SOLVER_SHORTCUT_HPP
