#include "cellclear/solver/shortcut.hpp"

#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

using namespace std;

namespace cellclear {

Shortcut::Solver::Solver(shared_ptr<const ShortcutCache> cache, int num_threads)
    : BaseSolver(num_threads), cache(std::move(cache)) {
    if (!this->cache) throw invalid_argument("Shortcut solver needs a shortcut cache");
}

void Shortcut::Solver::continue_towards(const SolveStep& step, const Marks& marks, const Coord& end,
                                        vector<SolveStep>& out) const {
    optional<Move> action = cache->action_towards(marks, step.board.position(), end);
    if (!action) return;  // `end` is out of reach

    optional<Board> next = step.board.move(*action);
    if (!next) return;

    // Arrived, or the target no longer exists: the next step branches normally
    optional<Coord> pending = end;
    if (next->position() == end || next->cell(end) == 0) pending = nullopt;

    out.push_back({*next, step.moves.add(*action), pending});
}

void Shortcut::Solver::next_choices(const SolveStep& step, vector<SolveStep>& out) const {
    const Board& board = step.board;

    if (board.cell(board.position()) != 0) {
        for (Move m : MOVES) {
            optional<Board> next = board.move(m);
            if (!next) continue;
            out.push_back({*next, step.moves.add(m), nullopt});
        }
        return;
    }

    Marks marks = board.marks();
    if (step.pending_end) {
        continue_towards(step, marks, *step.pending_end, out);
        return;
    }
    for (const Coord& end : cache->find_all_ends_for(marks, board.position())) {
        continue_towards(step, marks, end, out);
    }
}

}  // namespace cellclear
