#include "cellclear/solver/bfs.hpp"

#include <optional>
#include <vector>

using namespace std;

namespace cellclear {

void BFS::Solver::next_choices(const SolveStep& step, vector<SolveStep>& out) const {
    for (Move m : MOVES) {
        optional<Board> next = step.board.move(m);
        if (!next) continue;  // Off the grid
        out.push_back({*next, step.moves.add(m), nullopt});
    }
}

}  // namespace cellclear
