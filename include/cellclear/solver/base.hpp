#ifndef CELLCLEAR_SOLVER_BASE_HPP
#define CELLCLEAR_SOLVER_BASE_HPP

#include <cstddef>
#include <optional>
#include <unordered_set>
#include <vector>

#include "cellclear/board.hpp"
#include "cellclear/grid.hpp"
#include "cellclear/move_sequence.hpp"

namespace cellclear {

typedef struct SolveStep {
    Board board;
    MoveSequence moves;
    std::optional<Coord> pending_end;  // Occupied cell a zero-cell walk is still heading to
} SolveStep;

typedef struct SolveStats {
    size_t rounds = 0;         // BFS layers explored
    size_t expanded = 0;       // Steps handed to next_choices
    size_t peak_frontier = 0;  // Largest frontier of any round
    size_t visited = 0;        // Boards in the visited set at the end
} SolveStats;

typedef std::unordered_set<Board, BoardHasher> Visited;

class BaseSolver {
   protected:
    size_t num_threads;
    SolveStats stats;

    // Append the successors of `step` to `out`. Called concurrently from worker threads.
    virtual void next_choices(const SolveStep& step, std::vector<SolveStep>& out) const = 0;

   public:
    // `num_threads` 0 uses the OpenMP default, capped at CELLCLEAR_MAX_THREADS
    explicit BaseSolver(int num_threads = 0);
    virtual ~BaseSolver() = default;

    /**
     * Breadth-first search for the shortest move sequence that clears `board`.
     * @return The empty sequence if `board` is already won, nullopt if no solution has at
     *         most `max_moves` moves.
     * @throws std::invalid_argument if `max_moves` exceeds MoveSequence::MAX_LENGTH.
     */
    std::optional<MoveSequence> solve(const Board& board, size_t max_moves);

    const SolveStats& last_stats() const { return stats; }
    size_t thread_count() const { return num_threads; }
};

}  // namespace cellclear

#endif  // CELLCLEAR_SOLVER_BASE_HPP
