#include "cellclear/solver/base.hpp"

#include <omp.h>

#include <algorithm>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "cellclear/profiler.hpp"

using namespace std;

namespace cellclear {

BaseSolver::BaseSolver(int num_threads) {
    int max_threads = num_threads > 0 ? num_threads : omp_get_max_threads();
    if (max_threads <= 0) max_threads = 1;
    this->num_threads = min(static_cast<size_t>(max_threads), static_cast<size_t>(CELLCLEAR_MAX_THREADS));
}

optional<MoveSequence> BaseSolver::solve(const Board& board, size_t max_moves) {
    if (max_moves > MoveSequence::MAX_LENGTH) {
        throw invalid_argument("Max supported moves: " + to_string(MoveSequence::MAX_LENGTH) + ", requested " +
                               to_string(max_moves));
    }

    PROFILE_FUNCTION();
    stats = SolveStats();
    if (board.is_won()) return MoveSequence();  // Already solved

    vector<SolveStep> frontier = {{board, MoveSequence(), nullopt}};
    Visited visited;
    vector<vector<SolveStep>> sub_frontiers(num_threads);

    for (size_t round = 0; round < max_moves && !frontier.empty(); ++round) {
        PROFILE_SCOPE("round");
        stats.rounds++;
        stats.expanded += frontier.size();
        stats.peak_frontier = max(stats.peak_frontier, frontier.size());

        // Each thread expands one contiguous batch into its own sub-frontier, the visited set
        // is only read here
        {
            PROFILE_SCOPE("expand");
            size_t batch = (frontier.size() + num_threads - 1) / num_threads;
            long threads = static_cast<long>(num_threads);

#pragma omp parallel for schedule(static) num_threads(num_threads)
            for (long thread_id = 0; thread_id < threads; ++thread_id) {
                vector<SolveStep>& sub_frontier = sub_frontiers[thread_id];
                sub_frontier.clear();

                size_t begin = min(frontier.size(), thread_id * batch);
                size_t end = min(frontier.size(), begin + batch);
                vector<SolveStep> choices;
                for (size_t i = begin; i < end; ++i) {
                    choices.clear();
                    next_choices(frontier[i], choices);
                    for (SolveStep& choice : choices) {
                        if (visited.count(choice.board) || choice.board.is_lost()) continue;
                        sub_frontier.push_back(choice);
                    }
                }
            }
        }

        vector<SolveStep> next;
        {
            PROFILE_SCOPE("merge");
            size_t total = 0;
            for (const auto& sub_frontier : sub_frontiers) total += sub_frontier.size();
            next.reserve(total);

            for (auto& sub_frontier : sub_frontiers) {
                for (const SolveStep& step : sub_frontier) {
                    if (step.board.is_won()) {
                        stats.visited = visited.size();
                        return step.moves;
                    }
                    next.push_back(step);
                }
                sub_frontier.clear();
            }

            // Only the expanded layer becomes visited, the new layer is filtered next round
            for (const SolveStep& step : frontier) visited.insert(step.board);
        }

#ifdef DEBUG
        cerr << "Round: " << round + 1 << ", frontier: " << next.size() << ", visited: " << visited.size() << endl;
#endif
        frontier.swap(next);
    }

    stats.visited = visited.size();
    return nullopt;
}

}  // namespace cellclear
