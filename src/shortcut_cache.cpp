#include "cellclear/shortcut_cache.hpp"

#include <omp.h>

#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "cellclear/profiler.hpp"

using namespace std;

namespace cellclear {

static constexpr size_t PATTERN_COUNT = 1 << CELLS;

// An end has to be occupied and touch at least one unoccupied cell
static bool is_eligible_end(const Marks& marks, const Coord& p) {
    if (!marks.marked(p)) return false;
    for (Move m : MOVES) {
        Coord neighbor = p + m;
        if (neighbor.inside() && !marks.marked(neighbor)) return true;
    }
    return false;
}

// struct ActionBoard implementation

ActionBoard ActionBoard::build(const Marks& marks, const Coord& end) {
    if (!marks.marked(end)) throw invalid_argument("ActionBoard end " + end.to_string() + " must be marked");

    ActionBoard board{end, 0, Marks()};
    vector<Coord> frontier = {end};
    vector<Coord> next;

    while (!frontier.empty()) {
        next.clear();
        for (Move m : MOVES) {
            for (const Coord& p : frontier) {
                Coord start = p + m;
                if (!start.inside() || marks.marked(start) || board.starts.marked(start)) continue;

                // Walking back from `start` retraces the expansion step
                board.actions |= static_cast<uint32_t>(move_inv(m)) << (start.index() * 2);
                board.starts.mark(start);
                next.push_back(start);
            }
        }
        frontier.swap(next);
    }

    return board;
}

optional<Move> ActionBoard::action_by_pos(const Coord& pos) const {
    if (!starts.marked(pos)) return nullopt;
    return static_cast<Move>((actions >> (pos.index() * 2)) & 0x3);
}

string ActionBoard::to_string() const {
    string out;
    for (int r = 0; r < N; ++r) {
        out += '\n';
        for (int c = 0; c < N; ++c) {
            Coord p = Coord::from(r, c);
            optional<Move> action = action_by_pos(p);
            if (action) {
                out += string("|") + move_to_str(*action)[0] + "|";
            } else if (p == end) {
                out += "|X|";
            } else {
                out += "| |";
            }
        }
    }
    return out;
}

// class ShortcutCache implementation

ShortcutCache::ShortcutCache() : boards(PATTERN_COUNT), canonical_of(PATTERN_COUNT), representatives(0) {}

shared_ptr<const ShortcutCache> ShortcutCache::build(int num_threads) {
    PROFILE_FUNCTION();

    shared_ptr<ShortcutCache> cache(new ShortcutCache());

    // Ascending enumeration: the first pattern met in each symmetry class is its smallest image
    vector<bool> seen(PATTERN_COUNT, false);
    vector<uint16_t> representative_list;
    {
        PROFILE_SCOPE("fold_symmetries");
        for (size_t i = 0; i < PATTERN_COUNT; ++i) {
            Marks marks(static_cast<uint16_t>(i));
            if (seen[i]) continue;

            for (const Symmetry& sym : SYMMETRIES) {
                Marks image = marks.symmetry(sym);
                if (seen[image.value()]) continue;
                seen[image.value()] = true;
                cache->canonical_of[image.value()] = {sym.inverse(), marks};
            }
            // A full grid has no unoccupied cell to walk through
            if (!marks.full()) representative_list.push_back(marks.value());
        }
    }
    cache->representatives = representative_list.size();

    {
        PROFILE_SCOPE("build_action_boards");
        int threads = num_threads > 0 ? num_threads : omp_get_max_threads();
        long count = static_cast<long>(representative_list.size());

#pragma omp parallel for schedule(dynamic, 64) num_threads(threads)
        for (long k = 0; k < count; ++k) {
            Marks marks(representative_list[k]);
            vector<ActionBoard>& ends = cache->boards[marks.value()];
            for (uint8_t i = 0; i < CELLS; ++i) {
                Coord end(i);
                if (is_eligible_end(marks, end)) ends.push_back(ActionBoard::build(marks, end));
            }
        }
    }

#ifdef DEBUG
    cerr << "Initialized action boards: " << cache->representatives << " canonical patterns" << endl;
#endif

    return cache;
}

optional<Move> ShortcutCache::action_towards(const Marks& marks, const Coord& pos, const Coord& end) const {
    Canonical canon = canonical(marks);
    Coord canonical_end = end.symmetry(canon.symmetry);
    Coord canonical_pos = pos.symmetry(canon.symmetry);

    for (const ActionBoard& board : action_boards(canon.marks)) {
        if (board.end != canonical_end) continue;

        optional<Move> action = board.action_by_pos(canonical_pos);
        if (!action) return nullopt;
        return move_symmetry(*action, canon.symmetry.inverse());
    }
    return nullopt;  // Not an eligible end
}

vector<Coord> ShortcutCache::find_all_ends_for(const Marks& marks, const Coord& pos) const {
    Canonical canon = canonical(marks);
    Coord canonical_pos = pos.symmetry(canon.symmetry);
    Symmetry back = canon.symmetry.inverse();

    vector<Coord> ends;
    for (const ActionBoard& board : action_boards(canon.marks)) {
        if (board.starts.marked(canonical_pos)) ends.push_back(board.end.symmetry(back));
    }
    return ends;
}

}  // namespace cellclear
