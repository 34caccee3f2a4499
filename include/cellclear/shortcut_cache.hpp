#ifndef CELLCLEAR_SHORTCUT_CACHE_HPP
#define CELLCLEAR_SHORTCUT_CACHE_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "cellclear/grid.hpp"
#include "cellclear/marks.hpp"

namespace cellclear {

// struct ActionBoard

// For one occupied pattern and one occupied `end` cell: the first move of a shortest path
// (through unoccupied cells only) from every cell that can reach `end`.
struct ActionBoard {
    Coord end;
    uint32_t actions;  // 2 bits per coordinate, valid where `starts` is marked
    Marks starts;      // Unoccupied coordinates with a path to `end`

    /**
     * Reverse breadth-first expansion from `end` over the unmarked cells of `marks`.
     * @throws std::invalid_argument if `end` is not marked.
     */
    static ActionBoard build(const Marks& marks, const Coord& end);

    std::optional<Move> action_by_pos(const Coord& pos) const;
    std::string to_string() const;
};

// class ShortcutCache

// Action boards for every occupied pattern, stored once per symmetry class. Built
// explicitly and read-only afterwards, so it can be shared across solver threads.
class ShortcutCache {
   public:
    struct Canonical {
        Symmetry symmetry;  // Maps the queried pattern onto `marks`
        Marks marks;        // Numerically smallest image of the queried pattern
    };

    /**
     * Enumerate all occupied patterns, fold them under the 8 symmetries of the square and
     * build the action boards of each representative.
     * @param num_threads OpenMP threads for the build, 0 uses the OpenMP default.
     */
    static std::shared_ptr<const ShortcutCache> build(int num_threads = 0);

    Canonical canonical(const Marks& marks) const { return canonical_of[marks.value()]; }

    // Action boards of a canonical pattern, one per eligible end
    const std::vector<ActionBoard>& action_boards(const Marks& canonical_marks) const {
        return boards[canonical_marks.value()];
    }
    size_t representative_count() const { return representatives; }

    // First move from `pos` towards `end` through unoccupied cells, nullopt if there is no path
    std::optional<Move> action_towards(const Marks& marks, const Coord& pos, const Coord& end) const;

    // Every eligible end that `pos` can reach through unoccupied cells
    std::vector<Coord> find_all_ends_for(const Marks& marks, const Coord& pos) const;

   private:
    ShortcutCache();

    std::vector<std::vector<ActionBoard>> boards;  // Indexed by pattern, filled for representatives
    std::vector<Canonical> canonical_of;           // Indexed by pattern
    size_t representatives;
};

}  // namespace cellclear

#endif  // CELLCLEAR_SHORTCUT_CACHE_HPP
