#ifndef CELLCLEAR_BOARD_HPP
#define CELLCLEAR_BOARD_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

#include "cellclear/common.hpp"
#include "cellclear/grid.hpp"
#include "cellclear/marks.hpp"

namespace cellclear {

// 16 cells x 8 bits, cell i lives in bits [8i, 8i + 8)
__extension__ typedef unsigned __int128 Cells;

// Thrown for malformed board text
class ParseError : public std::runtime_error {
   public:
    explicit ParseError(const std::string& what) : std::runtime_error(what) {}
};

// Magnitude left on a cell hit by a move that started from `origin`
CellNumber cell_diff(CellNumber num, CellNumber origin);

// class Board

class Board {
   public:
    Board() : pos(), cells(0) {}
    Board(Coord pos, Cells cells) : pos(pos), cells(cells) {}

    /**
     * Parse "a b c d|e f g h|..." (4 rows of 4 values in 0-255). The player starts at (0,0).
     * @throws ParseError on wrong row/column counts or invalid values.
     */
    static Board parse(const std::string& text);
    std::string to_string() const;

    Coord position() const { return pos; }
    Cells packed() const { return cells; }
    CellNumber cell(const Coord& p) const;
    Marks marks() const;

    /**
     * Step the player one cell in direction `m`. Returns nullopt when that leaves the grid.
     * If the player stood on a nonzero cell, every nonzero cell ahead of it (in direction
     * `m`, starting at the new position) is replaced by `cell_diff`. Should any of them reach
     * zero, the departed cell is cleared too. `clears`, when given, receives the number of
     * cells that were cleared.
     */
    std::optional<Board> move(const Move& m, int* clears = nullptr) const;

    bool is_won() const { return cells == 0; }
    // A nonzero cell that is alone in both its row and its column can never be cleared
    bool is_lost() const;

    size_t hash() const;

    bool operator==(const Board& other) const { return pos == other.pos && cells == other.cells; }
    bool operator!=(const Board& other) const { return !(*this == other); }

   private:
    Coord pos;
    Cells cells;

    void set_cell(const Coord& p, CellNumber v);
    int apply_move(const Coord& origin, const Move& m);
};

struct BoardHasher {
    size_t operator()(const Board& board) const noexcept { return board.hash(); }
};

}  // namespace cellclear

#endif  // CELLCLEAR_BOARD_HPP
