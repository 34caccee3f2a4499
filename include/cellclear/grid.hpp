#ifndef CELLCLEAR_GRID_HPP
#define CELLCLEAR_GRID_HPP

#include <cstdint>
#include <string>

#include "cellclear/common.hpp"

namespace cellclear {

// enum Move

enum Move {
    LEFT = 0,
    RIGHT = 1,
    UP = 2,
    DOWN = 3,
};

const Move MOVES[4] = {Move::LEFT, Move::RIGHT, Move::UP, Move::DOWN};

typedef struct MoveDelta {
    int8_t dr, dc;
} MoveDelta;

const MoveDelta MOVE_DELTAS[4] = {
    {0, -1},  // Left
    {0, 1},   // Right
    {-1, 0},  // Up
    {1, 0},   // Down
};

inline Move move_inv(const Move& m) { return static_cast<Move>(m ^ 1); }

inline MoveDelta move_to_delta(const Move& m) { return MOVE_DELTAS[m]; }

const char* move_to_str(const Move& m);

// struct Symmetry

// An element of the dihedral group of the square: rows are mirrored first (if `mirror`),
// then the grid is rotated counter clockwise by `turns` quarter turns.
struct Symmetry {
    bool mirror;
    uint8_t turns;  // 0-3

    Symmetry inverse() const;
    bool is_identity() const { return !mirror && turns == 0; }
    std::string to_string() const;

    bool operator==(const Symmetry& other) const { return mirror == other.mirror && turns == other.turns; }
};

const Symmetry SYMMETRIES[8] = {
    {false, 0}, {false, 1}, {false, 2}, {false, 3}, {true, 0}, {true, 1}, {true, 2}, {true, 3},
};

// Conjugate a move: moving by `move_symmetry(m, sym)` from `p.symmetry(sym)` lands on
// `(p + m).symmetry(sym)`
Move move_symmetry(const Move& m, const Symmetry& sym);

// class Coord

class Coord {
   public:
    Coord() : idx(0) {}
    explicit Coord(uint8_t idx) : idx(idx) {}

    // Any out of range row/column maps to the single outside value
    static Coord from(int row, int column);
    static Coord outside() { return Coord(CELLS); }

    uint8_t index() const { return idx; }
    int row() const { return idx / N; }
    int column() const { return idx % N; }
    bool inside() const { return idx < CELLS; }

    Coord symmetry(const Symmetry& sym) const;
    std::string to_string() const;

    Coord operator+(const Move& m) const;
    bool operator==(const Coord& other) const { return idx == other.idx; }
    bool operator!=(const Coord& other) const { return idx != other.idx; }
    bool operator<(const Coord& other) const { return idx < other.idx; }

   private:
    uint8_t idx;
};

}  // namespace cellclear

#endif  // CELLCLEAR_GRID_HPP
