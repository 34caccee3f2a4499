#include "cellclear/grid.hpp"

#include <string>

using namespace std;

namespace cellclear {

const char* move_to_str(const Move& m) {
    switch (m) {
        case Move::LEFT:
            return "Left";
        case Move::RIGHT:
            return "Right";
        case Move::UP:
            return "Up";
        case Move::DOWN:
            return "Down";
        default:
            return "?";
    }
}

// class Symmetry implementation

Symmetry Symmetry::inverse() const {
    // Reflections are involutions, plain rotations are undone by the opposite turn
    if (mirror) return *this;
    return Symmetry{false, static_cast<uint8_t>((4 - turns) & 3)};
}

string Symmetry::to_string() const {
    static const char* rotations[4] = {"Identity", "Deg90", "Deg180", "Deg270"};
    if (!mirror) return rotations[turns & 3];
    if (turns == 0) return "Mirror";
    return string("Mirror-") + rotations[turns & 3];
}

Move move_symmetry(const Move& m, const Symmetry& sym) {
    MoveDelta delta = move_to_delta(m);
    int dr = delta.dr, dc = delta.dc;

    if (sym.mirror) dr = -dr;
    for (uint8_t t = 0; t < (sym.turns & 3); ++t) {
        int r = -dc;
        dc = dr;
        dr = r;
    }

    for (Move candidate : MOVES) {
        MoveDelta d = move_to_delta(candidate);
        if (d.dr == dr && d.dc == dc) return candidate;
    }
    return m;  // Unreachable: the transform maps unit deltas onto unit deltas
}

// class Coord implementation

Coord Coord::from(int row, int column) {
    if (row < 0 || row >= N || column < 0 || column >= N) return outside();
    return Coord(static_cast<uint8_t>(row * N + column));
}

Coord Coord::symmetry(const Symmetry& sym) const {
    if (!inside()) return *this;

    int r = row(), c = column();
    if (sym.mirror) r = N - 1 - r;
    for (uint8_t t = 0; t < (sym.turns & 3); ++t) {
        // Counter clockwise quarter turn
        int nr = N - 1 - c;
        c = r;
        r = nr;
    }
    return from(r, c);
}

string Coord::to_string() const {
    if (!inside()) return "Coord[outside]";
    return "Coord[" + std::to_string(row()) + "," + std::to_string(column()) + "]";
}

Coord Coord::operator+(const Move& m) const {
    if (!inside()) return outside();
    MoveDelta delta = move_to_delta(m);
    return from(row() + delta.dr, column() + delta.dc);
}

}  // namespace cellclear
