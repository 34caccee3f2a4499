#include "cellclear/marks.hpp"

#include <string>

using namespace std;

namespace cellclear {

bool Marks::marked(const Coord& p) const { return p.inside() && ((bits >> p.index()) & 0x1) != 0; }

void Marks::mark(const Coord& p) {
    if (p.inside()) bits |= static_cast<uint16_t>(1u << p.index());
}

void Marks::unmark(const Coord& p) {
    if (p.inside()) bits &= static_cast<uint16_t>(~(1u << p.index()));
}

uint16_t Marks::row_bits(int row) const {
    uint16_t row_mask = static_cast<uint16_t>(((1u << N) - 1) << (row * N));
    return bits & row_mask;
}

uint16_t Marks::column_bits(int column) const {
    uint16_t column_mask = 0;
    for (int r = 0; r < N; ++r) column_mask |= static_cast<uint16_t>(1u << (r * N + column));
    return bits & column_mask;
}

Marks Marks::symmetry(const Symmetry& sym) const {
    if (sym.is_identity()) return *this;

    Marks result;
    for (uint8_t i = 0; i < CELLS; ++i) {
        Coord p(i);
        if (marked(p)) result.mark(p.symmetry(sym));
    }
    return result;
}

string Marks::to_string() const {
    string out;
    for (int r = 0; r < N; ++r) {
        out += '\n';
        for (int c = 0; c < N; ++c) out += marked(Coord::from(r, c)) ? "|#|" : "| |";
    }
    return out;
}

}  // namespace cellclear
