#ifndef CELLCLEAR_MARKS_HPP
#define CELLCLEAR_MARKS_HPP

#include <cstdint>
#include <string>

#include "cellclear/common.hpp"
#include "cellclear/grid.hpp"

namespace cellclear {

// class Marks

// Occupied pattern of a board: bit `i` is set when cell `i` holds a nonzero magnitude
class Marks {
   public:
    Marks() : bits(0) {}
    explicit Marks(uint16_t bits) : bits(bits) {}

    uint16_t value() const { return bits; }
    bool full() const { return bits == 0xFFFF; }

    bool marked(const Coord& p) const;
    void mark(const Coord& p);
    void unmark(const Coord& p);

    // Marked cells of one row / one column, still at their board bit positions
    uint16_t row_bits(int row) const;
    uint16_t column_bits(int column) const;

    Marks symmetry(const Symmetry& sym) const;
    std::string to_string() const;

    bool operator==(const Marks& other) const { return bits == other.bits; }
    bool operator!=(const Marks& other) const { return bits != other.bits; }
    bool operator<(const Marks& other) const { return bits < other.bits; }

   private:
    uint16_t bits;
};

}  // namespace cellclear

#endif  // CELLCLEAR_MARKS_HPP
