#ifndef CELLCLEAR_MOVE_SEQUENCE_HPP
#define CELLCLEAR_MOVE_SEQUENCE_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "cellclear/grid.hpp"

namespace cellclear {

// class MoveSequence

// Immutable list of moves packed into one word: the low LENGTH_BITS hold the length, move i
// occupies the MOVE_BITS bits right above it at offset LENGTH_BITS + i * MOVE_BITS.
class MoveSequence {
   public:
    static constexpr unsigned WORD_BITS = 64;
    static constexpr unsigned LENGTH_BITS = 6;
    static constexpr unsigned MOVE_BITS = 2;
    static constexpr size_t MAX_LENGTH = (WORD_BITS - LENGTH_BITS) / MOVE_BITS;  // 29

    MoveSequence() : data(0) {}

    size_t size() const { return static_cast<size_t>(data & LENGTH_MASK); }
    bool empty() const { return size() == 0; }
    uint64_t packed() const { return data; }

    // @throws std::out_of_range if `i >= size()`
    Move at(size_t i) const;
    Move operator[](size_t i) const { return at(i); }

    // Returns a new sequence with `m` appended, this one is left untouched.
    // @throws std::length_error when the sequence already holds MAX_LENGTH moves.
    MoveSequence add(const Move& m) const;

    std::vector<Move> to_vector() const;

    bool operator==(const MoveSequence& other) const { return data == other.data; }
    bool operator!=(const MoveSequence& other) const { return data != other.data; }

   private:
    static constexpr uint64_t LENGTH_MASK = (1ULL << LENGTH_BITS) - 1;
    static constexpr uint64_t MOVE_MASK = (1ULL << MOVE_BITS) - 1;

    explicit MoveSequence(uint64_t data) : data(data) {}

    uint64_t data;
};

// "Up, Left, ..." style rendering
std::string join_moves(const MoveSequence& moves, const std::string& delimiter);

}  // namespace cellclear

#endif  // CELLCLEAR_MOVE_SEQUENCE_HPP
