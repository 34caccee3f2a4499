#include "cellclear/move_sequence.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace std;

namespace cellclear {

static_assert(MoveSequence::MAX_LENGTH < (1ULL << MoveSequence::LENGTH_BITS), "length field too narrow");

Move MoveSequence::at(size_t i) const {
    if (i >= size()) throw out_of_range("MoveSequence index " + to_string(i) + " out of range");
    return static_cast<Move>((data >> (LENGTH_BITS + i * MOVE_BITS)) & MOVE_MASK);
}

MoveSequence MoveSequence::add(const Move& m) const {
    size_t length = size();
    if (length >= MAX_LENGTH) throw length_error("MoveSequence is full (" + to_string(MAX_LENGTH) + " moves)");

    uint64_t moves = data & ~LENGTH_MASK;
    moves |= (static_cast<uint64_t>(m) & MOVE_MASK) << (LENGTH_BITS + length * MOVE_BITS);
    return MoveSequence(moves | (length + 1));
}

vector<Move> MoveSequence::to_vector() const {
    vector<Move> moves;
    moves.reserve(size());
    for (size_t i = 0; i < size(); ++i) moves.push_back(at(i));
    return moves;
}

string join_moves(const MoveSequence& moves, const string& delimiter) {
    string out;
    for (size_t i = 0; i < moves.size(); ++i) {
        if (i) out += delimiter;
        out += move_to_str(moves[i]);
    }
    return out;
}

}  // namespace cellclear
