#include "cellclear/board.hpp"

#include <algorithm>
#include <bitset>
#include <optional>
#include <string>
#include <vector>

using namespace std;

namespace cellclear {

// SplitMix64 finalizer
static inline uint64_t mix64(uint64_t value) {
    value += 0x9e3779b97f4a7c15ULL;
    value = (value ^ (value >> 30)) * 0xbf58476d1ce4e5b9ULL;
    value = (value ^ (value >> 27)) * 0x94d049bb133111ebULL;
    return value ^ (value >> 31);
}

// Split on every delimiter, keeping empty pieces so "1 2 " is rejected
static vector<string> split(const string& text, char delimiter) {
    vector<string> pieces;
    size_t start = 0;
    while (true) {
        size_t end = text.find(delimiter, start);
        if (end == string::npos) {
            pieces.push_back(text.substr(start));
            break;
        }
        pieces.push_back(text.substr(start, end - start));
        start = end + 1;
    }
    return pieces;
}

static CellNumber parse_cell(const string& token, size_t row) {
    bool digits = !token.empty() && token.size() <= 3 &&
                  all_of(token.begin(), token.end(), [](char ch) { return ch >= '0' && ch <= '9'; });
    if (!digits) throw ParseError("Row " + to_string(row) + ": invalid cell value '" + token + "'");

    int value = stoi(token);
    if (value > 255) throw ParseError("Row " + to_string(row) + ": cell value " + token + " exceeds 255");
    return static_cast<CellNumber>(value);
}

CellNumber cell_diff(CellNumber num, CellNumber origin) {
    if (num == origin) return 0;

    CellNumber low = min(num, origin);
    CellNumber high = max(num, origin);
    // Consecutive magnitudes merge instead of cancelling (sum wraps at 8 bits)
    if (high > low + 1) return static_cast<CellNumber>(high - low);
    return static_cast<CellNumber>(high + low);
}

// class Board implementation

Board Board::parse(const string& text) {
    vector<string> rows = split(text, '|');
    if (rows.size() != N) {
        throw ParseError("Expected " + std::to_string(N) + " rows, got " + std::to_string(rows.size()));
    }

    Board board;
    for (size_t r = 0; r < rows.size(); ++r) {
        vector<string> values = split(rows[r], ' ');
        if (values.size() != N) {
            throw ParseError("Row " + std::to_string(r) + ": expected " + std::to_string(N) + " values, got " +
                             std::to_string(values.size()));
        }
        for (size_t c = 0; c < values.size(); ++c) {
            board.set_cell(Coord::from(static_cast<int>(r), static_cast<int>(c)), parse_cell(values[c], r));
        }
    }
    return board;
}

string Board::to_string() const {
    string out;
    for (int r = 0; r < N; ++r) {
        if (r) out += '|';
        for (int c = 0; c < N; ++c) {
            if (c) out += ' ';
            out += std::to_string(cell(Coord::from(r, c)));
        }
    }
    return out;
}

CellNumber Board::cell(const Coord& p) const { return static_cast<CellNumber>(cells >> (p.index() * 8)); }

void Board::set_cell(const Coord& p, CellNumber v) {
    unsigned shift = p.index() * 8;
    cells &= ~(static_cast<Cells>(0xFF) << shift);
    cells |= static_cast<Cells>(v) << shift;
}

Marks Board::marks() const {
    uint16_t bits = 0;
    for (uint8_t i = 0; i < CELLS; ++i) {
        if (cell(Coord(i)) != 0) bits |= static_cast<uint16_t>(1u << i);
    }
    return Marks(bits);
}

int Board::apply_move(const Coord& origin, const Move& m) {
    CellNumber origin_value = cell(origin);
    if (origin_value == 0) return 0;  // Free move

    int clears = 0;
    for (Coord p = origin + m; p.inside(); p = p + m) {
        CellNumber v = cell(p);
        if (v == 0) continue;

        CellNumber nv = cell_diff(v, origin_value);
        set_cell(p, nv);
        if (nv == 0) clears++;
    }
    if (clears > 0) {
        set_cell(origin, 0);  // The origin discharges along with its hits
        clears++;
    }
    return clears;
}

optional<Board> Board::move(const Move& m, int* clears) const {
    Coord next = pos + m;
    if (!next.inside()) return nullopt;

    Board next_board(next, cells);
    int cleared = next_board.apply_move(pos, m);
    if (clears) *clears = cleared;
    return next_board;
}

bool Board::is_lost() const {
    Marks occupied = marks();

    for (int r = 0; r < N; ++r) {
        uint16_t row = occupied.row_bits(r);
        if (bitset<CELLS>(row).count() != 1) continue;  // Not a dead row

        for (int c = 0; c < N; ++c) {
            if (!occupied.marked(Coord::from(r, c))) continue;
            // The single cell of a dead row is dead if its column is dead too
            if (bitset<CELLS>(occupied.column_bits(c)).count() == 1) return true;
            break;
        }
    }
    return false;
}

size_t Board::hash() const {
    uint64_t low = static_cast<uint64_t>(cells);
    uint64_t high = static_cast<uint64_t>(cells >> 64);
    return static_cast<size_t>(mix64(low ^ mix64(high ^ pos.index())));
}

}  // namespace cellclear
