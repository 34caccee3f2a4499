#ifndef CELLCLEAR_COMMON_HPP
#define CELLCLEAR_COMMON_HPP

#include <cstdint>

namespace cellclear {

// Board side length (compile-time, the solver only supports 4x4)
constexpr uint8_t N = 4;
constexpr uint8_t CELLS = N * N;

// Upper bound for solver worker threads
#define CELLCLEAR_MAX_THREADS 64

// Default move budget used by the CLI
#define CELLCLEAR_DEFAULT_MOVES 20

typedef uint8_t CellNumber;  // Cell magnitude: 0 cleared, 1-255 occupied

}  // namespace cellclear

#endif  // CELLCLEAR_COMMON_HPP
