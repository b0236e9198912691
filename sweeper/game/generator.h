#ifndef SWEEPER_GAME_GENERATOR_H_
#define SWEEPER_GAME_GENERATOR_H_

#include <cstddef>

#include "sweeper/game/board.h"
#include "sweeper/game/error.h"

namespace sweeper {

// Generates a board with randomly placed mines.
//   rows - The number of rows.
//   cols - The number of columns.
//   mines - The number of mines.
//   safe_row, safe_col - The first cell the player uncovers.
//   seed - Seed for the PRNG to generate the mine locations.
//   board - Receives the generated board on success.
//
// No mine is placed on the safe cell or the cells adjacent to it. If that
// leaves fewer free cells than mines, only the safe cell itself is kept free.
//
// Returns INVALID_CONFIGURATION if either dimension is zero, rows * cols does
// not fit in a std::size_t, or mines is not less than rows * cols, and OUT_OF_BOUNDS if the safe cell is not on the
// board.
Error GenerateBoard(std::size_t rows, std::size_t cols, std::size_t mines,
                    std::size_t safe_row, std::size_t safe_col, unsigned seed,
                    Board& board);

}  // namespace sweeper

#endif  // SWEEPER_GAME_GENERATOR_H_
