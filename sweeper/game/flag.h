#ifndef SWEEPER_GAME_FLAG_H_
#define SWEEPER_GAME_FLAG_H_

#include <cstddef>

#include "sweeper/game/board.h"
#include "sweeper/game/cell.h"
#include "sweeper/game/error.h"

namespace sweeper {

// Toggles the flag on the cell at (row, col) and stores the resulting state in
// state.
//
// Does nothing if the cell is already open; state is then OPEN.
//
// Returns OUT_OF_BOUNDS if the cell is not on the board.
Error ToggleFlag(Board& board, std::size_t row, std::size_t col,
                 CellState& state);

}  // namespace sweeper

#endif  // SWEEPER_GAME_FLAG_H_
