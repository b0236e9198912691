#include "sweeper/game/flag.h"

namespace sweeper {

Error ToggleFlag(Board& board, std::size_t row, std::size_t col,
                 CellState& state) {
  if (!board.IsValid(row, col)) {
    return Error::OUT_OF_BOUNDS;
  }
  board.ToggleFlagged(row, col);
  state = board(row, col).GetState();
  return Error::NONE;
}

}  // namespace sweeper
