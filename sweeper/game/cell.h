#ifndef SWEEPER_GAME_CELL_H_
#define SWEEPER_GAME_CELL_H_

#include <cstddef>

namespace sweeper {

class Board;

// The states a cell can take on a board.
enum class CellState {
  // The cell is covered (but not flagged).
  CLOSED,

  // The cell is uncovered. A cell never leaves this state.
  OPEN,

  // The cell is flagged.
  FLAGGED,
};

// A single cell on a Board.
//
// Cells are only mutated through their owning Board, which keeps its open and
// flag counts in step with the cells.
class Cell {
 public:
  // Returns true if the cell contains a mine.
  bool IsMine() const { return is_mine_; }

  // Returns the current state of the cell.
  CellState GetState() const { return state_; }

  bool IsClosed() const { return state_ == CellState::CLOSED; }
  bool IsOpen() const { return state_ == CellState::OPEN; }
  bool IsFlagged() const { return state_ == CellState::FLAGGED; }

  // Returns the number of mines in adjacent cells.
  //
  // Meaningless for cells that contain a mine.
  std::size_t GetAdjacentMines() const { return adjacent_mines_; }

 private:
  friend class Board;

  // Sets this cell as a mine.
  //
  // Returns false if the cell was already a mine.
  bool SetMine() {
    if (is_mine_) {
      return false;
    }
    is_mine_ = true;
    return true;
  }

  void SetAdjacentMines(std::size_t adjacent_mines) {
    adjacent_mines_ = adjacent_mines;
  }

  // Uncovers the cell if it is closed.
  //
  // Returns false (and does nothing) if the cell is flagged or open.
  bool Open() {
    if (state_ != CellState::CLOSED) {
      return false;
    }
    state_ = CellState::OPEN;
    return true;
  }

  // Toggles a cell between flagged and closed.
  //
  // Returns false if the cell is open.
  bool ToggleFlagged() {
    switch (state_) {
      case CellState::CLOSED:
        state_ = CellState::FLAGGED;
        return true;
      case CellState::FLAGGED:
        state_ = CellState::CLOSED;
        return true;
      case CellState::OPEN:
        return false;
    }
    return false;
  }

  bool is_mine_ = false;
  CellState state_ = CellState::CLOSED;
  std::size_t adjacent_mines_ = 0;
};

}  // namespace sweeper

#endif  // SWEEPER_GAME_CELL_H_
