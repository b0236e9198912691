#ifndef SWEEPER_GAME_BOARD_H_
#define SWEEPER_GAME_BOARD_H_

#include <cstddef>
#include <vector>

#include "sweeper/game/cell.h"
#include "sweeper/game/error.h"
#include "sweeper/game/grid.h"

namespace sweeper {

// A rectangular field of cells with a fixed set of mines.
//
// Mine positions and adjacent mine counts are fixed when the board is built.
// Afterwards only cell states change, through Open and ToggleFlagged.
class Board {
 public:
  // Creates an empty board with no cells.
  Board() = default;

  // Creates a board of the given size with every cell closed and no mines.
  Board(std::size_t rows, std::size_t cols);

  ~Board() = default;

  // Copyable.
  Board(const Board&) = default;
  Board& operator=(const Board&) = default;

  // Movable.
  Board(Board&&) = default;
  Board& operator=(Board&&) = default;

  // Builds a board with mines at exactly the given locations.
  //
  // Returns INVALID_CONFIGURATION if either dimension is zero, if the cell
  // count does not fit in a std::size_t, if a location is outside the board or
  // repeated, or if every cell would be a mine. The output board is only
  // assigned on success.
  static Error Build(std::size_t rows, std::size_t cols,
                     const std::vector<CellLocation>& mines, Board& board);

  // Returns the number of rows.
  std::size_t GetRows() const { return grid_.GetRows(); }

  // Returns the number of columns.
  std::size_t GetCols() const { return grid_.GetCols(); }

  // Returns the number of mines.
  std::size_t GetMines() const { return mines_; }

  // Returns the number of open cells that do not contain a mine.
  std::size_t GetOpened() const { return opened_; }

  // Returns the number of flagged cells.
  std::size_t GetFlags() const { return flags_; }

  // Returns true if every cell without a mine is open.
  bool IsCleared() const { return opened_ == grid_.GetSize() - mines_; }

  // Returns true if the given row and column are on the board.
  bool IsValid(std::size_t row, std::size_t col) const {
    return grid_.IsValid(row, col);
  }

  // Returns the flat index of the given row and column.
  std::size_t Index(std::size_t row, std::size_t col) const {
    return grid_.Index(row, col);
  }

  // Returns the total number of cells.
  std::size_t GetSize() const { return grid_.GetSize(); }

  // Returns the Cell at the specified row and column.
  const Cell& operator()(std::size_t row, std::size_t col) const {
    return grid_(row, col);
  }

  // Calls fn(row, col, cell) for each cell on the board.
  template <class Fn>
  void ForEach(Fn fn) const {
    grid_.ForEach(fn);
  }

  // Calls fn(row, col) for each cell adjacent to the given one, and returns
  // the number of calls that returned true.
  template <class Fn>
  std::size_t ForEachAdjacent(std::size_t row, std::size_t col, Fn fn) const {
    return grid_.ForEachAdjacent(row, col, fn);
  }

  // Opens a closed cell.
  //
  // Returns false (and does nothing) if the cell is open or flagged.
  bool Open(std::size_t row, std::size_t col);

  // Toggles a cell between closed and flagged.
  //
  // Returns false (and does nothing) if the cell is open.
  bool ToggleFlagged(std::size_t row, std::size_t col);

 private:
  Grid<Cell> grid_;
  std::size_t mines_ = 0;
  std::size_t opened_ = 0;
  std::size_t flags_ = 0;
};

// Counts the mines in the cells adjacent to the given one.
std::size_t CountAdjacentMines(const Board& board, std::size_t row,
                               std::size_t col);

}  // namespace sweeper

#endif  // SWEEPER_GAME_BOARD_H_
