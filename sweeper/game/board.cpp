#include "sweeper/game/board.h"

#include <utility>

#include <glib.h>

namespace sweeper {

Board::Board(std::size_t rows, std::size_t cols) : grid_(rows, cols) {}

Error Board::Build(std::size_t rows, std::size_t cols,
                   const std::vector<CellLocation>& mines, Board& board) {
  if (!IsValidSize(rows, cols) || mines.size() >= rows * cols) {
    g_warning("Cannot build a %zux%zu board with %zu mines", rows, cols,
              mines.size());
    return Error::INVALID_CONFIGURATION;
  }

  Board built(rows, cols);
  for (const CellLocation& mine : mines) {
    if (!built.IsValid(mine.row, mine.col)) {
      g_warning("Mine at (%zu, %zu) is outside a %zux%zu board", mine.row,
                mine.col, rows, cols);
      return Error::INVALID_CONFIGURATION;
    }
    if (!built.grid_(mine.row, mine.col).SetMine()) {
      g_warning("Mine at (%zu, %zu) is listed twice", mine.row, mine.col);
      return Error::INVALID_CONFIGURATION;
    }
  }
  built.mines_ = mines.size();

  built.grid_.ForEach(
      [&built](std::size_t row, std::size_t col, Cell& cell) {
        cell.SetAdjacentMines(CountAdjacentMines(built, row, col));
      });

  board = std::move(built);
  return Error::NONE;
}

bool Board::Open(std::size_t row, std::size_t col) {
  Cell& cell = grid_(row, col);
  if (!cell.Open()) {
    return false;
  }
  if (!cell.IsMine()) {
    ++opened_;
  }
  return true;
}

bool Board::ToggleFlagged(std::size_t row, std::size_t col) {
  Cell& cell = grid_(row, col);
  if (!cell.ToggleFlagged()) {
    return false;
  }
  if (cell.IsFlagged()) {
    ++flags_;
  } else {
    --flags_;
  }
  return true;
}

std::size_t CountAdjacentMines(const Board& board, std::size_t row,
                               std::size_t col) {
  return board.ForEachAdjacent(row, col,
                               [&board](std::size_t row, std::size_t col) {
                                 return board(row, col).IsMine();
                               });
}

}  // namespace sweeper
