#include "sweeper/game/reveal.h"

#include <queue>

namespace sweeper {

namespace {

// Opens the cell at (row, col), which must be closed, and expands empty
// areas from it.
//
// visited is indexed by flat cell index and shared between calls made for a
// single chord, so that no cell is examined twice.
void Flood(Board& board, std::size_t row, std::size_t col,
           CascadePolicy policy, std::vector<bool>& visited,
           RevealResult& result) {
  visited[board.Index(row, col)] = true;
  if (!board.Open(row, col)) {
    return;
  }
  result.opened.push_back(CellLocation{row, col});

  // If a mine was uncovered there is nothing more to do.
  if (board(row, col).IsMine()) {
    result.hit_mine = true;
    return;
  }

  std::queue<CellLocation> expand_queue;
  auto open_cell = [&board, policy, &visited, &result, &expand_queue](
                       std::size_t row, std::size_t col) {
    const std::size_t index = board.Index(row, col);
    if (visited[index]) {
      return false;
    }
    visited[index] = true;

    if (board(row, col).IsFlagged() && policy == CascadePolicy::OPEN_FLAGGED &&
        board.ToggleFlagged(row, col)) {
      result.unflagged.push_back(CellLocation{row, col});
    }
    if (!board.Open(row, col)) {
      // Cell was flagged or already open.
      return false;
    }
    result.opened.push_back(CellLocation{row, col});

    if (board(row, col).GetAdjacentMines() == 0) {
      expand_queue.push(CellLocation{row, col});
    }
    return true;
  };

  if (board(row, col).GetAdjacentMines() == 0) {
    expand_queue.push(CellLocation{row, col});
  }

  // Automatically expand empty areas. A cell with no adjacent mines has no
  // mine neighbors, so nothing opened here can be a mine.
  while (!expand_queue.empty()) {
    const CellLocation location = expand_queue.front();
    expand_queue.pop();
    board.ForEachAdjacent(location.row, location.col, open_cell);
  }
}

}  // namespace

Error Reveal(Board& board, std::size_t row, std::size_t col,
             CascadePolicy policy, RevealResult& result) {
  result = RevealResult();
  if (!board.IsValid(row, col)) {
    return Error::OUT_OF_BOUNDS;
  }

  // Cannot uncover cells that are flagged or already open.
  if (!board(row, col).IsClosed()) {
    return Error::NONE;
  }

  std::vector<bool> visited(board.GetSize(), false);
  Flood(board, row, col, policy, visited, result);
  return Error::NONE;
}

Error Chord(Board& board, std::size_t row, std::size_t col,
            CascadePolicy policy, RevealResult& result) {
  result = RevealResult();
  if (!board.IsValid(row, col)) {
    return Error::OUT_OF_BOUNDS;
  }

  const Cell& cell = board(row, col);

  // Cannot chord a flagged or closed cell.
  if (!cell.IsOpen() || cell.IsMine()) {
    return Error::NONE;
  }

  // Cannot chord if the wrong number of cells are flagged.
  const std::size_t flagged = board.ForEachAdjacent(
      row, col, [&board](std::size_t row, std::size_t col) {
        return board(row, col).IsFlagged();
      });
  if (flagged != cell.GetAdjacentMines()) {
    return Error::NONE;
  }

  std::vector<CellLocation> closed;
  board.ForEachAdjacent(row, col,
                        [&board, &closed](std::size_t row, std::size_t col) {
                          if (board(row, col).IsClosed()) {
                            closed.push_back(CellLocation{row, col});
                          }
                          return false;
                        });

  std::vector<bool> visited(board.GetSize(), false);
  for (const CellLocation& location : closed) {
    if (visited[board.Index(location.row, location.col)]) {
      continue;
    }
    Flood(board, location.row, location.col, policy, visited, result);
    if (result.hit_mine) {
      break;
    }
  }
  return Error::NONE;
}

}  // namespace sweeper
