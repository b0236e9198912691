#ifndef SWEEPER_GAME_REVEAL_H_
#define SWEEPER_GAME_REVEAL_H_

#include <cstddef>
#include <vector>

#include "sweeper/game/board.h"
#include "sweeper/game/error.h"
#include "sweeper/game/grid.h"

namespace sweeper {

// Controls how flagged cells are treated when an empty area is expanded.
enum class CascadePolicy {
  // Flagged cells are left alone. Only closed cells are opened.
  SKIP_FLAGGED,

  // Flags next to a cell with no adjacent mines are removed and the cells
  // opened. Such flags can never be on a mine.
  OPEN_FLAGGED,
};

// The cells changed by a single reveal or chord.
struct RevealResult {
  // Every cell opened, in the order it was opened. No location appears twice.
  // Empty if nothing changed.
  std::vector<CellLocation> opened;

  // Flags removed so their cells could be opened. Only filled in under
  // CascadePolicy::OPEN_FLAGGED. Every location here is also in opened.
  std::vector<CellLocation> unflagged;

  // True if one of the opened cells contains a mine.
  bool hit_mine = false;
};

// Uncovers the cell at (row, col).
//
// Does nothing if the cell is flagged or already open. Opening a mine stops
// immediately. Otherwise, if the cell has zero adjacent mines, the adjacent
// cells are uncovered breadth first, expanding through every cell that also
// has zero adjacent mines.
//
// Returns OUT_OF_BOUNDS (with an empty result) if the cell is not on the
// board.
Error Reveal(Board& board, std::size_t row, std::size_t col,
             CascadePolicy policy, RevealResult& result);

// Uncovers all closed cells adjacent to the open cell at (row, col).
//
// Does nothing unless the cell is open and exactly as many adjacent cells are
// flagged as it has adjacent mines. Each uncovered cell expands as in Reveal.
// Stops at the first mine.
//
// Returns OUT_OF_BOUNDS (with an empty result) if the cell is not on the
// board.
Error Chord(Board& board, std::size_t row, std::size_t col,
            CascadePolicy policy, RevealResult& result);

}  // namespace sweeper

#endif  // SWEEPER_GAME_REVEAL_H_
