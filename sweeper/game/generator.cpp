#include "sweeper/game/generator.h"

#include <random>
#include <utility>
#include <vector>

#include <glib.h>

#include "sweeper/game/grid.h"

namespace sweeper {

namespace {

// Returns true if (row, col) is within one step of (safe_row, safe_col).
bool IsNear(std::size_t row, std::size_t col, std::size_t safe_row,
            std::size_t safe_col) {
  const std::size_t dr = row > safe_row ? row - safe_row : safe_row - row;
  const std::size_t dc = col > safe_col ? col - safe_col : safe_col - col;
  return dr <= 1 && dc <= 1;
}

}  // namespace

Error GenerateBoard(std::size_t rows, std::size_t cols, std::size_t mines,
                    std::size_t safe_row, std::size_t safe_col, unsigned seed,
                    Board& board) {
  if (!IsValidSize(rows, cols) || mines >= rows * cols) {
    g_warning("Cannot generate a %zux%zu board with %zu mines", rows, cols,
              mines);
    return Error::INVALID_CONFIGURATION;
  }
  if (safe_row >= rows || safe_col >= cols) {
    g_warning("Safe cell (%zu, %zu) is outside a %zux%zu board", safe_row,
              safe_col, rows, cols);
    return Error::OUT_OF_BOUNDS;
  }

  // Collect the cells a mine may go in, sparing the whole safe zone if there
  // is room.
  std::vector<CellLocation> candidates;
  candidates.reserve(rows * cols);
  for (std::size_t row = 0; row < rows; ++row) {
    for (std::size_t col = 0; col < cols; ++col) {
      if (!IsNear(row, col, safe_row, safe_col)) {
        candidates.push_back(CellLocation{row, col});
      }
    }
  }
  if (candidates.size() < mines) {
    g_debug("Safe zone too large for %zu mines, sparing only (%zu, %zu)",
            mines, safe_row, safe_col);
    candidates.clear();
    for (std::size_t row = 0; row < rows; ++row) {
      for (std::size_t col = 0; col < cols; ++col) {
        if (row != safe_row || col != safe_col) {
          candidates.push_back(CellLocation{row, col});
        }
      }
    }
  }

  // Partial Fisher-Yates shuffle: the first `mines` candidates become mines.
  std::default_random_engine g;
  g.seed(seed);
  for (std::size_t i = 0; i < mines; ++i) {
    std::uniform_int_distribution<std::size_t> d(i, candidates.size() - 1);
    std::swap(candidates[i], candidates[d(g)]);
  }
  candidates.resize(mines);

  g_debug("Placed %zu mines on a %zux%zu board (seed %u)", mines, rows, cols,
          seed);
  return Board::Build(rows, cols, candidates, board);
}

}  // namespace sweeper
