#ifndef SWEEPER_GAME_GRID_H_
#define SWEEPER_GAME_GRID_H_

#include <cstddef>
#include <limits>
#include <vector>

namespace sweeper {

// A row and column on a grid.
struct CellLocation {
  std::size_t row;
  std::size_t col;
};

inline bool operator==(const CellLocation& a, const CellLocation& b) {
  return a.row == b.row && a.col == b.col;
}

inline bool operator!=(const CellLocation& a, const CellLocation& b) {
  return !(a == b);
}

// Returns true if a grid of rows x cols has at least one cell and its cell
// count fits in a std::size_t.
inline bool IsValidSize(std::size_t rows, std::size_t cols) {
  return rows > 0 && cols > 0 &&
         cols <= std::numeric_limits<std::size_t>::max() / rows;
}

// Represents a two dimensional grid of Cells.
//
// Cells are stored row-major in a single vector, so the cell at (row, col)
// lives at index row * cols + col.
template <typename Cell>
class Grid {
 public:
  Grid() : Grid(0, 0) {}

  Grid(std::size_t rows, std::size_t cols) { Reset(rows, cols); }

  ~Grid() = default;

  // Copyable.
  Grid(const Grid&) = default;
  Grid& operator=(const Grid&) = default;

  // Movable.
  Grid(Grid&&) = default;
  Grid& operator=(Grid&&) = default;

  // Resets the grid with new set of default constructed cells at the
  // specified dimensions.
  void Reset(std::size_t rows, std::size_t cols) {
    rows_ = rows;
    cols_ = cols;
    cells_.assign(rows * cols, Cell());
  }

  // Returns the number of rows.
  std::size_t GetRows() const { return rows_; }

  // Returns the number of columns.
  std::size_t GetCols() const { return cols_; }

  // Returns the total number of cells.
  std::size_t GetSize() const { return cells_.size(); }

  // Returns true if the given row and column are valid.
  bool IsValid(std::size_t row, std::size_t col) const {
    return row < rows_ && col < cols_;
  }

  // Returns the flat index of the specified row and column.
  std::size_t Index(std::size_t row, std::size_t col) const {
    return row * cols_ + col;
  }

  // Returns the Cell at the specified row and column.
  const Cell& operator()(std::size_t row, std::size_t col) const {
    return cells_[Index(row, col)];
  }

  // Returns the Cell at the specified row and column.
  Cell& operator()(std::size_t row, std::size_t col) {
    return cells_[Index(row, col)];
  }

  // Calls the provided function object for each Cell in the grid.
  //
  // The function should be callable as:
  //   fn(row, col, cell);
  template <class Fn>
  void ForEach(Fn fn) {
    for (std::size_t i = 0; i < cells_.size(); ++i) {
      fn(i / cols_, i % cols_, cells_[i]);
    }
  }

  template <class Fn>
  void ForEach(Fn fn) const {
    for (std::size_t i = 0; i < cells_.size(); ++i) {
      fn(i / cols_, i % cols_, cells_[i]);
    }
  }

  // Calls the provided function object for each of the valid adjacent cells.
  //
  // The function should be callable as:
  //   bool v = fn(row, col);
  //
  // Returns the number of function calls that returned true.
  template <class Fn>
  std::size_t ForEachAdjacent(std::size_t row, std::size_t col, Fn fn) const {
    static const int kOffsets[8][2] = {
        {-1, -1}, {-1, 0}, {-1, 1}, {0, -1}, {0, 1}, {1, -1}, {1, 0}, {1, 1},
    };

    // Note: This relies on the fact that unsigned underflow is well defined.
    std::size_t count = 0;
    for (const auto& offset : kOffsets) {
      const std::size_t r = row + static_cast<std::size_t>(offset[0]);
      const std::size_t c = col + static_cast<std::size_t>(offset[1]);
      if (IsValid(r, c) && fn(r, c)) {
        ++count;
      }
    }
    return count;
  }

 private:
  std::size_t rows_;
  std::size_t cols_;
  std::vector<Cell> cells_;
};

}  // namespace sweeper

#endif  // SWEEPER_GAME_GRID_H_
