#pragma once

#include "Types.hpp"
#include <cstddef>
#include <vector>

namespace blockfall::core {

// Numeric tags match the board encoding used by renderers:
// 0 = empty, 1 = locked block, 2 = active piece overlay (display only).
enum class CellState : std::uint8_t {
    Empty  = 0,
    Filled = 1,
    Active = 2
};

// Fixed-size occupancy matrix. Engine operations treat a Grid as a value:
// they take a const reference and hand back a new Grid.
class Grid {
public:
    Grid(int rows, int cols);

    int rows() const noexcept { return rows_; }
    int cols() const noexcept { return cols_; }

    CellState cell(int row, int col) const;
    void setCell(int row, int col, CellState state);

    bool isInside(int row, int col) const noexcept {
        return row >= 0 && row < rows_ && col >= 0 && col < cols_;
    }

    // Non-empty cell inside the grid; false for anything outside
    bool isOccupied(int row, int col) const noexcept;

    // True if every cell of the row is a locked block
    bool isRowComplete(int row) const;

    std::size_t filledCount() const noexcept;

    friend bool operator==(const Grid& a, const Grid& b) noexcept {
        return a.rows_ == b.rows_ && a.cols_ == b.cols_ && a.cells_ == b.cells_;
    }
    friend bool operator!=(const Grid& a, const Grid& b) noexcept {
        return !(a == b);
    }

private:
    int rows_;
    int cols_;
    std::vector<CellState> cells_; // rows_ * cols_

    int index(int row, int col) const noexcept {
        return row * cols_ + col;
    }
};

Grid createEmptyGrid(int rows = kDefaultBoardHeight, int cols = kDefaultBoardWidth);

} // namespace blockfall::core
