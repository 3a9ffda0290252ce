#include "core/Grid.hpp"
#include <algorithm>
#include <stdexcept>

namespace blockfall::core {

Grid::Grid(int rows, int cols)
    : rows_{rows}
    , cols_{cols}
{
    if (rows <= 0 || cols <= 0) {
        throw std::invalid_argument("Grid dimensions must be positive");
    }
    cells_.assign(static_cast<std::size_t>(rows) * static_cast<std::size_t>(cols),
                  CellState::Empty);
}

CellState Grid::cell(int row, int col) const {
    if (!isInside(row, col)) {
        throw std::out_of_range("Grid::cell out of range");
    }
    return cells_[index(row, col)];
}

void Grid::setCell(int row, int col, CellState state) {
    if (!isInside(row, col)) {
        throw std::out_of_range("Grid::setCell out of range");
    }
    cells_[index(row, col)] = state;
}

bool Grid::isOccupied(int row, int col) const noexcept {
    if (!isInside(row, col)) {
        return false;
    }
    return cells_[index(row, col)] != CellState::Empty;
}

bool Grid::isRowComplete(int row) const {
    if (row < 0 || row >= rows_) {
        throw std::out_of_range("Grid::isRowComplete out of range");
    }
    for (int col = 0; col < cols_; ++col) {
        if (cells_[index(row, col)] != CellState::Filled) {
            return false;
        }
    }
    return true;
}

std::size_t Grid::filledCount() const noexcept {
    return static_cast<std::size_t>(
        std::count(cells_.begin(), cells_.end(), CellState::Filled));
}

Grid createEmptyGrid(int rows, int cols) {
    return Grid{rows, cols};
}

} // namespace blockfall::core
