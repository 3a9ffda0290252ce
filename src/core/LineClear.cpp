#include "core/LineClear.hpp"

namespace blockfall::core {

LineClearResult clearLines(const Grid& grid) {
    const int rows = grid.rows();
    const int cols = grid.cols();

    Grid compacted{rows, cols};

    // Go bottom-up, copying surviving rows to the lowest free row
    int target = rows - 1;
    for (int row = rows - 1; row >= 0; --row) {
        if (grid.isRowComplete(row)) {
            continue;
        }
        for (int col = 0; col < cols; ++col) {
            compacted.setCell(target, col, grid.cell(row, col));
        }
        --target;
    }

    // Rows 0..target stay empty: they replace the cleared ones
    return LineClearResult{compacted, target + 1};
}

} // namespace blockfall::core
