#pragma once

#include "Grid.hpp"

namespace blockfall::core {

struct LineClearResult {
    Grid grid;
    int linesCleared{};
};

// Removes every complete row, keeps the others in order and refills the top
// with empty rows. With nothing to clear the result equals the input.
LineClearResult clearLines(const Grid& grid);

} // namespace blockfall::core
