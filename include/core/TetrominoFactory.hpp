#pragma once

#include "RandomSource.hpp"
#include "Tetromino.hpp"

namespace blockfall::core {

class TetrominoFactory {
public:
    TetrominoFactory();

    // For deterministic games and tests; a null source falls back to the default
    explicit TetrominoFactory(RandomSourcePtr source);

    // Uniformly chosen standard piece
    Tetromino createRandom();

private:
    RandomSourcePtr source_;
};

} // namespace blockfall::core
