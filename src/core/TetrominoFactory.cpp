#include "core/TetrominoFactory.hpp"
#include <stdexcept>
#include <utility>

namespace blockfall::core {

TetrominoFactory::TetrominoFactory()
    : source_{std::make_shared<MersenneRandomSource>()}
{
}

TetrominoFactory::TetrominoFactory(RandomSourcePtr source)
    : source_{source ? std::move(source) : std::make_shared<MersenneRandomSource>()}
{
}

Tetromino TetrominoFactory::createRandom() {
    const std::size_t index = source_->nextIndex(kAllTetrominoTypes.size()); // 7 types
    if (index >= kAllTetrominoTypes.size()) {
        throw std::out_of_range("TetrominoFactory: random source returned an index out of range");
    }
    return Tetromino::standard(kAllTetrominoTypes[index]);
}

} // namespace blockfall::core
