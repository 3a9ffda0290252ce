#include "core/Tetromino.hpp"
#include <stdexcept>
#include <utility>

namespace blockfall::core {

namespace {

void validateShape(const Tetromino::Shape& shape) {
    if (shape.empty() || shape.front().empty()) {
        throw std::invalid_argument("Tetromino shape must not be empty");
    }
    const auto width = shape.front().size();
    bool anyBlock = false;
    for (const auto& row : shape) {
        if (row.size() != width) {
            throw std::invalid_argument("Tetromino shape must be rectangular");
        }
        for (auto v : row) {
            anyBlock = anyBlock || v != 0;
        }
    }
    if (!anyBlock) {
        throw std::invalid_argument("Tetromino shape must have at least one block");
    }
}

} // namespace

Tetromino::Tetromino(TetrominoType type, Shape shape, Color color)
    : type_{type}, shape_{std::move(shape)}, color_{color}
{
    validateShape(shape_);
}

Tetromino Tetromino::standard(TetrominoType type) {
    return Tetromino{type, shapeFor(type), colorFor(type)};
}

bool Tetromino::occupies(int localX, int localY) const noexcept {
    if (localY < 0 || localY >= height() || localX < 0 || localX >= width()) {
        return false;
    }
    return shape_[localY][localX] != 0;
}

Tetromino Tetromino::rotatedClockwise() const {
    return Tetromino{type_, rotateShape(shape_), color_};
}

std::vector<Position> Tetromino::blocksAt(Position origin) const {
    std::vector<Position> blocks;
    blocks.reserve(4);
    for (int y = 0; y < height(); ++y) {
        for (int x = 0; x < width(); ++x) {
            if (shape_[y][x] != 0) {
                blocks.push_back(Position{origin.x + x, origin.y + y});
            }
        }
    }
    return blocks;
}

Tetromino::Shape Tetromino::shapeFor(TetrominoType type) {
    switch (type) {
    case TetrominoType::I:
        // [ ][ ][ ][ ]
        return {{1, 1, 1, 1}};

    case TetrominoType::O:
        return {{1, 1},
                {1, 1}};

    case TetrominoType::T:
        //    [ ]
        // [ ][ ][ ]
        return {{0, 1, 0},
                {1, 1, 1}};

    case TetrominoType::S:
        //    [ ][ ]
        // [ ][ ]
        return {{0, 1, 1},
                {1, 1, 0}};

    case TetrominoType::Z:
        // [ ][ ]
        //    [ ][ ]
        return {{1, 1, 0},
                {0, 1, 1}};

    case TetrominoType::J:
        // [ ]
        // [ ][ ][ ]
        return {{1, 0, 0},
                {1, 1, 1}};

    case TetrominoType::L:
        //       [ ]
        // [ ][ ][ ]
        return {{0, 0, 1},
                {1, 1, 1}};
    }

    throw std::invalid_argument("Unknown tetromino type");
}

Color Tetromino::colorFor(TetrominoType type) noexcept {
    switch (type) {
    case TetrominoType::I: return Color{0x00, 0xf0, 0xf0};
    case TetrominoType::O: return Color{0xf0, 0xf0, 0x00};
    case TetrominoType::T: return Color{0xa0, 0x00, 0xf0};
    case TetrominoType::S: return Color{0x00, 0xf0, 0x00};
    case TetrominoType::Z: return Color{0xf0, 0x00, 0x00};
    case TetrominoType::J: return Color{0x00, 0x00, 0xf0};
    case TetrominoType::L: return Color{0xf0, 0xa0, 0x00};
    }
    return Color{0xc8, 0xc8, 0xc8};
}

Tetromino::Shape rotateShape(const Tetromino::Shape& shape) {
    validateShape(shape);

    const auto rows = shape.size();
    const auto cols = shape.front().size();

    Tetromino::Shape rotated(cols, Tetromino::Row(rows, 0));
    for (std::size_t i = 0; i < rows; ++i) {
        for (std::size_t j = 0; j < cols; ++j) {
            rotated[j][rows - 1 - i] = shape[i][j];
        }
    }
    return rotated;
}

} // namespace blockfall::core
