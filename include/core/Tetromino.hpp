#pragma once // Include guard

#include "Types.hpp" // For Position, Color, TetrominoType
#include <cstdint>
#include <vector>

// Namespace for the puzzle engine core types
namespace blockfall::core {

// Immutable piece definition: a rectangular 0/1 matrix in local coordinates.
// Rotation produces a new Tetromino whose matrix may have swapped dimensions.
class Tetromino {
public:
    using Row   = std::vector<std::uint8_t>;
    using Shape = std::vector<Row>;

    // Throws std::invalid_argument if the shape is empty, not rectangular
    // or has no occupied cell
    Tetromino(TetrominoType type, Shape shape, Color color);

    // One of the seven standard pieces in spawn orientation
    static Tetromino standard(TetrominoType type);

    TetrominoType type() const noexcept { return type_; }
    const Shape& shape() const noexcept { return shape_; }
    Color color() const noexcept { return color_; }

    int height() const noexcept { return static_cast<int>(shape_.size()); }
    int width() const noexcept { return static_cast<int>(shape_.front().size()); }

    bool occupies(int localX, int localY) const noexcept;

    // 90 degrees clockwise
    Tetromino rotatedClockwise() const;

    // Board coordinates of the occupied cells when the top-left is at origin
    std::vector<Position> blocksAt(Position origin) const;

    friend bool operator==(const Tetromino& a, const Tetromino& b) noexcept {
        return a.type_ == b.type_ && a.shape_ == b.shape_;
    }
    friend bool operator!=(const Tetromino& a, const Tetromino& b) noexcept {
        return !(a == b);
    }

private:
    TetrominoType type_;
    Shape shape_;
    Color color_;

    static Shape shapeFor(TetrominoType type);
    static Color colorFor(TetrominoType type) noexcept;
};

// Cell (i, j) of an R x C source lands on (j, R - 1 - i) of the C x R result
Tetromino::Shape rotateShape(const Tetromino::Shape& shape);

// A tetromino placed on the board
struct GamePiece {
    Tetromino tetromino;
    Position position;

    std::vector<Position> blocks() const { return tetromino.blocksAt(position); }
};

} // namespace blockfall::core
