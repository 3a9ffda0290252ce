#include "core/Collision.hpp"
#include <utility>

namespace blockfall::core {

bool isValidMove(const Grid& grid, const GamePiece& piece, Position candidate) noexcept {
    const auto& shape = piece.tetromino.shape();

    for (int y = 0; y < static_cast<int>(shape.size()); ++y) {
        for (int x = 0; x < static_cast<int>(shape[y].size()); ++x) {
            if (shape[y][x] == 0) {
                continue;
            }

            const int boardX = candidate.x + x;
            const int boardY = candidate.y + y;

            if (boardX < 0 || boardX >= grid.cols() || boardY >= grid.rows()) {
                return false; // out of board
            }
            if (boardY >= 0 && grid.isOccupied(boardY, boardX)) {
                return false; // collision
            }
        }
    }
    return true;
}

Grid placePiece(const Grid& grid, const GamePiece& piece) {
    Grid placed = grid;
    for (const auto& b : piece.blocks()) {
        if (placed.isInside(b.y, b.x)) {
            placed.setCell(b.y, b.x, CellState::Filled);
        }
    }
    return placed;
}

Grid withPiece(const Grid& grid, const GamePiece& piece) {
    Grid overlay = grid;
    for (const auto& b : piece.blocks()) {
        if (overlay.isInside(b.y, b.x)) {
            overlay.setCell(b.y, b.x, CellState::Active);
        }
    }
    return overlay;
}

Position calculateDropPosition(const Grid& grid, const GamePiece& piece) noexcept {
    Position pos = piece.position;
    while (isValidMove(grid, piece, Position{pos.x, pos.y + 1})) {
        ++pos.y;
    }
    return pos;
}

CollisionChecker::CollisionChecker(CollisionOverridePtr override)
    : override_{std::move(override)}
{
}

bool CollisionChecker::isValidMove(const Grid& grid,
                                   const GamePiece& piece,
                                   Position candidate) const {
    if (override_) {
        if (auto forced = override_->check(grid, piece, candidate)) {
            return *forced;
        }
    }
    return core::isValidMove(grid, piece, candidate);
}

Position CollisionChecker::dropPosition(const Grid& grid, const GamePiece& piece) const {
    Position pos = piece.position;
    while (pos.y < grid.rows()
           && isValidMove(grid, piece, Position{pos.x, pos.y + 1})) {
        ++pos.y;
    }
    return pos;
}

} // namespace blockfall::core
