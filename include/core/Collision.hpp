#pragma once

#include "Grid.hpp"
#include "Tetromino.hpp"
#include "Types.hpp"
#include <memory>
#include <optional>

namespace blockfall::core {

// True if every occupied cell of the piece, moved to `candidate`, stays
// between the side walls, above the floor and off locked cells.
// Cells above the top row are only checked against the walls and floor.
bool isValidMove(const Grid& grid, const GamePiece& piece, Position candidate) noexcept;

// Copy of `grid` with the piece locked in. Cells above the top row are dropped.
Grid placePiece(const Grid& grid, const GamePiece& piece);

// Copy of `grid` with the piece's cells tagged CellState::Active, for
// renderers. Cells outside the grid are skipped.
Grid withPiece(const Grid& grid, const GamePiece& piece);

// Lowest valid position straight below the piece (hard drop target)
Position calculateDropPosition(const Grid& grid, const GamePiece& piece) noexcept;

// Strategy that can force a collision verdict, used to drive the session
// into states that are hard to reach by playing (tests, replays).
class ICollisionOverride {
public:
    virtual ~ICollisionOverride() = default;

    // Return a verdict to force it, or std::nullopt to apply the normal rules.
    virtual std::optional<bool> check(const Grid& grid,
                                      const GamePiece& piece,
                                      Position candidate) const = 0;
};

using CollisionOverridePtr = std::shared_ptr<const ICollisionOverride>;

// The collision predicate as seen by the session: the optional override
// first, then isValidMove().
class CollisionChecker {
public:
    explicit CollisionChecker(CollisionOverridePtr override = nullptr);

    bool isValidMove(const Grid& grid, const GamePiece& piece, Position candidate) const;

    // Like calculateDropPosition(), bounded by the grid height so an override
    // that accepts everything cannot loop forever.
    Position dropPosition(const Grid& grid, const GamePiece& piece) const;

    bool hasOverride() const noexcept { return override_ != nullptr; }

private:
    CollisionOverridePtr override_;
};

} // namespace blockfall::core
