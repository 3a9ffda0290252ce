#include <catch2/catch.hpp>

#include <memory>

#include "core/Collision.hpp"
#include "core/Grid.hpp"
#include "core/Tetromino.hpp"
#include "core/Types.hpp"

#include "FakeCollaborators.hpp"

using namespace blockfall::core;

namespace {

GamePiece pieceAt(TetrominoType type, int x, int y) {
    return GamePiece{Tetromino::standard(type), Position{x, y}};
}

} // namespace

TEST_CASE("isValidMove rejects cells past the walls or the floor", "[collision]") {
    const Grid g = createEmptyGrid();
    const GamePiece i = pieceAt(TetrominoType::I, 4, 0);

    REQUIRE(isValidMove(g, i, Position{0, 0}));
    REQUIRE(isValidMove(g, i, Position{6, 19}));

    REQUIRE_FALSE(isValidMove(g, i, Position{-1, 0}));
    REQUIRE_FALSE(isValidMove(g, i, Position{7, 0}));  // cell 10 is past the right wall
    REQUIRE_FALSE(isValidMove(g, i, Position{4, 20}));

    // Walls apply above the ceiling too
    REQUIRE_FALSE(isValidMove(g, i, Position{-1, -3}));
    REQUIRE_FALSE(isValidMove(g, i, Position{7, -3}));
}

TEST_CASE("isValidMove ignores occupancy above the visible grid", "[collision]") {
    Grid g = createEmptyGrid();
    for (int c = 0; c < g.cols(); ++c) {
        g.setCell(0, c, CellState::Filled);
    }

    const GamePiece t = pieceAt(TetrominoType::T, 3, 0);

    // Fully above the top row: allowed
    REQUIRE(isValidMove(g, t, Position{3, -2}));
    // Bottom row of the shape reaches row 0, which is filled
    REQUIRE_FALSE(isValidMove(g, t, Position{3, -1}));
}

TEST_CASE("isValidMove rejects overlap with locked cells", "[collision]") {
    Grid g = createEmptyGrid();
    g.setCell(10, 5, CellState::Filled);

    const GamePiece o = pieceAt(TetrominoType::O, 4, 0);

    REQUIRE_FALSE(isValidMove(g, o, Position{4, 9}));
    REQUIRE_FALSE(isValidMove(g, o, Position{5, 10}));
    REQUIRE(isValidMove(g, o, Position{6, 9}));
    REQUIRE(isValidMove(g, o, Position{4, 8}));
}

TEST_CASE("placePiece returns a new grid with the piece locked in", "[collision][placement]") {
    const Grid g = createEmptyGrid();
    const GamePiece i = pieceAt(TetrominoType::I, 4, 19);

    const Grid placed = placePiece(g, i);

    REQUIRE(g.filledCount() == 0); // input untouched
    REQUIRE(placed.filledCount() == 4);
    for (int c = 4; c <= 7; ++c) {
        REQUIRE(placed.cell(19, c) == CellState::Filled);
    }
}

TEST_CASE("placePiece drops cells above the visible grid", "[collision][placement]") {
    const Grid g = createEmptyGrid();
    const GamePiece vertical{Tetromino::standard(TetrominoType::I).rotatedClockwise(),
                             Position{0, -2}};

    const Grid placed = placePiece(g, vertical);

    REQUIRE(placed.filledCount() == 2);
    REQUIRE(placed.cell(0, 0) == CellState::Filled);
    REQUIRE(placed.cell(1, 0) == CellState::Filled);
}

TEST_CASE("withPiece tags the falling piece without locking it", "[collision][display]") {
    Grid g = createEmptyGrid();
    g.setCell(19, 0, CellState::Filled);

    // T at y = -1: its top row is above the grid and skipped
    const Grid shown = withPiece(g, pieceAt(TetrominoType::T, 3, -1));

    REQUIRE(shown.cell(0, 3) == CellState::Active);
    REQUIRE(shown.cell(0, 4) == CellState::Active);
    REQUIRE(shown.cell(0, 5) == CellState::Active);
    REQUIRE(shown.cell(19, 0) == CellState::Filled);
    REQUIRE(shown.filledCount() == 1);

    // Input untouched
    REQUIRE(g.cell(0, 4) == CellState::Empty);
}

TEST_CASE("calculateDropPosition finds the resting row", "[collision][drop]") {
    Grid g = createEmptyGrid();

    const GamePiece o = pieceAt(TetrominoType::O, 4, 0);
    REQUIRE(calculateDropPosition(g, o) == Position{4, 18});

    // A block at row 15 under column 5 stops the O two rows above it
    g.setCell(15, 5, CellState::Filled);
    REQUIRE(calculateDropPosition(g, o) == Position{4, 13});

    // Already resting: stays put
    const GamePiece resting = pieceAt(TetrominoType::O, 4, 13);
    REQUIRE(calculateDropPosition(g, resting) == Position{4, 13});
}

TEST_CASE("CollisionChecker defers to the rules without an override", "[collision][override]") {
    const Grid g = createEmptyGrid();
    const GamePiece i = pieceAt(TetrominoType::I, 4, 0);

    CollisionChecker checker;
    REQUIRE_FALSE(checker.hasOverride());
    REQUIRE(checker.isValidMove(g, i, Position{0, 0}));
    REQUIRE_FALSE(checker.isValidMove(g, i, Position{-1, 0}));
    REQUIRE(checker.dropPosition(g, i) == Position{4, 19});
}

TEST_CASE("CollisionChecker applies a forced verdict", "[collision][override]") {
    const Grid g = createEmptyGrid();
    const GamePiece i = pieceAt(TetrominoType::I, 4, 0);

    auto forced = std::make_shared<ForcedCollision>(false);
    CollisionChecker checker{forced};

    REQUIRE(checker.hasOverride());
    REQUIRE_FALSE(checker.isValidMove(g, i, Position{0, 0}));
    REQUIRE(checker.dropPosition(g, i) == Position{4, 0});

    // Undecided: normal rules apply
    forced->verdict = std::nullopt;
    REQUIRE(checker.isValidMove(g, i, Position{0, 0}));
    REQUIRE_FALSE(checker.isValidMove(g, i, Position{-1, 0}));
}

TEST_CASE("CollisionChecker drop stays bounded when everything is accepted", "[collision][override]") {
    const Grid g = createEmptyGrid();
    const GamePiece o = pieceAt(TetrominoType::O, 4, 0);

    CollisionChecker checker{std::make_shared<ForcedCollision>(true)};
    const Position pos = checker.dropPosition(g, o);

    REQUIRE(pos.x == 4);
    REQUIRE(pos.y == g.rows());
}
