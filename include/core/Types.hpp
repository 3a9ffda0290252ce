#pragma once // Include guard

#include <cstdint> // For fixed-width integer types
#include <array> // For std::array

// Namespace for the puzzle engine core types
namespace blockfall::core {

// Default playfield size shared by both game variants
inline constexpr int kDefaultBoardWidth  = 10;
inline constexpr int kDefaultBoardHeight = 20;

// Position of a shape's top-left corner on the grid.
// y may be negative while a piece is spawning above the visible rows.
struct Position {
    int x{};
    int y{};
};

inline bool operator==(Position a, Position b) noexcept {
    return a.x == b.x && a.y == b.y;
}

inline bool operator!=(Position a, Position b) noexcept {
    return !(a == b);
}

// Tetromino types
enum class TetrominoType : std::uint8_t {
    I, O, T, S, Z, J, L
};

inline constexpr int kTetrominoTypeCount = 7;

inline constexpr std::array<TetrominoType, kTetrominoTypeCount> kAllTetrominoTypes{
    TetrominoType::I, TetrominoType::O, TetrominoType::T, TetrominoType::S,
    TetrominoType::Z, TetrominoType::J, TetrominoType::L
};

inline char toChar(TetrominoType type) noexcept {
    switch (type) {
    case TetrominoType::I: return 'I';
    case TetrominoType::O: return 'O';
    case TetrominoType::T: return 'T';
    case TetrominoType::S: return 'S';
    case TetrominoType::Z: return 'Z';
    case TetrominoType::J: return 'J';
    case TetrominoType::L: return 'L';
    }
    return '?';
}

// Session lifecycle
enum class GamePhase : std::uint8_t {
    Idle,     // no game started yet
    Playing,
    Paused,
    GameOver  // terminal until the next start()
};

inline const char* toString(GamePhase phase) noexcept {
    switch (phase) {
    case GamePhase::Idle:     return "Idle";
    case GamePhase::Playing:  return "Playing";
    case GamePhase::Paused:   return "Paused";
    case GamePhase::GameOver: return "GameOver";
    }
    return "Unknown";
}

// RGB color carried for renderers; the engine never reads it
struct Color {
    std::uint8_t r{};
    std::uint8_t g{};
    std::uint8_t b{};
};

inline bool operator==(Color a, Color b) noexcept {
    return a.r == b.r && a.g == b.g && a.b == b.b;
}

} // namespace blockfall::core
