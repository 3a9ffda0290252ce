#pragma once

#include <cstdint>
#include <string>

#include "core/Types.hpp"

namespace blockfall::core {

struct ScoringRules {
    std::uint64_t pointsPerLine{100}; // multiplied by lines and current level
    std::uint64_t hardDropBonus{20};  // flat, even when no line is cleared
};

struct SpeedCurve {
    int linesPerLevel{10};
    int baseIntervalMs{1000}; // interval at level 1
    int stepMs{50};           // removed per level
    int minIntervalMs{50};
};

// Everything that differs between the game variants built on the engine.
struct GameConfig {
    std::string gameId{"tetris"};         // key used by the high-score store

    int boardWidth{kDefaultBoardWidth};
    int boardHeight{kDefaultBoardHeight};

    ScoringRules scoring{};
    SpeedCurve speed{};

    bool recordHighScores{false};         // hand the final score to a high-score store

    static GameConfig tetris();
    static GameConfig lineDestroyer();

    // Throws std::invalid_argument describing the first bad field
    void validate() const;

    Position spawnPosition() const noexcept {
        return Position{boardWidth / 2 - 1, 0};
    }
};

} // namespace blockfall::core
