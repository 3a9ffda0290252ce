#include "core/GameConfig.hpp"
#include <stdexcept>

namespace blockfall::core {

namespace {
// Widest (and, rotated, tallest) standard piece is the I piece
constexpr int kMinBoardSide = 4;
}

GameConfig GameConfig::tetris() {
    GameConfig cfg;
    cfg.gameId = "tetris";
    cfg.recordHighScores = false;
    return cfg;
}

GameConfig GameConfig::lineDestroyer() {
    GameConfig cfg;
    cfg.gameId = "lineDestroyer";
    cfg.recordHighScores = true;
    return cfg;
}

void GameConfig::validate() const {
    if (boardWidth < kMinBoardSide || boardHeight < kMinBoardSide) {
        throw std::invalid_argument("GameConfig: board must be at least 4x4");
    }
    if (speed.linesPerLevel <= 0) {
        throw std::invalid_argument("GameConfig: linesPerLevel must be positive");
    }
    if (speed.baseIntervalMs <= 0 || speed.minIntervalMs <= 0) {
        throw std::invalid_argument("GameConfig: drop intervals must be positive");
    }
    if (speed.stepMs < 0) {
        throw std::invalid_argument("GameConfig: stepMs must not be negative");
    }
    if (recordHighScores && gameId.empty()) {
        throw std::invalid_argument("GameConfig: gameId is required to record high scores");
    }
}

} // namespace blockfall::core
