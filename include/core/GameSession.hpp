#pragma once

#include "Collision.hpp"
#include "GameConfig.hpp"
#include "GameEvents.hpp"
#include "Grid.hpp"
#include "LevelManager.hpp"
#include "RandomSource.hpp"
#include "ScoreManager.hpp"
#include "Tetromino.hpp"
#include "TetrominoFactory.hpp"
#include <cstdint>
#include <optional>
#include <vector>

namespace blockfall::core {

// Read-only copy of everything a renderer needs to redraw
struct SessionState {
    Grid grid;
    std::optional<GamePiece> currentPiece;
    Tetromino nextPiece;
    std::uint64_t score{};
    int level{1};
    std::uint64_t linesCleared{};
    GamePhase phase{GamePhase::Idle};
    int dropIntervalMs{};
    std::uint64_t sessionId{};
};

// One play surface: grid, falling piece, preview, score and lifecycle.
// Not thread-safe; RealtimeLoop serializes access when threads are involved.
class GameSession {
public:
    explicit GameSession(GameConfig config = GameConfig::tetris(),
                         RandomSourcePtr random = nullptr,
                         CollisionOverridePtr collisionOverride = nullptr);

    const GameConfig& config() const noexcept { return config_; }

    const Grid& grid() const noexcept { return grid_; }
    const std::optional<GamePiece>& currentPiece() const noexcept { return currentPiece_; }
    const Tetromino& nextPiece() const noexcept { return nextPiece_; }

    std::uint64_t score() const noexcept { return scoreManager_.score(); }
    int level() const noexcept { return levelManager_.level(); }
    std::uint64_t linesCleared() const noexcept { return levelManager_.totalLinesCleared(); }
    GamePhase phase() const noexcept { return phase_; }

    // Gravity period for the tick driver; changes on level up
    int dropIntervalMs() const noexcept { return levelManager_.dropIntervalMs(); }

    // Incremented by every start(); lets timers tell sessions apart
    std::uint64_t sessionId() const noexcept { return sessionId_; }

    SessionState snapshot() const;

    // withPiece() of the grid and the falling piece, if any
    Grid displayGrid() const;

    EventDispatcher& events() noexcept { return events_; }

    // With deferred delivery on, commands leave their events queued and the
    // owner hands them to events() itself, typically outside its own lock.
    void setDeferredEventDelivery(bool deferred) noexcept { deferEvents_ = deferred; }
    bool deferredEventDelivery() const noexcept { return deferEvents_; }

    // Queued events in the order they were produced; the queue is left empty
    std::vector<GameEvent> takePendingEvents();

    // Lifecycle
    void start();
    void pause();
    void resume();
    void togglePause();

    // One gravity step (called by the tick driver).
    // Returns true if the piece moved down; false if it locked or nothing ran.
    bool tick() { return moveDown(); }

    // Player actions
    bool moveDown();  // soft drop: one row down, lock when blocked
    void moveLeft();
    void moveRight();
    void rotate();    // clockwise, no wall kicks
    void hardDrop();  // drop to the bottom and lock with a bonus

private:
    GameConfig config_;
    CollisionChecker collision_;
    TetrominoFactory factory_;
    ScoreManager scoreManager_;
    LevelManager levelManager_;
    EventDispatcher events_;

    Grid grid_;
    std::optional<GamePiece> currentPiece_;
    Tetromino nextPiece_;

    GamePhase phase_{GamePhase::Idle};
    std::uint64_t sessionId_{0};

    std::vector<GameEvent> pendingEvents_;
    bool deferEvents_{false};
    bool flushing_{false};

    bool canAct() const noexcept {
        return phase_ == GamePhase::Playing && currentPiece_.has_value();
    }

    bool spawnNextPiece();
    void lockPiece(const GamePiece& piece, bool hardDrop);
    bool tryMove(int dx, int dy);
    void setPhase(GamePhase phase);

    template <typename Payload>
    void enqueue(GameEventKind kind, Payload payload) {
        pendingEvents_.push_back(GameEvent{kind, sessionId_, std::move(payload)});
    }

    // Events are delivered once the command has finished mutating state.
    // A command issued from a handler queues its events behind the batch
    // being delivered.
    void flushEvents();
};

} // namespace blockfall::core
