#include "core/GameSession.hpp"
#include "core/LineClear.hpp"
#include <utility>

namespace blockfall::core {

namespace {

const GameConfig& validated(const GameConfig& config) {
    config.validate();
    return config;
}

} // namespace

GameSession::GameSession(GameConfig config,
                         RandomSourcePtr random,
                         CollisionOverridePtr collisionOverride)
    : config_{validated(config)}
    , collision_{std::move(collisionOverride)}
    , factory_{std::move(random)}
    , scoreManager_{config_.scoring}
    , levelManager_{config_.speed}
    , events_{}
    , grid_{createEmptyGrid(config_.boardHeight, config_.boardWidth)}
    , currentPiece_{}
    , nextPiece_{factory_.createRandom()}
    , phase_{GamePhase::Idle}
{
}

SessionState GameSession::snapshot() const {
    return SessionState{
        grid_,
        currentPiece_,
        nextPiece_,
        score(),
        level(),
        linesCleared(),
        phase_,
        dropIntervalMs(),
        sessionId_
    };
}

Grid GameSession::displayGrid() const {
    return currentPiece_ ? withPiece(grid_, *currentPiece_) : grid_;
}

void GameSession::start() {
    ++sessionId_;

    scoreManager_.reset();
    levelManager_.reset();
    grid_ = createEmptyGrid(config_.boardHeight, config_.boardWidth); // reset grid

    currentPiece_.reset();
    nextPiece_ = factory_.createRandom();

    setPhase(GamePhase::Playing);

    // No current piece yet: run the spawn step right away
    spawnNextPiece();

    flushEvents();
}

void GameSession::pause() {
    if (phase_ == GamePhase::Playing) {
        setPhase(GamePhase::Paused);
        flushEvents();
    }
}

void GameSession::resume() {
    if (phase_ == GamePhase::Paused) {
        setPhase(GamePhase::Playing);
        flushEvents();
    }
}

void GameSession::togglePause() {
    if (phase_ == GamePhase::Playing) {
        pause();
    } else if (phase_ == GamePhase::Paused) {
        resume();
    }
}

bool GameSession::moveDown() {
    if (!canAct()) return false;

    if (tryMove(0, 1)) {
        return true;
    }

    // Cannot move down => lock piece and spawn a new one
    const GamePiece landed = *currentPiece_;
    lockPiece(landed, false);
    spawnNextPiece();
    flushEvents();
    return false;
}

void GameSession::moveLeft() {
    if (!canAct()) return;
    tryMove(-1, 0);
}

void GameSession::moveRight() {
    if (!canAct()) return;
    tryMove(1, 0);
}

void GameSession::rotate() {
    if (!canAct()) return;

    GamePiece rotated{currentPiece_->tetromino.rotatedClockwise(), currentPiece_->position};
    if (collision_.isValidMove(grid_, rotated, rotated.position)) {
        currentPiece_ = std::move(rotated);
    }
    // No wall kicks: a colliding rotation is simply dropped
}

void GameSession::hardDrop() {
    if (!canAct()) return;

    GamePiece dropped = *currentPiece_;
    dropped.position = collision_.dropPosition(grid_, dropped);

    lockPiece(dropped, true);
    spawnNextPiece();
    flushEvents();
}

bool GameSession::spawnNextPiece() {
    GamePiece spawned{nextPiece_, config_.spawnPosition()};
    nextPiece_ = factory_.createRandom();

    if (!collision_.isValidMove(grid_, spawned, spawned.position)) {
        // Cannot spawn -> game over, the piece is never placed
        currentPiece_.reset();
        setPhase(GamePhase::GameOver);
        enqueue(GameEventKind::GameOver,
                GameOverEvent{score(), level(), linesCleared()});
        return false;
    }

    currentPiece_ = std::move(spawned);
    return true;
}

void GameSession::lockPiece(const GamePiece& piece, bool hardDrop) {
    currentPiece_.reset();

    auto [cleared, lines] = clearLines(placePiece(grid_, piece));
    grid_ = std::move(cleared);

    // Points use the level the piece landed on
    const std::uint64_t points = scoreManager_.addPlacement(lines, level(), hardDrop);
    enqueue(GameEventKind::PieceLocked,
            PieceLockedEvent{piece.tetromino.type(), piece.position, hardDrop, points});

    if (lines > 0) {
        const bool levelUp = levelManager_.onLinesCleared(lines);
        enqueue(GameEventKind::LinesCleared,
                LinesClearedEvent{lines, linesCleared(), score()});
        if (levelUp) {
            enqueue(GameEventKind::LevelUp, LevelUpEvent{level(), dropIntervalMs()});
        }
    }
}

bool GameSession::tryMove(int dx, int dy) {
    if (!currentPiece_) return false;

    const Position target{currentPiece_->position.x + dx, currentPiece_->position.y + dy};
    if (collision_.isValidMove(grid_, *currentPiece_, target)) {
        currentPiece_->position = target;
        return true;
    }
    return false;
}

void GameSession::setPhase(GamePhase phase) {
    if (phase == phase_) return;

    const GamePhase previous = phase_;
    phase_ = phase;
    enqueue(GameEventKind::PhaseChanged, PhaseChangedEvent{previous, phase});
}

std::vector<GameEvent> GameSession::takePendingEvents() {
    std::vector<GameEvent> taken;
    taken.swap(pendingEvents_);
    return taken;
}

void GameSession::flushEvents() {
    if (deferEvents_ || flushing_) return;

    struct FlushGuard {
        bool& flag;
        explicit FlushGuard(bool& f) : flag(f) { flag = true; }
        ~FlushGuard() { flag = false; }
    } guard{flushing_};

    while (!pendingEvents_.empty()) {
        std::vector<GameEvent> batch;
        batch.swap(pendingEvents_);
        for (const auto& event : batch) {
            events_.emit(event);
        }
    }
}

} // namespace blockfall::core
