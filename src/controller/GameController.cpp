#include "controller/GameController.hpp"

namespace blockfall::controller {

GameController::GameController(blockfall::core::GameSession& session)
    : session_{session}
{
    rearm();
}

void GameController::handleAction(InputAction action) {
    using core::GamePhase;

    // Once the game is over only a new game gets through;
    // the session would ignore the rest anyway.
    if (session_.phase() == GamePhase::GameOver && action != InputAction::NewGame) {
        return;
    }

    switch (action) {
    case InputAction::MoveLeft:
        session_.moveLeft();
        break;
    case InputAction::MoveRight:
        session_.moveRight();
        break;
    case InputAction::SoftDrop:
        session_.moveDown();
        break;
    case InputAction::HardDrop:
        session_.hardDrop();
        // After a hard drop, we reset the gravity accumulator
        // so the next piece won't instantly tick.
        resetTiming();
        break;
    case InputAction::Rotate:
        session_.rotate();
        break;
    case InputAction::PauseResume:
        session_.togglePause();
        break;
    case InputAction::NewGame:
        session_.start();
        resetTiming();
        break;
    }
}

void GameController::update(Duration elapsed) {
    using core::GamePhase;

    if (session_.phase() != GamePhase::Playing) {
        // Paused, over or idle: nothing may carry over to a later resume
        accumulated_ = Duration{0};
        return;
    }

    if (!isArmedFor(session_.sessionId(), session_.dropIntervalMs())) {
        rearm();
    }

    const int intervalMs = session_.dropIntervalMs();
    if (intervalMs <= 0) {
        return;
    }

    accumulated_ += elapsed;

    const Duration interval{intervalMs};
    const std::uint64_t sessionId = session_.sessionId();

    // If a lot of time passed (lag), we might need several ticks
    while (accumulated_ >= interval && session_.phase() == GamePhase::Playing) {
        session_.tick();
        accumulated_ -= interval;

        if (session_.phase() != GamePhase::Playing) {
            accumulated_ = Duration{0};
            break;
        }
        if (!isArmedFor(sessionId, session_.dropIntervalMs())) {
            // Level changed the speed: restart the period at the new interval
            rearm();
            break;
        }
    }
}

void GameController::resetTiming() {
    rearm();
}

void GameController::rearm() {
    accumulated_ = Duration{0};
    armedSessionId_ = session_.sessionId();
    armedIntervalMs_ = session_.dropIntervalMs();
}

} // namespace blockfall::controller
