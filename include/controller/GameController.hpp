#pragma once

#include "core/GameSession.hpp"
#include "controller/InputAction.hpp"
#include <chrono>
#include <cstdint>

namespace blockfall::controller {

class GameController {
public:
    using Clock = std::chrono::steady_clock;
    using Duration = std::chrono::milliseconds;

    /// Controller does not own the GameSession; caller keeps it alive.
    explicit GameController(blockfall::core::GameSession& session);

    /// Handle a single discrete player action (e.g. key press).
    void handleAction(InputAction action);

    // Called periodically with elapsed time since last call.
    // It accumulates time and performs gravity ticks when the
    // accumulated time exceeds the current drop interval.
    // The accumulator is dropped whenever the session is not Playing,
    // a new session was started, or the interval changed (level up).
    void update(Duration elapsed);

    // Reset timing accumulator (e.g. when game is reset)
    void resetTiming();

    Duration accumulated() const noexcept { return accumulated_; }

private:
    blockfall::core::GameSession& session_;
    Duration accumulated_{0};

    // What the pending time was accumulated for
    std::uint64_t armedSessionId_{0};
    int armedIntervalMs_{0};

    bool isArmedFor(std::uint64_t sessionId, int intervalMs) const noexcept {
        return armedSessionId_ == sessionId && armedIntervalMs_ == intervalMs;
    }
    void rearm();
};

} // namespace blockfall::controller
