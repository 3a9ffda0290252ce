#include <catch2/catch.hpp>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "core/GameConfig.hpp"
#include "core/GameEvents.hpp"
#include "core/GameSession.hpp"
#include "core/Types.hpp"
#include "controller/InputAction.hpp"
#include "controller/RealtimeLoop.hpp"

#include "FakeCollaborators.hpp"

using namespace std::chrono_literals;

using blockfall::core::GameConfig;
using blockfall::core::GameEvent;
using blockfall::core::GameEventKind;
using blockfall::core::GamePhase;
using blockfall::core::GameSession;
using blockfall::core::SessionState;
using blockfall::core::TetrominoType;
using blockfall::controller::InputAction;
using blockfall::controller::RealtimeLoop;

namespace {

GameConfig fastConfig() {
    GameConfig cfg = GameConfig::tetris();
    cfg.speed.baseIntervalMs = 10;
    cfg.speed.minIntervalMs = 5;
    return cfg;
}

// Something moved since `before`: the piece fell or a piece locked
bool progressed(const SessionState& before, const SessionState& now) {
    if (now.grid != before.grid) return true;
    if (!now.currentPiece || !before.currentPiece) return true;
    return now.currentPiece->position.y > before.currentPiece->position.y;
}

} // namespace

TEST_CASE("RealtimeLoop drops the piece on its own", "[realtime]")
{
    GameSession game{fastConfig(), ScriptedRandomSource::inPlayOrder({TetrominoType::O})};
    game.start();

    RealtimeLoop loop{game, RealtimeLoop::Duration{2}};
    const SessionState before = loop.snapshot();

    loop.start();
    REQUIRE(loop.isRunning());

    bool moved = false;
    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (!moved && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
        moved = progressed(before, loop.snapshot());
    }
    REQUIRE(moved);

    loop.stop();
    REQUIRE_FALSE(loop.isRunning());
}

TEST_CASE("RealtimeLoop serializes posted actions and stops ticking when paused", "[realtime]")
{
    GameSession game{fastConfig(), ScriptedRandomSource::inPlayOrder({TetrominoType::O})};
    game.start();

    RealtimeLoop loop{game, RealtimeLoop::Duration{2}};
    loop.start();

    loop.post(InputAction::PauseResume);
    REQUIRE(loop.snapshot().phase == GamePhase::Paused);

    const SessionState paused = loop.snapshot();
    std::this_thread::sleep_for(50ms);
    const SessionState later = loop.snapshot();

    REQUIRE(later.grid == paused.grid);
    REQUIRE(later.currentPiece->position == paused.currentPiece->position);

    const int x = loop.withSession([](GameSession& s) {
        s.resume();
        s.moveLeft();
        return s.currentPiece()->position.x;
    });
    REQUIRE(x == paused.currentPiece->position.x - 1);
}

TEST_CASE("No tick reaches the session once the loop is stopped", "[realtime]")
{
    GameSession game{fastConfig(), ScriptedRandomSource::inPlayOrder({TetrominoType::O})};
    game.start();

    {
        RealtimeLoop loop{game, RealtimeLoop::Duration{2}};
        loop.start();
        std::this_thread::sleep_for(30ms);
    } // destructor joins the thread

    const SessionState stopped = game.snapshot();
    std::this_thread::sleep_for(50ms);
    const SessionState later = game.snapshot();

    REQUIRE(later.grid == stopped.grid);
    REQUIRE(later.score == stopped.score);
    REQUIRE(later.phase == stopped.phase);
    if (stopped.currentPiece) {
        REQUIRE(later.currentPiece->position == stopped.currentPiece->position);
    }
}

TEST_CASE("Event handlers can call back into the loop", "[realtime][events]")
{
    GameConfig cfg = GameConfig::tetris();
    cfg.speed.baseIntervalMs = 2;
    cfg.speed.minIntervalMs = 1;

    GameSession game{cfg, ScriptedRandomSource::inPlayOrder({TetrominoType::O})};
    RealtimeLoop loop{game, RealtimeLoop::Duration{1}};

    std::atomic<int> lockedSeen{0};
    std::atomic<int> snapshotsTaken{0};
    game.events().subscribe([&](const GameEvent& event) {
        if (event.kind != GameEventKind::PieceLocked) return;
        ++lockedSeen;
        const SessionState state = loop.snapshot();
        loop.post(InputAction::Rotate);
        if (state.sessionId == 1) {
            ++snapshotsTaken;
        }
    });

    loop.withSession([](GameSession& s) { s.start(); });
    loop.start();

    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (snapshotsTaken < 2 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(2ms);
    }
    REQUIRE(snapshotsTaken.load() >= 2);

    // The loop lock is free again for other threads
    const SessionState fromMain = loop.snapshot();
    REQUIRE(fromMain.sessionId == 1);

    loop.stop();
    REQUIRE(lockedSeen.load() == snapshotsTaken.load());
}

TEST_CASE("Events reach subscribers in production order", "[realtime][events]")
{
    GameSession game{fastConfig(), ScriptedRandomSource::inPlayOrder({TetrominoType::O})};
    RealtimeLoop loop{game, RealtimeLoop::Duration{1}};

    std::vector<GameEventKind> kinds;
    game.events().subscribe([&kinds](const GameEvent& event) { kinds.push_back(event.kind); });

    loop.withSession([](GameSession& s) { s.start(); });
    REQUIRE(kinds == std::vector<GameEventKind>{GameEventKind::PhaseChanged});

    loop.post(InputAction::HardDrop);
    REQUIRE(kinds.size() == 2);
    REQUIRE(kinds.back() == GameEventKind::PieceLocked);

    loop.post(InputAction::PauseResume);
    REQUIRE(kinds.back() == GameEventKind::PhaseChanged);
    REQUIRE(loop.snapshot().phase == GamePhase::Paused);
}
