#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <utility>
#include <variant>
#include <vector>

#include "core/Types.hpp"

namespace blockfall::core {

enum class GameEventKind : std::uint8_t {
    PieceLocked,
    LinesCleared,
    LevelUp,
    GameOver,
    PhaseChanged
};

// ---------- Individual event payloads ----------

struct PieceLockedEvent {
    TetrominoType type;
    Position position;            // resting position of the shape's top-left
    bool hardDrop{};
    std::uint64_t pointsAwarded{}; // line points plus hard drop bonus
};

struct LinesClearedEvent {
    int lines{};                  // cleared by this placement
    std::uint64_t totalLines{};   // session total after the clear
    std::uint64_t score{};        // session score after the clear
};

struct LevelUpEvent {
    int level{};
    int dropIntervalMs{};
};

struct GameOverEvent {
    std::uint64_t finalScore{};
    int level{};
    std::uint64_t linesCleared{};
};

struct PhaseChangedEvent {
    GamePhase from;
    GamePhase to;
};

struct GameEvent {
    GameEventKind kind;
    std::uint64_t sessionId{}; // session that produced the event
    std::variant<
        PieceLockedEvent,
        LinesClearedEvent,
        LevelUpEvent,
        GameOverEvent,
        PhaseChangedEvent
    > payload;
};

// Fan-out of session events to any number of subscribers (renderer,
// high-score reporter, sound...). Handlers run synchronously, in
// subscription order.
class EventDispatcher {
public:
    using Handler        = std::function<void(const GameEvent&)>;
    using SubscriptionId = std::uint64_t;

    SubscriptionId subscribe(Handler handler);

    // Returns false if the id is unknown (already removed)
    bool unsubscribe(SubscriptionId id);

    // Handlers may subscribe or unsubscribe while an event is being emitted;
    // the change applies from the next event.
    void emit(const GameEvent& event) const;

    std::size_t subscriberCount() const noexcept { return handlers_.size(); }

private:
    std::vector<std::pair<SubscriptionId, Handler>> handlers_;
    SubscriptionId nextId_{1};
};

} // namespace blockfall::core
