#pragma once

#include <cstdint>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>

#include "core/GameEvents.hpp"
#include "core/GameSession.hpp"
#include "persistence/HighScoreStore.hpp"

namespace blockfall::persistence {

// Longest player name kept in the table
inline constexpr std::size_t kMaxPlayerNameLength = 20;

/// Hands the final score of a session to a high-score store.
/// - listens for GameOver on the session's event dispatcher
/// - asks the store whether the score makes the table
/// - keeps a pending entry until the player submits a name or skips
/// Store failures are logged and swallowed here: they never change
/// the session, which is already over when we hear about it.
/// Events from a session older than the newest one seen are ignored.
/// Thread-safe: events may arrive on a RealtimeLoop thread while the
/// front-end submits a name.
class HighScoreReporter {
public:
    /// Neither the session nor the store is owned; both must outlive the reporter.
    HighScoreReporter(blockfall::core::GameSession& session,
                      IHighScoreStore& store,
                      std::ostream& log = std::cerr);
    ~HighScoreReporter();

    HighScoreReporter(const HighScoreReporter&) = delete;
    HighScoreReporter& operator=(const HighScoreReporter&) = delete;

    bool hasPendingEntry() const;
    std::optional<std::uint64_t> pendingScore() const;

    /// Save the pending score under `name` (trimmed, cut to 20 characters).
    /// Returns false for a blank name, when nothing is pending, or when the
    /// store fails; in the last case the entry stays pending for a retry.
    bool submitName(const std::string& name);

    /// Drop the pending entry without saving.
    void skip();

private:
    blockfall::core::GameSession& m_session;
    IHighScoreStore& m_store;
    std::ostream& m_log;

    blockfall::core::EventDispatcher::SubscriptionId m_subscription{0};
    mutable std::mutex m_mutex;
    std::optional<std::uint64_t> m_pendingScore;
    std::uint64_t m_latestSessionId{0};

    void onEvent(const blockfall::core::GameEvent& event);
    void onGameOver(const blockfall::core::GameOverEvent& gameOver);
};

} // namespace blockfall::persistence
