#include "persistence/HighScoreReporter.hpp"

#include <exception>
#include <variant>

namespace blockfall::persistence {

namespace {

std::string trimmed(const std::string& s)
{
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

} // namespace

HighScoreReporter::HighScoreReporter(blockfall::core::GameSession& session,
                                     IHighScoreStore& store,
                                     std::ostream& log)
    : m_session(session)
    , m_store(store)
    , m_log(log)
{
    m_subscription = m_session.events().subscribe(
        [this](const blockfall::core::GameEvent& event) { onEvent(event); });
}

HighScoreReporter::~HighScoreReporter()
{
    m_session.events().unsubscribe(m_subscription);
}

bool HighScoreReporter::hasPendingEntry() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pendingScore.has_value();
}

std::optional<std::uint64_t> HighScoreReporter::pendingScore() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pendingScore;
}

void HighScoreReporter::skip()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_pendingScore.reset();
}

void HighScoreReporter::onEvent(const blockfall::core::GameEvent& event)
{
    using blockfall::core::GameEventKind;
    using blockfall::core::GamePhase;

    std::lock_guard<std::mutex> lock(m_mutex);

    if (event.sessionId < m_latestSessionId) {
        return; // late event from a finished session
    }
    if (event.sessionId > m_latestSessionId) {
        // Any entry still pending belongs to an earlier game
        m_latestSessionId = event.sessionId;
        m_pendingScore.reset();
    }

    switch (event.kind) {
    case GameEventKind::GameOver:
        if (const auto* payload = std::get_if<blockfall::core::GameOverEvent>(&event.payload)) {
            onGameOver(*payload);
        }
        break;
    case GameEventKind::PhaseChanged: {
        // A new game discards an entry nobody claimed
        const auto* payload = std::get_if<blockfall::core::PhaseChangedEvent>(&event.payload);
        if (payload && payload->from == GamePhase::GameOver && payload->to == GamePhase::Playing) {
            m_pendingScore.reset();
        }
        break;
    }
    default:
        break;
    }
}

void HighScoreReporter::onGameOver(const blockfall::core::GameOverEvent& gameOver)
{
    const auto& config = m_session.config();
    if (!config.recordHighScores) {
        return;
    }

    try {
        if (m_store.isHighScore(config.gameId, gameOver.finalScore)) {
            m_pendingScore = gameOver.finalScore;
        }
    } catch (const std::exception& e) {
        m_log << "Failed to check high score: " << e.what() << "\n";
    }
}

bool HighScoreReporter::submitName(const std::string& name)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_pendingScore) {
        return false;
    }

    std::string playerName = trimmed(name);
    if (playerName.empty()) {
        return false;
    }
    if (playerName.size() > kMaxPlayerNameLength) {
        playerName.resize(kMaxPlayerNameLength);
    }

    try {
        m_store.saveScore(ScoreEntry{playerName, *m_pendingScore, m_session.config().gameId});
    } catch (const std::exception& e) {
        m_log << "Failed to save high score: " << e.what() << "\n";
        return false;
    }

    m_pendingScore.reset();
    return true;
}

} // namespace blockfall::persistence
