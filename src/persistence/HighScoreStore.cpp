#include "persistence/HighScoreStore.hpp"

#include <algorithm>
#include <stdexcept>

namespace blockfall::persistence {

ScoreRecord InMemoryHighScoreStore::saveScore(const ScoreEntry& entry)
{
    if (entry.name.empty()) {
        throw std::invalid_argument("saveScore: player name must not be empty");
    }
    if (entry.gameId.empty()) {
        throw std::invalid_argument("saveScore: game id must not be empty");
    }

    std::lock_guard<std::mutex> lock(m_mutex);

    ScoreRecord record{
        m_nextId++,
        entry.name,
        entry.score,
        entry.gameId,
        std::chrono::system_clock::now()
    };

    // Insert after every record with a score >= ours: ties keep arrival order
    auto pos = std::upper_bound(
        m_records.begin(), m_records.end(), record.score,
        [](std::uint64_t score, const ScoreRecord& r) { return score > r.score; });
    m_records.insert(pos, record);

    return record;
}

std::vector<ScoreRecord>
InMemoryHighScoreStore::topOf(const std::vector<ScoreRecord>& records,
                              const std::string* gameId,
                              std::size_t limit)
{
    std::vector<ScoreRecord> result;
    for (const auto& r : records) {
        if (result.size() >= limit) break;
        if (gameId && r.gameId != *gameId) continue;
        result.push_back(r);
    }
    return result;
}

std::vector<ScoreRecord>
InMemoryHighScoreStore::highScores(const std::string& gameId, std::size_t limit) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return topOf(m_records, &gameId, limit);
}

std::vector<ScoreRecord>
InMemoryHighScoreStore::allHighScores(std::size_t limit) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return topOf(m_records, nullptr, limit);
}

bool InMemoryHighScoreStore::isHighScore(const std::string& gameId, std::uint64_t score) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto top = topOf(m_records, &gameId, kHighScoreTableSize);

    if (top.size() < kHighScoreTableSize) {
        return true; // table not full yet
    }
    return score > top.back().score;
}

bool InMemoryHighScoreStore::deleteScore(std::uint64_t id)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = std::find_if(m_records.begin(), m_records.end(),
                           [id](const ScoreRecord& r) { return r.id == id; });
    if (it == m_records.end()) {
        return false;
    }
    m_records.erase(it);
    return true;
}

void InMemoryHighScoreStore::clearScores(const std::optional<std::string>& gameId)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!gameId) {
        m_records.clear();
        return;
    }
    m_records.erase(
        std::remove_if(m_records.begin(), m_records.end(),
                       [&gameId](const ScoreRecord& r) { return r.gameId == *gameId; }),
        m_records.end());
}

std::size_t InMemoryHighScoreStore::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_records.size();
}

} // namespace blockfall::persistence
