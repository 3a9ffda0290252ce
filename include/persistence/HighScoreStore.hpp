#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace blockfall::persistence {

// Number of scores per game that count as "high scores"
inline constexpr std::size_t kHighScoreTableSize = 10;

struct ScoreEntry {
    std::string name;
    std::uint64_t score{};
    std::string gameId;
};

struct ScoreRecord {
    std::uint64_t id{};
    std::string name;
    std::uint64_t score{};
    std::string gameId;
    std::chrono::system_clock::time_point createdAt;
};

// Boundary to whatever keeps scores between runs. Implementations may
// throw on storage failures; callers decide what to do about it.
class IHighScoreStore {
public:
    virtual ~IHighScoreStore() = default;

    virtual ScoreRecord saveScore(const ScoreEntry& entry) = 0;

    // Best first
    virtual std::vector<ScoreRecord> highScores(const std::string& gameId,
                                                std::size_t limit = kHighScoreTableSize) const = 0;
    virtual std::vector<ScoreRecord> allHighScores(std::size_t limit = kHighScoreTableSize) const = 0;

    // True if `score` would enter the game's top table
    virtual bool isHighScore(const std::string& gameId, std::uint64_t score) const = 0;

    virtual bool deleteScore(std::uint64_t id) = 0;

    // Clears one game, or every game when gameId is empty
    virtual void clearScores(const std::optional<std::string>& gameId = std::nullopt) = 0;
};

// Process-lifetime store. Thread-safe.
class InMemoryHighScoreStore : public IHighScoreStore {
public:
    ScoreRecord saveScore(const ScoreEntry& entry) override;

    std::vector<ScoreRecord> highScores(const std::string& gameId,
                                        std::size_t limit = kHighScoreTableSize) const override;
    std::vector<ScoreRecord> allHighScores(std::size_t limit = kHighScoreTableSize) const override;

    bool isHighScore(const std::string& gameId, std::uint64_t score) const override;

    bool deleteScore(std::uint64_t id) override;
    void clearScores(const std::optional<std::string>& gameId = std::nullopt) override;

    std::size_t size() const;

private:
    mutable std::mutex m_mutex;
    std::vector<ScoreRecord> m_records; // kept sorted, best first
    std::uint64_t m_nextId{1};

    static std::vector<ScoreRecord> topOf(const std::vector<ScoreRecord>& records,
                                          const std::string* gameId,
                                          std::size_t limit);
};

} // namespace blockfall::persistence
