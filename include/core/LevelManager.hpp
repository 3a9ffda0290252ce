#pragma once

#include <cstdint>

#include "core/GameConfig.hpp"

namespace blockfall::core {

// Level and gravity interval are derived from the cleared-lines total only.
class LevelManager {
public:
    explicit LevelManager(SpeedCurve curve = {});

    int level() const noexcept;
    std::uint64_t totalLinesCleared() const noexcept { return totalLinesCleared_; }

    // Call after lines are cleared; returns true if the level went up
    bool onLinesCleared(int lines);

    void reset() noexcept { totalLinesCleared_ = 0; }

    // Current fall interval in milliseconds
    int dropIntervalMs() const noexcept;

private:
    SpeedCurve curve_;
    std::uint64_t totalLinesCleared_;
};

} // namespace blockfall::core
