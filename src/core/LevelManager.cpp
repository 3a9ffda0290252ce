#include "core/LevelManager.hpp"
#include <algorithm>

namespace blockfall::core {

LevelManager::LevelManager(SpeedCurve curve)
    : curve_{curve}
    , totalLinesCleared_{0}
{
}

int LevelManager::level() const noexcept {
    return static_cast<int>(totalLinesCleared_ / static_cast<std::uint64_t>(curve_.linesPerLevel)) + 1;
}

bool LevelManager::onLinesCleared(int lines) {
    if (lines <= 0) return false;

    const int before = level();
    totalLinesCleared_ += static_cast<std::uint64_t>(lines);
    return level() > before;
}

int LevelManager::dropIntervalMs() const noexcept {
    // Linear speed curve: base at level 1, minus one step per level, floored.
    const long long interval = static_cast<long long>(curve_.baseIntervalMs)
        - static_cast<long long>(level() - 1) * curve_.stepMs;
    return static_cast<int>(std::max<long long>(interval, curve_.minIntervalMs));
}

} // namespace blockfall::core
