#include "core/ScoreManager.hpp"

namespace blockfall::core {

ScoreManager::ScoreManager(ScoringRules rules)
    : rules_{rules}
{
}

std::uint64_t ScoreManager::addPlacement(int linesCleared, int level, bool hardDrop) {
    std::uint64_t delta = 0;

    if (linesCleared > 0 && level > 0) {
        delta += static_cast<std::uint64_t>(linesCleared)
               * rules_.pointsPerLine
               * static_cast<std::uint64_t>(level);
    }
    if (hardDrop) {
        delta += rules_.hardDropBonus;
    }

    score_ += delta;
    return delta;
}

} // namespace blockfall::core
