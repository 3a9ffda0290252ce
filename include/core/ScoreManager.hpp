#pragma once

#include <cstdint>

#include "core/GameConfig.hpp"

namespace blockfall::core {

class ScoreManager {
public:
    explicit ScoreManager(ScoringRules rules = {});

    // Score one locked piece; returns the points awarded.
    // `level` is the level the piece was locked at.
    std::uint64_t addPlacement(int linesCleared, int level, bool hardDrop);

    std::uint64_t score() const noexcept { return score_; }

    void reset() noexcept { score_ = 0; }

private:
    ScoringRules rules_;
    std::uint64_t score_{0};
};

} // namespace blockfall::core
