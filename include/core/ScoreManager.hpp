#pragma once

#include <cstdint>

namespace blockfall::core {

class ScoreManager {
public:
    static constexpr int HardDropPointsPerRow = 2;

    // Points for a single clear at the given level (before the level is updated)
    static std::uint64_t pointsForLines(int lines, int level) noexcept;

    void addLinesCleared(int lines, int level);
    void addHardDropRows(int rows);

    std::uint64_t score() const noexcept { return score_; }

    void reset() noexcept { score_ = 0; }

private:
    std::uint64_t score_{0};
};

} // namespace blockfall::core
