#pragma once

#include <cstdint>

namespace blockfall::core {

class LevelManager {
public:
    static constexpr int LinesPerLevel = 10;
    static constexpr int BaseDropIntervalTicks = 60;
    static constexpr int DropIntervalStepTicks = 6;
    static constexpr int MinDropIntervalTicks = 6;

    int level() const noexcept { return level_; }
    int totalLinesCleared() const noexcept { return totalLinesCleared_; }

    // Call after lines are cleared; level is recomputed from the running total
    void onLinesCleared(int lines);

    void reset() noexcept;

    // Update ticks between forced descents at the current level
    int dropIntervalTicks() const noexcept;

private:
    int level_{0};
    int totalLinesCleared_{0};
};

} // namespace blockfall::core
