#include "core/LevelManager.hpp"
#include <algorithm>

namespace blockfall::core {

void LevelManager::onLinesCleared(int lines) {
    if (lines <= 0) return;

    totalLinesCleared_ += lines;
    level_ = totalLinesCleared_ / LinesPerLevel;
}

void LevelManager::reset() noexcept {
    level_ = 0;
    totalLinesCleared_ = 0;
}

int LevelManager::dropIntervalTicks() const noexcept {
    // 60 ticks at level 0, 6 fewer per level, never below 6
    const int interval = BaseDropIntervalTicks - level_ * DropIntervalStepTicks;
    return std::max(interval, MinDropIntervalTicks);
}

} // namespace blockfall::core
