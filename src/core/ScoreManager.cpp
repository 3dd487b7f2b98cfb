#include "core/ScoreManager.hpp"

namespace blockfall::core {

std::uint64_t ScoreManager::pointsForLines(int lines, int level) noexcept {
    if (lines <= 0) return 0;

    int base = 0;
    switch (lines) {
    case 1: base = 100; break;
    case 2: base = 300; break;
    case 3: base = 500; break;
    default:
        // 4 or more
        base = 800;
        break;
    }

    const int l = level + 1; // formula uses (level + 1)
    return static_cast<std::uint64_t>(base) * static_cast<std::uint64_t>(l);
}

void ScoreManager::addLinesCleared(int lines, int level) {
    score_ += pointsForLines(lines, level);
}

void ScoreManager::addHardDropRows(int rows) {
    if (rows <= 0) return;
    score_ += static_cast<std::uint64_t>(rows) * HardDropPointsPerRow;
}

} // namespace blockfall::core
