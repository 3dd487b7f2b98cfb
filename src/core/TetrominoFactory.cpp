#include "core/TetrominoFactory.hpp"

namespace blockfall::core {

TetrominoFactory::TetrominoFactory(std::uint32_t seed) noexcept
    : state_{seed}
{
}

TetrominoType TetrominoFactory::nextType() noexcept {
    const std::uint64_t next = (static_cast<std::uint64_t>(state_) * Multiplier + Increment) % Modulus;
    state_ = static_cast<std::uint32_t>(next);
    return static_cast<TetrominoType>(state_ % TetrominoTypeCount);
}

} // namespace blockfall::core
