#pragma once

#include "Types.hpp"
#include <cstdint>

namespace blockfall::core {

// Deterministic piece source: a 31-bit linear congruential generator.
// The same seed always yields the same sequence of shapes.
class TetrominoFactory {
public:
    static constexpr std::uint64_t Multiplier = 1103515245U;
    static constexpr std::uint64_t Increment = 12345U;
    static constexpr std::uint64_t Modulus = 0x80000000U; // 2^31

    explicit TetrominoFactory(std::uint32_t seed = 0) noexcept;

    void reseed(std::uint32_t seed) noexcept { state_ = seed; }

    // Advance the generator and return state % 7 as the next shape.
    // The modulo bias is intentional; it fixes the sequence for a seed.
    TetrominoType nextType() noexcept;

    std::uint32_t state() const noexcept { return state_; }

private:
    std::uint32_t state_;
};

} // namespace blockfall::core
