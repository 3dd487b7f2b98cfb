#pragma once

#include "Types.hpp"
#include <array>

namespace blockfall::core {

// Static shape table: 7 types x 4 rotations x 4 blocks.
// Every offset lies inside a 4x4 box anchored at the piece origin.
class PieceCatalog {
public:
    static constexpr int BlockCount = 4;
    static constexpr int RotationCount = 4;

    using Shape = std::array<Offset, BlockCount>;

    // Offsets of all four blocks for a type/rotation pair
    static const Shape& shape(TetrominoType type, Rotation rotation) noexcept;

    // Single block lookup; throws std::out_of_range if blockIndex is not 0..3
    static Offset blockOffset(TetrominoType type, Rotation rotation, int blockIndex);
};

} // namespace blockfall::core
