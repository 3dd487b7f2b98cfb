#include "core/PieceCatalog.hpp"
#include <stdexcept>

namespace blockfall::core {

namespace {

using Shape = PieceCatalog::Shape;
using ShapeSet = std::array<Shape, PieceCatalog::RotationCount>;

constexpr std::array<ShapeSet, TetrominoTypeCount> kShapes{{
    // I
    ShapeSet{{
        // [ ][ ][ ][ ]
        Shape{{ {0, 1}, {1, 1}, {2, 1}, {3, 1} }},
        Shape{{ {2, 0}, {2, 1}, {2, 2}, {2, 3} }},
        Shape{{ {0, 2}, {1, 2}, {2, 2}, {3, 2} }},
        Shape{{ {1, 0}, {1, 1}, {1, 2}, {1, 3} }},
    }},
    // O: same in all rotations
    ShapeSet{{
        Shape{{ {1, 0}, {2, 0}, {1, 1}, {2, 1} }},
        Shape{{ {1, 0}, {2, 0}, {1, 1}, {2, 1} }},
        Shape{{ {1, 0}, {2, 0}, {1, 1}, {2, 1} }},
        Shape{{ {1, 0}, {2, 0}, {1, 1}, {2, 1} }},
    }},
    // T
    ShapeSet{{
        //    [ ]
        // [ ][T][ ]
        Shape{{ {1, 0}, {0, 1}, {1, 1}, {2, 1} }},
        Shape{{ {1, 0}, {1, 1}, {2, 1}, {1, 2} }},
        Shape{{ {0, 1}, {1, 1}, {2, 1}, {1, 2} }},
        Shape{{ {1, 0}, {0, 1}, {1, 1}, {1, 2} }},
    }},
    // S
    ShapeSet{{
        //    [S][ ]
        // [ ][S]
        Shape{{ {1, 0}, {2, 0}, {0, 1}, {1, 1} }},
        Shape{{ {1, 0}, {1, 1}, {2, 1}, {2, 2} }},
        Shape{{ {1, 1}, {2, 1}, {0, 2}, {1, 2} }},
        Shape{{ {0, 0}, {0, 1}, {1, 1}, {1, 2} }},
    }},
    // Z
    ShapeSet{{
        // [Z][ ]
        //    [Z][ ]
        Shape{{ {0, 0}, {1, 0}, {1, 1}, {2, 1} }},
        Shape{{ {2, 0}, {1, 1}, {2, 1}, {1, 2} }},
        Shape{{ {0, 1}, {1, 1}, {1, 2}, {2, 2} }},
        Shape{{ {1, 0}, {0, 1}, {1, 1}, {0, 2} }},
    }},
    // J
    ShapeSet{{
        // [ ]
        // [J][ ][ ]
        Shape{{ {0, 0}, {0, 1}, {1, 1}, {2, 1} }},
        Shape{{ {1, 0}, {2, 0}, {1, 1}, {1, 2} }},
        Shape{{ {0, 1}, {1, 1}, {2, 1}, {2, 2} }},
        Shape{{ {1, 0}, {1, 1}, {0, 2}, {1, 2} }},
    }},
    // L
    ShapeSet{{
        //       [ ]
        // [ ][ ][L]
        Shape{{ {2, 0}, {0, 1}, {1, 1}, {2, 1} }},
        Shape{{ {1, 0}, {1, 1}, {1, 2}, {2, 2} }},
        Shape{{ {0, 1}, {1, 1}, {2, 1}, {0, 2} }},
        Shape{{ {0, 0}, {1, 0}, {1, 1}, {1, 2} }},
    }},
}};

} // namespace

const PieceCatalog::Shape& PieceCatalog::shape(TetrominoType type, Rotation rotation) noexcept {
    return kShapes[static_cast<std::size_t>(type)][static_cast<std::size_t>(rotation)];
}

Offset PieceCatalog::blockOffset(TetrominoType type, Rotation rotation, int blockIndex) {
    if (blockIndex < 0 || blockIndex >= BlockCount) {
        throw std::out_of_range("PieceCatalog::blockOffset block index out of range");
    }
    return shape(type, rotation)[static_cast<std::size_t>(blockIndex)];
}

} // namespace blockfall::core
