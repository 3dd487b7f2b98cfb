#pragma once // Include guard

#include "Types.hpp" // For Position, Rotation, TetrominoType
#include "PieceCatalog.hpp"
#include <array> // For std::array

// Namespace for blockfall core types
namespace blockfall::core {

// Represents a falling piece: a catalog shape placed at an origin
class Tetromino {
public:
    static constexpr int BlockCount = PieceCatalog::BlockCount;

    using Blocks = std::array<Position, BlockCount>;

    Tetromino(TetrominoType type, Rotation rotation, Position origin);

    TetrominoType type() const noexcept { return type_; }
    Rotation rotation() const noexcept { return rotation_; }
    Position origin() const noexcept { return origin_; }

    void setOrigin(Position p) noexcept { origin_ = p; }
    void setRotation(Rotation r) noexcept { rotation_ = r; }

    // Copies of this piece shifted / turned one step clockwise
    Tetromino movedBy(int dx, int dy) const noexcept;
    Tetromino rotatedClockwise() const noexcept;

    // Positions of the 4 blocks in board coordinates
    Blocks blocks() const noexcept;

private:
    TetrominoType type_;
    Rotation rotation_;
    Position origin_; // top-left corner of the shape's 4x4 box
};

} // namespace blockfall::core
