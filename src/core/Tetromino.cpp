#include "core/Tetromino.hpp"

namespace blockfall::core {

Tetromino::Tetromino(TetrominoType type, Rotation rotation, Position origin)
    : type_{type}, rotation_{rotation}, origin_{origin}
{
}

Tetromino Tetromino::movedBy(int dx, int dy) const noexcept {
    Tetromino moved = *this;
    moved.origin_.x += dx;
    moved.origin_.y += dy;
    return moved;
}

Tetromino Tetromino::rotatedClockwise() const noexcept {
    Tetromino rotated = *this;
    rotated.rotation_ = nextRotation(rotation_);
    return rotated;
}

Tetromino::Blocks Tetromino::blocks() const noexcept {
    const PieceCatalog::Shape& rel = PieceCatalog::shape(type_, rotation_);
    Blocks abs{};
    for (int i = 0; i < BlockCount; ++i) {
        abs[i].x = origin_.x + rel[i].dx;
        abs[i].y = origin_.y + rel[i].dy;
    }
    return abs;
}

} // namespace blockfall::core
