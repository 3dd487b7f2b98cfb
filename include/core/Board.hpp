#pragma once

#include "Types.hpp"
#include "Tetromino.hpp"
#include <array>
#include <cstdint>

namespace blockfall::core {

// Fixed 10x20 playfield. Each cell holds 0 (empty) or the color index
// (shape id + 1) of the piece that was locked there.
class Board {
public:
    static constexpr int Width = 10;
    static constexpr int Height = 20;
    static constexpr int CellCount = Width * Height;

    static constexpr std::uint8_t Empty = 0;
    // Returned for any coordinate outside the grid
    static constexpr std::uint8_t OutOfBounds = 1;

    Board() = default;

    int cols() const noexcept { return Width; }
    int rows() const noexcept { return Height; }

    // Out-of-range reads answer "occupied" so walls and floor collide
    // exactly like stored blocks.
    std::uint8_t cell(int x, int y) const noexcept;

    // Out-of-range writes are ignored
    void setCell(int x, int y, std::uint8_t value) noexcept;

    bool isOccupied(int x, int y) const noexcept { return cell(x, y) != Empty; }

    // True if the piece overlaps a wall, the floor or a locked block.
    // Blocks above the top edge (y < 0) are only checked against the walls.
    bool collides(const Tetromino& tetromino) const noexcept;

    // Write the piece's color index into every block with y >= 0
    void lockTetromino(const Tetromino& tetromino) noexcept;

    bool isRowComplete(int row) const noexcept;

    // Clear full lines, return number of cleared lines
    int clearFullLines() noexcept;

    void clear() noexcept { grid_.fill(Empty); }

private:
    std::array<std::uint8_t, CellCount> grid_{};

    static int index(int x, int y) noexcept {
        return y * Width + x;
    }

    static bool isInside(int x, int y) noexcept {
        return x >= 0 && x < Width && y >= 0 && y < Height;
    }

    void removeRow(int row) noexcept;
};

} // namespace blockfall::core
