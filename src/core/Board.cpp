#include "core/Board.hpp"

namespace blockfall::core {

std::uint8_t Board::cell(int x, int y) const noexcept {
    if (!isInside(x, y)) {
        return OutOfBounds;
    }
    return grid_[index(x, y)];
}

void Board::setCell(int x, int y, std::uint8_t value) noexcept {
    if (!isInside(x, y)) {
        return;
    }
    grid_[index(x, y)] = value;
}

bool Board::collides(const Tetromino& tetromino) const noexcept {
    for (const auto& b : tetromino.blocks()) {
        if (b.x < 0 || b.x >= Width || b.y >= Height) {
            return true; // wall or floor
        }
        if (b.y >= 0 && grid_[index(b.x, b.y)] != Empty) {
            return true; // locked block
        }
    }
    return false;
}

void Board::lockTetromino(const Tetromino& tetromino) noexcept {
    const std::uint8_t value = colorIndexFor(tetromino.type());
    for (const auto& b : tetromino.blocks()) {
        if (b.y < 0) {
            continue;
        }
        setCell(b.x, b.y, value);
    }
}

bool Board::isRowComplete(int row) const noexcept {
    if (row < 0 || row >= Height) {
        return false;
    }
    for (int x = 0; x < Width; ++x) {
        if (grid_[index(x, row)] == Empty) {
            return false;
        }
    }
    return true;
}

int Board::clearFullLines() noexcept {
    int cleared = 0;

    // Go bottom-up: when we clear, we shift everything above down
    int row = Height - 1;
    while (row >= 0) {
        if (isRowComplete(row)) {
            removeRow(row);
            ++cleared;
            // re-check this row index because we just pulled everything down
            continue;
        }
        --row;
    }

    return cleared;
}

void Board::removeRow(int row) noexcept {
    // Shift rows above down by 1
    for (int y = row; y > 0; --y) {
        for (int x = 0; x < Width; ++x) {
            grid_[index(x, y)] = grid_[index(x, y - 1)];
        }
    }
    // Clear top row
    for (int x = 0; x < Width; ++x) {
        grid_[index(x, 0)] = Empty;
    }
}

} // namespace blockfall::core
