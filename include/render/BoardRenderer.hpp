#pragma once

#include "render/Framebuffer.hpp"
#include "core/Board.hpp"
#include "core/GameState.hpp"
#include "core/Types.hpp"
#include <cstdint>

namespace blockfall::render {

// Draws a GameState into a Framebuffer. Holds no state between frames:
// the output depends only on the board, the active piece and its ghost.
class BoardRenderer {
public:
    static constexpr int CellSize = 30;
    static constexpr int CellPadding = 1;
    static constexpr int BevelSize = 3;
    // Glow square, measured from the cell corner rather than the padded body
    static constexpr int GlowInset = 6;
    static constexpr int GhostInset = 2;
    static constexpr int GhostThickness = 2;
    static constexpr int BoardInset = 10;

    static constexpr int FrameWidth = core::Board::Width * CellSize + 2 * BoardInset;
    static constexpr int FrameHeight = core::Board::Height * CellSize + 2 * BoardInset;

    static constexpr int PreviewCellSize = 20;
    static constexpr int PreviewBevelSize = 2;
    static constexpr int PreviewWidth = 120;
    static constexpr int PreviewHeight = 80;

    // Buffer sized for renderFrame()
    static Framebuffer makeFrameBuffer() { return Framebuffer{FrameWidth, FrameHeight}; }
    static Framebuffer makePreviewBuffer() { return Framebuffer{PreviewWidth, PreviewHeight}; }

    // One bevel-shaded (or ghost outline) cell at a board coordinate.
    // colorIndex 0 draws nothing.
    void drawCell(Framebuffer& fb, int gridX, int gridY, std::uint8_t colorIndex, bool isGhost) const noexcept;

    // Background, board panel, grid, locked cells, ghost, active piece
    void renderFrame(Framebuffer& fb, const core::GameState& game) const noexcept;

    // Rotation-0 blocks of a piece centered in a preview buffer
    void renderNextPreview(Framebuffer& fb, core::TetrominoType type) const noexcept;

    // Top-left pixel of a board cell inside the frame
    static int cellLeft(int gridX) noexcept { return BoardInset + gridX * CellSize; }
    static int cellTop(int gridY) noexcept { return BoardInset + gridY * CellSize; }

private:
    void drawPanel(Framebuffer& fb) const noexcept;
    void drawLockedCells(Framebuffer& fb, const core::Board& board) const noexcept;
    void drawActivePiece(Framebuffer& fb, const core::GameState& game) const noexcept;
};

// Filled square with a highlight strip on the top/left edges and a
// shadow strip on the bottom/right edges
void drawBevelBlock(Framebuffer& fb, int x, int y, int size, int bevel, Color base) noexcept;

} // namespace blockfall::render
