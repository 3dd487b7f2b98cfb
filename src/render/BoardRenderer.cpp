#include "render/BoardRenderer.hpp"
#include "render/Palette.hpp"
#include "core/PieceCatalog.hpp"
#include "core/Tetromino.hpp"

#include <algorithm>

namespace blockfall::render {

using core::Board;

void drawBevelBlock(Framebuffer& fb, int x, int y, int size, int bevel, Color base) noexcept
{
    const Color light = lighten(base);
    const Color dark = darken(base);

    // Main cell body
    fb.fillRect(x, y, size, size, base);

    // Top and left highlight
    fb.fillRect(x, y, size, bevel, light);
    fb.fillRect(x, y, bevel, size, light);

    // Bottom and right shadow
    fb.fillRect(x, y + size - bevel, size, bevel, dark);
    fb.fillRect(x + size - bevel, y, bevel, size, dark);
}

void BoardRenderer::drawCell(Framebuffer& fb, int gridX, int gridY, std::uint8_t colorIndex, bool isGhost) const noexcept
{
    if (colorIndex == Board::Empty) return;

    const int px = cellLeft(gridX);
    const int py = cellTop(gridY);
    const Color base = colorForIndex(colorIndex);

    if (isGhost) {
        // Outline only
        const int inset = CellPadding + GhostInset;
        fb.strokeRect(px + inset, py + inset,
                      CellSize - 2 * inset, CellSize - 2 * inset,
                      GhostThickness, base);
        return;
    }

    drawBevelBlock(fb, px + CellPadding, py + CellPadding,
                   CellSize - 2 * CellPadding, BevelSize, base);
    fb.fillRect(px + GlowInset, py + GlowInset,
                CellSize - 2 * GlowInset, CellSize - 2 * GlowInset, glow(base));
}

void BoardRenderer::renderFrame(Framebuffer& fb, const core::GameState& game) const noexcept
{
    fb.clear(Palette::frameBackground());
    drawPanel(fb);
    drawLockedCells(fb, game.board());
    drawActivePiece(fb, game);
}

void BoardRenderer::drawPanel(Framebuffer& fb) const noexcept
{
    const int x = BoardInset;
    const int y = BoardInset;
    const int w = Board::Width * CellSize;
    const int h = Board::Height * CellSize;

    fb.fillRect(x, y, w, h, Palette::boardBackground());

    // Sunken border just outside the panel
    fb.drawHLine(x - 1, y - 1, w + 2, Palette::panelShadow());
    fb.drawVLine(x - 1, y - 1, h + 2, Palette::panelShadow());
    fb.drawHLine(x - 1, y + h, w + 2, Palette::panelHighlight());
    fb.drawVLine(x + w, y - 1, h + 2, Palette::panelHighlight());

    for (int col = 0; col <= Board::Width; ++col) {
        const int gx = std::min(x + col * CellSize, x + w - 1);
        fb.drawVLine(gx, y, h, Palette::boardGrid());
    }
    for (int row = 0; row <= Board::Height; ++row) {
        const int gy = std::min(y + row * CellSize, y + h - 1);
        fb.drawHLine(x, gy, w, Palette::boardGrid());
    }
}

void BoardRenderer::drawLockedCells(Framebuffer& fb, const core::Board& board) const noexcept
{
    for (int y = 0; y < Board::Height; ++y) {
        for (int x = 0; x < Board::Width; ++x) {
            drawCell(fb, x, y, board.cell(x, y), false);
        }
    }
}

void BoardRenderer::drawActivePiece(Framebuffer& fb, const core::GameState& game) const noexcept
{
    const auto& active = game.activeTetromino();
    if (!active) return;

    const std::uint8_t colorIndex = core::colorIndexFor(active->type());
    const int pieceY = active->origin().y;

    // Ghost first so the real piece is drawn over it
    const auto ghostY = game.ghostRow();
    if (ghostY && *ghostY > pieceY) {
        const core::Tetromino ghost = active->movedBy(0, *ghostY - pieceY);
        for (const auto& b : ghost.blocks()) {
            if (b.y >= 0) {
                drawCell(fb, b.x, b.y, colorIndex, true);
            }
        }
    }

    for (const auto& b : active->blocks()) {
        if (b.y >= 0) {
            drawCell(fb, b.x, b.y, colorIndex, false);
        }
    }
}

void BoardRenderer::renderNextPreview(Framebuffer& fb, core::TetrominoType type) const noexcept
{
    fb.clear(Palette::previewBackground());

    // The catalog's rotation-0 shapes fit a 4x2 box
    const int offsetX = (fb.width() - PreviewCellSize * 4) / 2;
    const int offsetY = (fb.height() - PreviewCellSize * 2) / 2;
    const Color base = colorForTetromino(type);

    for (const auto& o : core::PieceCatalog::shape(type, core::Rotation::R0)) {
        const int px = offsetX + o.dx * PreviewCellSize;
        const int py = offsetY + o.dy * PreviewCellSize;
        drawBevelBlock(fb, px + 1, py + 1, PreviewCellSize - 2, PreviewBevelSize, base);
    }
}

} // namespace blockfall::render
