#include "render/ScreenLayout.hpp"
#include "render/BoardRenderer.hpp"

#include <algorithm>

namespace blockfall::render {

ScreenLayout computeScreenLayout(int windowW, int windowH, int preferredScale) noexcept
{
    ScreenLayout L{};
    const int margin = ScreenLayout::Margin;
    const int sideW = ScreenLayout::PanelWidth;

    const float fitW = static_cast<float>(windowW - margin * 3 - sideW) / BoardRenderer::FrameWidth;
    const float fitH = static_cast<float>(windowH - margin * 2) / BoardRenderer::FrameHeight;
    L.scale = std::clamp(std::min({fitW, fitH, static_cast<float>(preferredScale)}),
                         ScreenLayout::MinScale, ScreenLayout::MaxScale);

    const int boardW = static_cast<int>(BoardRenderer::FrameWidth * L.scale);
    const int boardH = static_cast<int>(BoardRenderer::FrameHeight * L.scale);
    const int groupW = boardW + margin + sideW;
    const int groupX = std::max(margin, (windowW - groupW) / 2);

    L.board = Rect{groupX, margin, boardW, boardH};
    L.panel = Rect{groupX + boardW + margin, margin, sideW, boardH};

    // Preview is shown at 1.5x, centred in the panel
    const int previewW = BoardRenderer::PreviewWidth * 3 / 2;
    const int previewH = BoardRenderer::PreviewHeight * 3 / 2;
    L.preview = Rect{L.panel.x + (sideW - previewW) / 2, margin + ScreenLayout::PreviewTop, previewW, previewH};

    return L;
}

WindowSize windowSizeFor(int scale) noexcept
{
    return WindowSize{
        BoardRenderer::FrameWidth * scale + ScreenLayout::Margin * 3 + ScreenLayout::PanelWidth,
        BoardRenderer::FrameHeight * scale + ScreenLayout::Margin * 2
    };
}

} // namespace blockfall::render
