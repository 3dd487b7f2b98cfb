#pragma once

namespace blockfall::render {

struct Rect {
    int x{};
    int y{};
    int w{};
    int h{};
};

struct WindowSize {
    int width{};
    int height{};
};

// Window placement of the scaled board frame, the HUD panel beside it and
// the next-piece preview inside the panel. Pure arithmetic, no SDL.
struct ScreenLayout {
    static constexpr int Margin = 20;
    static constexpr int PanelWidth = 220;
    // Room for the stats window above the preview
    static constexpr int PreviewTop = 170;
    static constexpr float MinScale = 0.5f;
    static constexpr float MaxScale = 4.0f;

    float scale = 1.0f;
    Rect board{};
    Rect panel{};
    Rect preview{};
};

// Fits the board into the window at no more than preferredScale, then
// centres board + panel horizontally.
ScreenLayout computeScreenLayout(int windowW, int windowH, int preferredScale) noexcept;

// Smallest window that shows the board at exactly `scale`
WindowSize windowSizeFor(int scale) noexcept;

} // namespace blockfall::render
