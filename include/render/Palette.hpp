#pragma once

#include "render/Color.hpp"
#include "core/Types.hpp"  // TetrominoType
#include <cstdint>

namespace blockfall::render {

struct Palette {
    // Area around the board panel
    static constexpr Color frameBackground()  { return rgb(0x14141c); }

    // Board panel
    static constexpr Color boardBackground()  { return rgb(0x0a0a0f); }
    // 5% white over the board background; there is no blending, so it is baked in
    static constexpr Color boardGrid()        { return rgb(0x16161b); }

    // Inset panel edges: dark on top/left, light on bottom/right
    static constexpr Color panelShadow()      { return rgb(0x050508); }
    static constexpr Color panelHighlight()   { return rgb(0x3a3a48); }

    // Next-piece preview
    static constexpr Color previewBackground(){ return rgb(0x07070b); }

    // Fallback for a color index outside 1..7
    static constexpr Color unknownBlock()     { return rgb(0xc8c8c8); }
};

// Base color for a board value (1..7 = shape id + 1)
inline Color colorForIndex(std::uint8_t colorIndex)
{
    switch (colorIndex) {
    case 1: return rgb(0x00f5ff); // I - cyan
    case 2: return rgb(0xffea00); // O - yellow
    case 3: return rgb(0xd000ff); // T - purple
    case 4: return rgb(0x00ff6a); // S - green
    case 5: return rgb(0xff3366); // Z - red
    case 6: return rgb(0x3366ff); // J - blue
    case 7: return rgb(0xff9500); // L - orange
    default: break;
    }
    return Palette::unknownBlock();
}

inline Color colorForTetromino(core::TetrominoType type)
{
    return colorForIndex(core::colorIndexFor(type));
}

} // namespace blockfall::render
