#pragma once

#include <algorithm>
#include <cstdint>

namespace blockfall::render {

struct Color {
    std::uint8_t r{0};
    std::uint8_t g{0};
    std::uint8_t b{0};
    std::uint8_t a{255};

    friend bool operator==(const Color& lhs, const Color& rhs) noexcept {
        return lhs.r == rhs.r && lhs.g == rhs.g && lhs.b == rhs.b && lhs.a == rhs.a;
    }
    friend bool operator!=(const Color& lhs, const Color& rhs) noexcept {
        return !(lhs == rhs);
    }
};

// 0xRRGGBB, opaque
constexpr Color rgb(std::uint32_t hex) noexcept {
    return Color{
        static_cast<std::uint8_t>((hex >> 16) & 0xFF),
        static_cast<std::uint8_t>((hex >> 8) & 0xFF),
        static_cast<std::uint8_t>(hex & 0xFF),
        255
    };
}

// Bevel highlight: +80 per channel, capped at 255
inline Color lighten(Color c) noexcept {
    auto up = [](std::uint8_t v) {
        return static_cast<std::uint8_t>(std::min(static_cast<int>(v) + 80, 255));
    };
    return Color{up(c.r), up(c.g), up(c.b), c.a};
}

// Bevel shadow: half intensity
inline Color darken(Color c) noexcept {
    auto down = [](std::uint8_t v) {
        return static_cast<std::uint8_t>(v / 2);
    };
    return Color{down(c.r), down(c.g), down(c.b), c.a};
}

// Inner glow: 10% white composited over the color
inline Color glow(Color c) noexcept {
    auto up = [](std::uint8_t v) {
        return static_cast<std::uint8_t>(v + (255 - v) / 10);
    };
    return Color{up(c.r), up(c.g), up(c.b), c.a};
}

} // namespace blockfall::render
