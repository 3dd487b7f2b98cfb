#pragma once

#include "render/Color.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace blockfall::render {

// Linear RGBA8 pixel buffer, row-major, origin top-left.
// Byte layout per pixel is R, G, B, A at offset (y * width + x) * 4.
// Writes that fall outside the buffer are silently dropped.
class Framebuffer {
public:
    static constexpr int BytesPerPixel = 4;

    Framebuffer(int width, int height);

    int width() const noexcept { return width_; }
    int height() const noexcept { return height_; }
    int pitch() const noexcept { return width_ * BytesPerPixel; }

    // Read-only view for copying to a display surface
    const std::uint8_t* data() const noexcept { return pixels_.data(); }
    std::size_t sizeBytes() const noexcept { return pixels_.size(); }

    bool contains(int x, int y) const noexcept {
        return x >= 0 && x < width_ && y >= 0 && y < height_;
    }

    // Throws std::out_of_range outside the buffer
    Color pixel(int x, int y) const;

    void clear(Color color) noexcept;
    void setPixel(int x, int y, Color color) noexcept;

    // Filled rectangle, clipped to the buffer
    void fillRect(int x, int y, int w, int h, Color color) noexcept;

    void drawHLine(int x, int y, int length, Color color) noexcept;
    void drawVLine(int x, int y, int length, Color color) noexcept;

    // Rectangle outline drawn inwards with the given thickness
    void strokeRect(int x, int y, int w, int h, int thickness, Color color) noexcept;

private:
    int width_;
    int height_;
    std::vector<std::uint8_t> pixels_;

    std::size_t offset(int x, int y) const noexcept {
        return (static_cast<std::size_t>(y) * static_cast<std::size_t>(width_)
                + static_cast<std::size_t>(x)) * BytesPerPixel;
    }
};

} // namespace blockfall::render
