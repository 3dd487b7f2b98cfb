#include "render/Framebuffer.hpp"

#include <algorithm>
#include <stdexcept>

namespace blockfall::render {

Framebuffer::Framebuffer(int width, int height)
    : width_{width}
    , height_{height}
{
    if (width <= 0 || height <= 0) {
        throw std::invalid_argument("Framebuffer dimensions must be positive");
    }
    pixels_.assign(static_cast<std::size_t>(width) * static_cast<std::size_t>(height) * BytesPerPixel, 0);
}

Color Framebuffer::pixel(int x, int y) const {
    if (!contains(x, y)) {
        throw std::out_of_range("Framebuffer::pixel out of range");
    }
    const std::size_t o = offset(x, y);
    return Color{pixels_[o], pixels_[o + 1], pixels_[o + 2], pixels_[o + 3]};
}

void Framebuffer::clear(Color color) noexcept {
    fillRect(0, 0, width_, height_, color);
}

void Framebuffer::setPixel(int x, int y, Color color) noexcept {
    if (!contains(x, y)) {
        return;
    }
    const std::size_t o = offset(x, y);
    pixels_[o]     = color.r;
    pixels_[o + 1] = color.g;
    pixels_[o + 2] = color.b;
    pixels_[o + 3] = color.a;
}

void Framebuffer::fillRect(int x, int y, int w, int h, Color color) noexcept {
    if (w <= 0 || h <= 0) {
        return;
    }
    // Far edges in 64 bits; x + w may not fit in an int
    const int x0 = std::max(x, 0);
    const int y0 = std::max(y, 0);
    const int x1 = static_cast<int>(std::min<long long>(static_cast<long long>(x) + w, width_));
    const int y1 = static_cast<int>(std::min<long long>(static_cast<long long>(y) + h, height_));
    if (x0 >= x1 || y0 >= y1) {
        return;
    }

    for (int py = y0; py < y1; ++py) {
        std::size_t o = offset(x0, py);
        for (int px = x0; px < x1; ++px) {
            pixels_[o]     = color.r;
            pixels_[o + 1] = color.g;
            pixels_[o + 2] = color.b;
            pixels_[o + 3] = color.a;
            o += BytesPerPixel;
        }
    }
}

void Framebuffer::drawHLine(int x, int y, int length, Color color) noexcept {
    fillRect(x, y, length, 1, color);
}

void Framebuffer::drawVLine(int x, int y, int length, Color color) noexcept {
    fillRect(x, y, 1, length, color);
}

void Framebuffer::strokeRect(int x, int y, int w, int h, int thickness, Color color) noexcept {
    if (w <= 0 || h <= 0 || thickness <= 0) {
        return;
    }
    const int t = std::min({thickness, (w + 1) / 2, (h + 1) / 2});

    fillRect(x, y, w, t, color);                 // top
    fillRect(x, y + h - t, w, t, color);         // bottom
    fillRect(x, y + t, t, h - 2 * t, color);     // left
    fillRect(x + w - t, y + t, t, h - 2 * t, color); // right
}

} // namespace blockfall::render
