#include "gfx/surface.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace evalbox::gfx {

namespace {

std::uint8_t Mix(std::uint8_t dst, std::uint8_t src, unsigned alpha) {
    return static_cast<std::uint8_t>((src * alpha + dst * (255 - alpha) + 127) / 255);
}

}  // namespace

Surface::Surface(int width, int height)
    : width_(width)
    , height_(height) {
    if (width < 1 || height < 1 || width > kMaxSide || height > kMaxSide) {
        throw std::invalid_argument("surface size must be between 1x1 and " +
                                    std::to_string(kMaxSide) + "x" + std::to_string(kMaxSide) +
                                    ", got " + std::to_string(width) + "x" + std::to_string(height));
    }
    pixels_.assign(static_cast<std::size_t>(width) * static_cast<std::size_t>(height) * 4, 0);
    for (std::size_t i = 3; i < pixels_.size(); i += 4) {
        pixels_[i] = 255;
    }
}

void Surface::Fill(const Color& color) {
    Fill(color, GetRect());
}

void Surface::Fill(const Color& color, const Rect& area) {
    const Rect clipped = area.Clip(GetRect());
    for (int y = clipped.Top(); y < clipped.Bottom(); ++y) {
        for (int x = clipped.Left(); x < clipped.Right(); ++x) {
            auto* px = &pixels_[Offset(x, y)];
            px[0] = color.r;
            px[1] = color.g;
            px[2] = color.b;
            px[3] = color.a;
        }
    }
}

Color Surface::GetAt(int x, int y) const {
    if (!Contains(x, y)) {
        throw std::out_of_range("pixel (" + std::to_string(x) + ", " + std::to_string(y) +
                                ") is outside the surface");
    }
    const auto* px = &pixels_[Offset(x, y)];
    Color color;
    color.r = px[0];
    color.g = px[1];
    color.b = px[2];
    color.a = px[3];
    return color;
}

void Surface::SetAt(int x, int y, const Color& color) {
    if (!Contains(x, y)) {
        throw std::out_of_range("pixel (" + std::to_string(x) + ", " + std::to_string(y) +
                                ") is outside the surface");
    }
    auto* px = &pixels_[Offset(x, y)];
    px[0] = color.r;
    px[1] = color.g;
    px[2] = color.b;
    px[3] = color.a;
}

void Surface::Blend(int x, int y, const Color& color) {
    if (!Contains(x, y) || color.a == 0) {
        return;
    }
    auto* px = &pixels_[Offset(x, y)];
    if (color.a == 255) {
        px[0] = color.r;
        px[1] = color.g;
        px[2] = color.b;
        px[3] = 255;
        return;
    }
    px[0] = Mix(px[0], color.r, color.a);
    px[1] = Mix(px[1], color.g, color.a);
    px[2] = Mix(px[2], color.b, color.a);
    px[3] = static_cast<std::uint8_t>(color.a + (px[3] * (255 - color.a) + 127) / 255);
}

void Surface::BlendSpan(int x0, int x1, int y, const Color& color) {
    if (y < 0 || y >= height_) {
        return;
    }
    if (x0 > x1) {
        std::swap(x0, x1);
    }
    x0 = std::max(x0, 0);
    x1 = std::min(x1, width_ - 1);
    for (int x = x0; x <= x1; ++x) {
        Blend(x, y, color);
    }
}

Rect Surface::Blit(const Surface& source, int x, int y) {
    const Rect target = Rect(x, y, source.width_, source.height_).Clip(GetRect());
    if (target.Empty()) {
        return target;
    }
    // Blitting a surface onto itself must read the original pixels.
    std::vector<std::uint8_t> self_copy;
    if (&source == this) {
        self_copy = pixels_;
    }
    const auto& src_pixels = (&source == this) ? self_copy : source.pixels_;
    for (int ty = target.Top(); ty < target.Bottom(); ++ty) {
        for (int tx = target.Left(); tx < target.Right(); ++tx) {
            const auto* px = &src_pixels[source.Offset(tx - x, ty - y)];
            Color color;
            color.r = px[0];
            color.g = px[1];
            color.b = px[2];
            color.a = px[3];
            Blend(tx, ty, color);
        }
    }
    return target;
}

}  // namespace evalbox::gfx
