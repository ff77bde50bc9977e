#pragma once

#include <cstdint>
#include <vector>

#include "gfx/color.hpp"
#include "gfx/rect.hpp"

namespace evalbox::gfx {

// RGBA8 pixel buffer, row-major, no padding.
class Surface {
public:
    static constexpr int kMaxSide = 4096;

    // Throws std::invalid_argument unless 1 <= width, height <= kMaxSide.
    // A new surface is opaque black.
    Surface(int width, int height);

    int Width() const { return width_; }
    int Height() const { return height_; }
    Rect GetRect() const { return {0, 0, width_, height_}; }

    void Fill(const Color& color);
    void Fill(const Color& color, const Rect& area);

    // Throw std::out_of_range outside the surface.
    Color GetAt(int x, int y) const;
    void SetAt(int x, int y, const Color& color);

    // Source-over compositing of one pixel; silently clipped.
    void Blend(int x, int y, const Color& color);
    void BlendSpan(int x0, int x1, int y, const Color& color);

    // Alpha-composites `source` with its top-left corner at (x, y); returns the touched area.
    Rect Blit(const Surface& source, int x, int y);

    Surface Copy() const { return *this; }

    const std::vector<std::uint8_t>& Pixels() const { return pixels_; }

private:
    std::size_t Offset(int x, int y) const {
        return (static_cast<std::size_t>(y) * static_cast<std::size_t>(width_) +
                static_cast<std::size_t>(x)) * 4;
    }
    bool Contains(int x, int y) const { return x >= 0 && y >= 0 && x < width_ && y < height_; }

    int width_;
    int height_;
    std::vector<std::uint8_t> pixels_;
};

}  // namespace evalbox::gfx
