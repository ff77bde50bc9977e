#pragma once

#include <cstdint>
#include <string>

namespace evalbox::gfx {

// Clamps a 64-bit coordinate into int range.
int SaturateCoord(std::int64_t value);

// Axis-aligned integer rectangle; width/height may be negative until Normalized().
struct Rect {
    int x = 0;
    int y = 0;
    int w = 0;
    int h = 0;

    Rect() = default;
    Rect(int x_value, int y_value, int width, int height)
        : x(x_value), y(y_value), w(width), h(height) {}

    int Left() const { return x; }
    int Top() const { return y; }
    // Edge arithmetic saturates instead of overflowing.
    int Right() const { return SaturateCoord(std::int64_t{x} + w); }
    int Bottom() const { return SaturateCoord(std::int64_t{y} + h); }
    int CenterX() const { return SaturateCoord(std::int64_t{x} + w / 2); }
    int CenterY() const { return SaturateCoord(std::int64_t{y} + h / 2); }
    bool Empty() const { return w <= 0 || h <= 0; }

    Rect Normalized() const;
    Rect Move(int dx, int dy) const;
    Rect Inflate(int dx, int dy) const;
    // Intersection; an empty Rect at (x, y) when they do not overlap.
    Rect Clip(const Rect& other) const;
    Rect Union(const Rect& other) const;
    bool CollidePoint(int px, int py) const;
    bool CollideRect(const Rect& other) const;

    bool operator==(const Rect& other) const {
        return x == other.x && y == other.y && w == other.w && h == other.h;
    }

    std::string Repr() const;
};

}  // namespace evalbox::gfx
