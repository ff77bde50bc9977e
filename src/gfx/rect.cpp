#include "gfx/rect.hpp"

#include <algorithm>
#include <limits>

namespace evalbox::gfx {

int SaturateCoord(std::int64_t value) {
    constexpr std::int64_t kMin = std::numeric_limits<int>::min();
    constexpr std::int64_t kMax = std::numeric_limits<int>::max();
    return static_cast<int>(std::clamp(value, kMin, kMax));
}

Rect Rect::Normalized() const {
    Rect result = *this;
    if (result.w < 0) {
        result.x = SaturateCoord(std::int64_t{x} + w);
        result.w = SaturateCoord(-std::int64_t{w});
    }
    if (result.h < 0) {
        result.y = SaturateCoord(std::int64_t{y} + h);
        result.h = SaturateCoord(-std::int64_t{h});
    }
    return result;
}

Rect Rect::Move(int dx, int dy) const {
    return {SaturateCoord(std::int64_t{x} + dx), SaturateCoord(std::int64_t{y} + dy), w, h};
}

Rect Rect::Inflate(int dx, int dy) const {
    return {SaturateCoord(std::int64_t{x} - dx / 2), SaturateCoord(std::int64_t{y} - dy / 2),
            SaturateCoord(std::int64_t{w} + dx), SaturateCoord(std::int64_t{h} + dy)};
}

Rect Rect::Clip(const Rect& other) const {
    const Rect a = Normalized();
    const Rect b = other.Normalized();
    const int left = std::max(a.Left(), b.Left());
    const int top = std::max(a.Top(), b.Top());
    const int right = std::min(a.Right(), b.Right());
    const int bottom = std::min(a.Bottom(), b.Bottom());
    if (right <= left || bottom <= top) {
        return {a.x, a.y, 0, 0};
    }
    return {left, top, SaturateCoord(std::int64_t{right} - left), SaturateCoord(std::int64_t{bottom} - top)};
}

Rect Rect::Union(const Rect& other) const {
    const Rect a = Normalized();
    const Rect b = other.Normalized();
    if (a.Empty()) {
        return b;
    }
    if (b.Empty()) {
        return a;
    }
    const int left = std::min(a.Left(), b.Left());
    const int top = std::min(a.Top(), b.Top());
    return {left, top, SaturateCoord(std::int64_t{std::max(a.Right(), b.Right())} - left),
            SaturateCoord(std::int64_t{std::max(a.Bottom(), b.Bottom())} - top)};
}

bool Rect::CollidePoint(int px, int py) const {
    const Rect a = Normalized();
    return px >= a.Left() && px < a.Right() && py >= a.Top() && py < a.Bottom();
}

bool Rect::CollideRect(const Rect& other) const {
    return !Clip(other).Empty();
}

std::string Rect::Repr() const {
    return "Rect(" + std::to_string(x) + ", " + std::to_string(y) + ", " +
           std::to_string(w) + ", " + std::to_string(h) + ")";
}

}  // namespace evalbox::gfx
