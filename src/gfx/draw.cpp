#include "gfx/draw.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace evalbox::gfx::draw {

namespace {

void CheckWidth(int width) {
    if (width < 0) {
        throw std::invalid_argument("width must not be negative");
    }
}

int Round(double value) {
    return static_cast<int>(std::lround(value));
}

constexpr int kCoordLimit = 1 << 20;

// Keeps coordinates well inside int range before any arithmetic on them.
double ClampCoord(double value) {
    constexpr double kLimit = kCoordLimit;
    if (std::isnan(value)) {
        throw std::invalid_argument("coordinate must be a number");
    }
    return std::clamp(value, -kLimit, kLimit);
}

class Bounds {
public:
    explicit Bounds(const Surface& surface) : surface_rect_(surface.GetRect()) {}

    void Add(int x0, int y0, int x1, int y1) {
        if (x0 > x1) {
            std::swap(x0, x1);
        }
        if (y0 > y1) {
            std::swap(y0, y1);
        }
        touched_ = touched_.Union(Rect(x0, y0, x1 - x0 + 1, y1 - y0 + 1));
    }

    Rect Result() const {
        if (touched_.Empty()) {
            return {};
        }
        return touched_.Clip(surface_rect_);
    }

private:
    Rect surface_rect_;
    Rect touched_;
};

void Stamp(Surface& surface, const Color& color, int x, int y, int width) {
    if (width <= 1) {
        surface.Blend(x, y, color);
        return;
    }
    const int half = width / 2;
    for (int dy = 0; dy < width; ++dy) {
        surface.BlendSpan(x - half, x - half + width - 1, y - half + dy, color);
    }
}

void Bresenham(Surface& surface, const Color& color, int x0, int y0, int x1, int y1, int width) {
    const int dx = std::abs(x1 - x0);
    const int dy = -std::abs(y1 - y0);
    const int sx = x0 < x1 ? 1 : -1;
    const int sy = y0 < y1 ? 1 : -1;
    int err = dx + dy;
    while (true) {
        Stamp(surface, color, x0, y0, width);
        if (x0 == x1 && y0 == y1) {
            break;
        }
        const int e2 = 2 * err;
        if (e2 >= dy) {
            err += dy;
            x0 += sx;
        }
        if (e2 <= dx) {
            err += dx;
            y0 += sy;
        }
    }
}

// Half-width of an ellipse row at vertical offset `dy` from the centre.
double RowHalfWidth(double rx, double ry, double dy) {
    if (ry <= 0.0) {
        return rx;
    }
    const double t = 1.0 - (dy * dy) / (ry * ry);
    return t <= 0.0 ? 0.0 : rx * std::sqrt(t);
}

Rect FillRing(Surface& surface, const Color& color, double cx, double cy, double rx, double ry, int width) {
    Bounds bounds(surface);
    const double inner_rx = rx - width;
    const double inner_ry = ry - width;
    const bool filled = width == 0 || inner_rx <= 0.0 || inner_ry <= 0.0;
    const int top = std::max(static_cast<int>(std::floor(std::max(cy - ry, -1.0))), 0);
    const int bottom = static_cast<int>(std::min(std::ceil(cy + ry), surface.Height() - 1.0));
    for (int y = top; y <= bottom; ++y) {
        const double dy = (y + 0.5) - cy;
        if (std::abs(dy) > ry) {
            continue;
        }
        const double outer = RowHalfWidth(rx, ry, dy);
        const double limit = surface.Width() + 1.0;
        const int left = Round(std::clamp(cx - outer, -1.0, limit));
        const int right = Round(std::clamp(cx + outer, -1.0, limit)) - 1;
        if (right < left) {
            continue;
        }
        if (filled || std::abs(dy) >= inner_ry) {
            surface.BlendSpan(left, right, y, color);
        } else {
            const double inner = RowHalfWidth(inner_rx, inner_ry, dy);
            const int inner_left = Round(std::clamp(cx - inner, -1.0, limit));
            const int inner_right = Round(std::clamp(cx + inner, -1.0, limit)) - 1;
            surface.BlendSpan(left, inner_left - 1, y, color);
            surface.BlendSpan(inner_right + 1, right, y, color);
        }
        bounds.Add(left, y, right, y);
    }
    return bounds.Result();
}

}  // namespace

Rect Line(Surface& surface, const Color& color, const Vector2& start, const Vector2& end, int width) {
    CheckWidth(width);
    if (width == 0) {
        return {};
    }
    width = std::min(width, 2 * Surface::kMaxSide);
    const int x0 = Round(ClampCoord(start.x));
    const int y0 = Round(ClampCoord(start.y));
    const int x1 = Round(ClampCoord(end.x));
    const int y1 = Round(ClampCoord(end.y));
    Bresenham(surface, color, x0, y0, x1, y1, width);
    Bounds bounds(surface);
    const int half = width / 2;
    bounds.Add(std::min(x0, x1) - half, std::min(y0, y1) - half,
               std::max(x0, x1) - half + width - 1, std::max(y0, y1) - half + width - 1);
    return bounds.Result();
}

Rect Lines(Surface& surface, const Color& color, bool closed, const std::vector<Vector2>& points, int width) {
    CheckWidth(width);
    if (points.size() < 2) {
        throw std::invalid_argument("lines needs at least two points");
    }
    Rect touched;
    for (std::size_t i = 0; i + 1 < points.size(); ++i) {
        touched = touched.Union(Line(surface, color, points[i], points[i + 1], width));
    }
    if (closed && points.size() > 2) {
        touched = touched.Union(Line(surface, color, points.back(), points.front(), width));
    }
    return touched;
}

Rect Rectangle(Surface& surface, const Color& color, const Rect& rect, int width) {
    CheckWidth(width);
    // Edges past the coordinate limit never reach a surface.
    const Rect area = rect.Normalized().Clip(Rect(-kCoordLimit, -kCoordLimit, 2 * kCoordLimit, 2 * kCoordLimit));
    if (area.Empty()) {
        return {};
    }
    Bounds bounds(surface);
    const int first_row = std::max(area.Top(), 0);
    const int last_row = std::min(area.Bottom(), surface.Height());
    if (width == 0 || width >= area.w / 2 + 1 || width >= area.h / 2 + 1) {
        for (int y = first_row; y < last_row; ++y) {
            surface.BlendSpan(area.Left(), area.Right() - 1, y, color);
        }
    } else {
        for (int y = first_row; y < last_row; ++y) {
            if (y < area.Top() + width || y >= area.Bottom() - width) {
                surface.BlendSpan(area.Left(), area.Right() - 1, y, color);
            } else {
                surface.BlendSpan(area.Left(), area.Left() + width - 1, y, color);
                surface.BlendSpan(area.Right() - width, area.Right() - 1, y, color);
            }
        }
    }
    bounds.Add(area.Left(), area.Top(), area.Right() - 1, area.Bottom() - 1);
    return bounds.Result();
}

Rect Circle(Surface& surface, const Color& color, const Vector2& center, int radius, int width) {
    CheckWidth(width);
    if (radius < 0) {
        throw std::invalid_argument("radius must not be negative");
    }
    if (radius == 0) {
        return {};
    }
    return FillRing(surface, color, ClampCoord(center.x), ClampCoord(center.y),
                    radius, radius, width);
}

Rect Ellipse(Surface& surface, const Color& color, const Rect& rect, int width) {
    CheckWidth(width);
    const Rect area = rect.Normalized();
    if (area.Empty()) {
        return {};
    }
    const double rx = area.w / 2.0;
    const double ry = area.h / 2.0;
    return FillRing(surface, color, area.x + rx, area.y + ry, rx, ry, width);
}

Rect Polygon(Surface& surface, const Color& color, const std::vector<Vector2>& points, int width) {
    CheckWidth(width);
    if (points.size() < 3) {
        throw std::invalid_argument("polygon needs at least three points");
    }
    if (width > 0) {
        return Lines(surface, color, true, points, width);
    }
    std::vector<Vector2> clamped;
    clamped.reserve(points.size());
    double min_y = ClampCoord(points.front().y);
    double max_y = min_y;
    for (const auto& point : points) {
        clamped.emplace_back(ClampCoord(point.x), ClampCoord(point.y));
        min_y = std::min(min_y, clamped.back().y);
        max_y = std::max(max_y, clamped.back().y);
    }
    const int top = std::max(Round(std::floor(min_y)), 0);
    const int bottom = std::min(Round(std::ceil(max_y)), surface.Height() - 1);
    Bounds bounds(surface);
    std::vector<double> crossings;
    for (int y = top; y <= bottom; ++y) {
        const double sample = y + 0.5;
        crossings.clear();
        for (std::size_t i = 0; i < clamped.size(); ++i) {
            const Vector2& a = clamped[i];
            const Vector2& b = clamped[(i + 1) % clamped.size()];
            if ((a.y <= sample && b.y > sample) || (b.y <= sample && a.y > sample)) {
                crossings.push_back(a.x + (sample - a.y) * (b.x - a.x) / (b.y - a.y));
            }
        }
        std::sort(crossings.begin(), crossings.end());
        for (std::size_t i = 0; i + 1 < crossings.size(); i += 2) {
            const int left = Round(crossings[i]);
            const int right = Round(crossings[i + 1]) - 1;
            if (right < left) {
                continue;
            }
            surface.BlendSpan(left, right, y, color);
            bounds.Add(left, y, right, y);
        }
    }
    // Degenerate (flat) polygons still show their outline.
    if (bounds.Result().Empty()) {
        return Lines(surface, color, true, points, 1);
    }
    return bounds.Result();
}

}  // namespace evalbox::gfx::draw
