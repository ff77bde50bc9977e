#pragma once

#include <vector>

#include "gfx/color.hpp"
#include "gfx/rect.hpp"
#include "gfx/surface.hpp"
#include "gfx/vector2.hpp"

namespace evalbox::gfx::draw {

// All primitives blend onto the surface, clip silently, and return the
// bounding box of the touched pixels (empty when nothing was drawn).
// A `width` of 0 means "filled" where a shape has an interior.
// Negative widths and radii throw std::invalid_argument.

Rect Line(Surface& surface, const Color& color, const Vector2& start, const Vector2& end, int width = 1);

Rect Lines(Surface& surface, const Color& color, bool closed, const std::vector<Vector2>& points, int width = 1);

Rect Rectangle(Surface& surface, const Color& color, const Rect& rect, int width = 0);

Rect Circle(Surface& surface, const Color& color, const Vector2& center, int radius, int width = 0);

Rect Ellipse(Surface& surface, const Color& color, const Rect& rect, int width = 0);

// Needs at least three points; even-odd fill.
Rect Polygon(Surface& surface, const Color& color, const std::vector<Vector2>& points, int width = 0);

}  // namespace evalbox::gfx::draw
