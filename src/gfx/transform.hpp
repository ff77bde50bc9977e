#pragma once

#include "gfx/surface.hpp"

namespace evalbox::gfx::transform {

Surface Flip(const Surface& surface, bool flip_x, bool flip_y);

// Nearest-neighbour resampling; the new size must be a valid surface size.
Surface Scale(const Surface& surface, int width, int height);

// Counter-clockwise rotation by `degrees`. The result grows to the rotated
// bounding box and the uncovered corners are transparent.
Surface Rotate(const Surface& surface, double degrees);

}  // namespace evalbox::gfx::transform
