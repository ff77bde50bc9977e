#pragma once

#include <optional>
#include <string>
#include <utility>

#include "gfx/color.hpp"
#include "gfx/surface.hpp"

namespace evalbox::gfx::font {

constexpr int kGlyphWidth = 5;
constexpr int kGlyphHeight = 7;
constexpr int kAdvance = kGlyphWidth + 1;
constexpr int kLineHeight = kGlyphHeight + 1;
constexpr int kMaxScale = 16;

// Pixel size of `text` rendered at `scale`; lines split on '\n'.
std::pair<int, int> Size(const std::string& text, int scale = 1);

// Fixed 5x7 bitmap font covering printable ASCII; lowercase renders as
// uppercase and anything else as '?'. Without a background the surface is
// transparent. Throws std::invalid_argument for a scale outside 1..kMaxScale
// or when the text does not fit a surface.
Surface Render(const std::string& text,
               const Color& color,
               int scale = 1,
               const std::optional<Color>& background = std::nullopt);

}  // namespace evalbox::gfx::font
