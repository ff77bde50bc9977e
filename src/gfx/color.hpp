#pragma once

#include <cstdint>
#include <string>

namespace evalbox::gfx {

struct Color {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
    std::uint8_t a = 255;

    Color() = default;
    // Throws std::invalid_argument when a channel is outside 0..255.
    Color(int red, int green, int blue, int alpha = 255);

    // "red", "white", "transparent", ... ; throws std::invalid_argument for unknown names.
    static Color FromName(const std::string& name);

    bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b && a == other.a;
    }
    bool operator!=(const Color& other) const { return !(*this == other); }

    std::string Repr() const;
};

}  // namespace evalbox::gfx
