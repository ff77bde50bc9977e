#include "gfx/color.hpp"

#include <stdexcept>
#include <unordered_map>

#include "utils/common.hpp"

namespace evalbox::gfx {

namespace {

std::uint8_t CheckChannel(int value, const char* name) {
    if (value < 0 || value > 255) {
        throw std::invalid_argument(std::string("color ") + name + " must be in 0..255, got " +
                                    std::to_string(value));
    }
    return static_cast<std::uint8_t>(value);
}

}  // namespace

Color::Color(int red, int green, int blue, int alpha)
    : r(CheckChannel(red, "red"))
    , g(CheckChannel(green, "green"))
    , b(CheckChannel(blue, "blue"))
    , a(CheckChannel(alpha, "alpha")) {}

Color Color::FromName(const std::string& name) {
    static const std::unordered_map<std::string, Color> kNamed = {
        {"black", Color(0, 0, 0)},
        {"white", Color(255, 255, 255)},
        {"red", Color(255, 0, 0)},
        {"green", Color(0, 255, 0)},
        {"blue", Color(0, 0, 255)},
        {"yellow", Color(255, 255, 0)},
        {"cyan", Color(0, 255, 255)},
        {"magenta", Color(255, 0, 255)},
        {"orange", Color(255, 165, 0)},
        {"purple", Color(128, 0, 128)},
        {"pink", Color(255, 192, 203)},
        {"brown", Color(165, 42, 42)},
        {"gray", Color(128, 128, 128)},
        {"grey", Color(128, 128, 128)},
        {"transparent", Color(0, 0, 0, 0)}
    };
    const auto it = kNamed.find(utils::ToLower(name));
    if (it == kNamed.end()) {
        throw std::invalid_argument("unknown color name '" + name + "'");
    }
    return it->second;
}

std::string Color::Repr() const {
    return "Color(" + std::to_string(r) + ", " + std::to_string(g) + ", " +
           std::to_string(b) + ", " + std::to_string(a) + ")";
}

}  // namespace evalbox::gfx
