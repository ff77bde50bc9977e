#include "gfx/vector2.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>

namespace evalbox::gfx {

namespace {

constexpr double kPi = 3.14159265358979323846;

}  // namespace

Vector2 Vector2::operator/(double scalar) const {
    if (scalar == 0.0) {
        throw std::invalid_argument("cannot divide a vector by zero");
    }
    return {x / scalar, y / scalar};
}

double Vector2::Length() const {
    return std::hypot(x, y);
}

Vector2 Vector2::Normalize() const {
    const double length = Length();
    if (length == 0.0) {
        throw std::invalid_argument("cannot normalize a zero-length vector");
    }
    return {x / length, y / length};
}

Vector2 Vector2::Rotate(double degrees) const {
    const double radians = degrees * kPi / 180.0;
    const double c = std::cos(radians);
    const double s = std::sin(radians);
    return {x * c - y * s, x * s + y * c};
}

Vector2 Vector2::Lerp(const Vector2& other, double t) const {
    if (t < 0.0 || t > 1.0) {
        throw std::invalid_argument("lerp factor must be in 0..1");
    }
    return {x + (other.x - x) * t, y + (other.y - y) * t};
}

std::string Vector2::Repr() const {
    std::ostringstream oss;
    oss << "Vector2(" << x << ", " << y << ")";
    return oss.str();
}

}  // namespace evalbox::gfx
