#pragma once

#include <string>

namespace evalbox::gfx {

struct Vector2 {
    double x = 0.0;
    double y = 0.0;

    Vector2() = default;
    Vector2(double x_value, double y_value) : x(x_value), y(y_value) {}

    Vector2 operator+(const Vector2& other) const { return {x + other.x, y + other.y}; }
    Vector2 operator-(const Vector2& other) const { return {x - other.x, y - other.y}; }
    Vector2 operator-() const { return {-x, -y}; }
    Vector2 operator*(double scalar) const { return {x * scalar, y * scalar}; }
    // Throws std::invalid_argument on division by zero.
    Vector2 operator/(double scalar) const;
    bool operator==(const Vector2& other) const { return x == other.x && y == other.y; }

    double Dot(const Vector2& other) const { return x * other.x + y * other.y; }
    double Cross(const Vector2& other) const { return x * other.y - y * other.x; }
    double LengthSquared() const { return Dot(*this); }
    double Length() const;
    double DistanceTo(const Vector2& other) const { return (*this - other).Length(); }
    // Throws std::invalid_argument for the zero vector.
    Vector2 Normalize() const;
    // Counter-clockwise in a y-up frame, matching transform::Rotate.
    Vector2 Rotate(double degrees) const;
    Vector2 Lerp(const Vector2& other, double t) const;

    std::string Repr() const;
};

inline Vector2 operator*(double scalar, const Vector2& vector) {
    return vector * scalar;
}

}  // namespace evalbox::gfx
