#include "gfx/transform.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace evalbox::gfx::transform {

namespace {

constexpr double kPi = 3.14159265358979323846;

}  // namespace

Surface Flip(const Surface& surface, bool flip_x, bool flip_y) {
    Surface result(surface.Width(), surface.Height());
    for (int y = 0; y < surface.Height(); ++y) {
        const int src_y = flip_y ? surface.Height() - 1 - y : y;
        for (int x = 0; x < surface.Width(); ++x) {
            const int src_x = flip_x ? surface.Width() - 1 - x : x;
            result.SetAt(x, y, surface.GetAt(src_x, src_y));
        }
    }
    return result;
}

Surface Scale(const Surface& surface, int width, int height) {
    Surface result(width, height);
    for (int y = 0; y < height; ++y) {
        const int src_y = static_cast<int>(static_cast<long long>(y) * surface.Height() / height);
        for (int x = 0; x < width; ++x) {
            const int src_x = static_cast<int>(static_cast<long long>(x) * surface.Width() / width);
            result.SetAt(x, y, surface.GetAt(src_x, src_y));
        }
    }
    return result;
}

Surface Rotate(const Surface& surface, double degrees) {
    if (!std::isfinite(degrees)) {
        throw std::invalid_argument("rotation angle must be finite");
    }
    const double radians = std::fmod(degrees, 360.0) * kPi / 180.0;
    const double c = std::cos(radians);
    const double s = std::sin(radians);
    const double w = surface.Width();
    const double h = surface.Height();
    const int out_w = std::max(1, static_cast<int>(std::ceil(std::abs(w * c) + std::abs(h * s) - 1e-9)));
    const int out_h = std::max(1, static_cast<int>(std::ceil(std::abs(w * s) + std::abs(h * c) - 1e-9)));
    Surface result(out_w, out_h);
    result.Fill(Color(0, 0, 0, 0));

    const double src_cx = w / 2.0;
    const double src_cy = h / 2.0;
    const double dst_cx = out_w / 2.0;
    const double dst_cy = out_h / 2.0;
    for (int y = 0; y < out_h; ++y) {
        for (int x = 0; x < out_w; ++x) {
            // Screen y grows downwards, so a counter-clockwise turn on screen
            // maps destination pixels back with the transposed matrix.
            const double dx = x + 0.5 - dst_cx;
            const double dy = y + 0.5 - dst_cy;
            const double sx = dx * c - dy * s + src_cx;
            const double sy = dx * s + dy * c + src_cy;
            const int ix = static_cast<int>(std::floor(sx));
            const int iy = static_cast<int>(std::floor(sy));
            if (ix >= 0 && iy >= 0 && ix < surface.Width() && iy < surface.Height()) {
                result.SetAt(x, y, surface.GetAt(ix, iy));
            }
        }
    }
    return result;
}

}  // namespace evalbox::gfx::transform
