#include <gtest/gtest.h>

#include <limits>
#include <stdexcept>

#include "gfx/color.hpp"
#include "gfx/draw.hpp"
#include "gfx/font.hpp"
#include "gfx/rect.hpp"
#include "gfx/surface.hpp"
#include "gfx/transform.hpp"
#include "gfx/vector2.hpp"

namespace evalbox::gfx {
namespace {

const Color kRed(255, 0, 0);
const Color kBlack(0, 0, 0);

TEST(ColorTest, ValidatesChannelsAndNames) {
    EXPECT_THROW(Color(256, 0, 0), std::invalid_argument);
    EXPECT_THROW(Color(0, -1, 0), std::invalid_argument);
    EXPECT_EQ(Color::FromName("RED"), kRed);
    EXPECT_EQ(Color::FromName("transparent").a, 0);
    EXPECT_THROW(Color::FromName("ultraviolet"), std::invalid_argument);
    EXPECT_EQ(Color(1, 2, 3).Repr(), "Color(1, 2, 3, 255)");
}

TEST(RectTest, ClipUnionAndCollision) {
    const Rect a(0, 0, 10, 10);
    const Rect b(5, 5, 10, 10);
    EXPECT_EQ(a.Clip(b), Rect(5, 5, 5, 5));
    EXPECT_EQ(a.Union(b), Rect(0, 0, 15, 15));
    EXPECT_TRUE(a.CollideRect(b));
    EXPECT_FALSE(a.CollideRect(Rect(10, 0, 5, 5)));
    EXPECT_TRUE(a.CollidePoint(9, 9));
    EXPECT_FALSE(a.CollidePoint(10, 9));
    EXPECT_EQ(Rect(10, 10, -4, -6).Normalized(), Rect(6, 4, 4, 6));
}

TEST(RectTest, EdgesSaturateAtIntRange) {
    constexpr int kMax = std::numeric_limits<int>::max();
    constexpr int kMin = std::numeric_limits<int>::min();
    const Rect far(2147483640, 0, 100, 2);
    EXPECT_EQ(far.Right(), kMax);
    EXPECT_EQ(far.Move(100, 0).x, kMax);
    EXPECT_EQ(Rect(kMin, 0, kMin, 1).Normalized(), Rect(kMin, 0, kMax, 1));
    EXPECT_EQ(Rect(0, 0, kMax, kMax).Inflate(10, 10).w, kMax);
    EXPECT_EQ(Rect(kMin, kMin, 1, 1).Union(Rect(kMax - 1, kMax - 1, 1, 1)).w, kMax);
    EXPECT_FALSE(far.CollidePoint(0, 0));

    Surface surface(4, 4);
    surface.Fill(kRed, far);
    EXPECT_EQ(surface.GetAt(3, 0), kBlack);
    surface.Fill(kRed, Rect(kMin, kMin, kMax, kMax));
    EXPECT_EQ(surface.GetAt(0, 0), kBlack);
    const Rect touched = draw::Rectangle(surface, kRed, Rect(kMin, kMin, kMax, kMax), 3);
    EXPECT_TRUE(touched.Empty());
    draw::Rectangle(surface, kRed, Rect(-10, -10, kMax, kMax), 1);
    EXPECT_EQ(surface.GetAt(0, 0), kBlack);
}

TEST(Vector2Test, Arithmetic) {
    const Vector2 v(3.0, 4.0);
    EXPECT_DOUBLE_EQ(v.Length(), 5.0);
    EXPECT_DOUBLE_EQ(v.Normalize().Length(), 1.0);
    EXPECT_THROW(Vector2().Normalize(), std::invalid_argument);
    EXPECT_THROW(v / 0.0, std::invalid_argument);
    const Vector2 rotated = Vector2(1.0, 0.0).Rotate(90.0);
    EXPECT_NEAR(rotated.x, 0.0, 1e-9);
    EXPECT_NEAR(rotated.y, 1.0, 1e-9);
    EXPECT_EQ(2.0 * v, Vector2(6.0, 8.0));
}

TEST(SurfaceTest, SizeLimitsAndPixelAccess) {
    EXPECT_THROW(Surface(0, 10), std::invalid_argument);
    EXPECT_THROW(Surface(Surface::kMaxSide + 1, 1), std::invalid_argument);
    Surface surface(4, 3);
    EXPECT_EQ(surface.GetAt(0, 0), kBlack);
    surface.SetAt(3, 2, kRed);
    EXPECT_EQ(surface.GetAt(3, 2), kRed);
    EXPECT_THROW(surface.GetAt(4, 0), std::out_of_range);
    EXPECT_THROW(surface.SetAt(-1, 0, kRed), std::out_of_range);
    EXPECT_EQ(surface.Pixels().size(), 4u * 3u * 4u);
}

TEST(SurfaceTest, FillIsClippedAndBlitBlends) {
    Surface surface(8, 8);
    surface.Fill(kRed, Rect(6, 6, 10, 10));
    EXPECT_EQ(surface.GetAt(7, 7), kRed);
    EXPECT_EQ(surface.GetAt(5, 5), kBlack);

    Surface overlay(2, 2);
    overlay.Fill(Color(0, 0, 255, 0));
    overlay.SetAt(0, 0, Color(0, 0, 255));
    const Rect touched = surface.Blit(overlay, 7, 7);
    EXPECT_EQ(touched, Rect(7, 7, 1, 1));
    EXPECT_EQ(surface.GetAt(7, 7), Color(0, 0, 255));
}

TEST(DrawTest, FilledRectangleAndOutline) {
    Surface surface(10, 10);
    draw::Rectangle(surface, kRed, Rect(2, 2, 6, 6), 0);
    EXPECT_EQ(surface.GetAt(4, 4), kRed);

    Surface outline(10, 10);
    draw::Rectangle(outline, kRed, Rect(2, 2, 6, 6), 1);
    EXPECT_EQ(outline.GetAt(2, 4), kRed);
    EXPECT_EQ(outline.GetAt(4, 4), kBlack);
    EXPECT_THROW(draw::Rectangle(outline, kRed, Rect(0, 0, 2, 2), -1), std::invalid_argument);
}

TEST(DrawTest, LineEndpointsAreInclusive) {
    Surface surface(10, 10);
    const Rect touched = draw::Line(surface, kRed, Vector2(0, 0), Vector2(9, 9));
    EXPECT_EQ(surface.GetAt(0, 0), kRed);
    EXPECT_EQ(surface.GetAt(5, 5), kRed);
    EXPECT_EQ(surface.GetAt(9, 9), kRed);
    EXPECT_EQ(surface.GetAt(9, 0), kBlack);
    EXPECT_EQ(touched, Rect(0, 0, 10, 10));
}

TEST(DrawTest, CircleFillsCentreAndRingLeavesItEmpty) {
    Surface filled(21, 21);
    draw::Circle(filled, kRed, Vector2(10.5, 10.5), 8, 0);
    EXPECT_EQ(filled.GetAt(10, 10), kRed);
    EXPECT_EQ(filled.GetAt(0, 0), kBlack);

    Surface ring(21, 21);
    draw::Circle(ring, kRed, Vector2(10.5, 10.5), 8, 2);
    EXPECT_EQ(ring.GetAt(10, 10), kBlack);
    EXPECT_EQ(ring.GetAt(10, 3), kRed);
}

TEST(DrawTest, PolygonFillAndOffSurfaceShapes) {
    Surface surface(10, 10);
    draw::Polygon(surface, kRed, {Vector2(0, 0), Vector2(10, 0), Vector2(10, 10), Vector2(0, 10)});
    EXPECT_EQ(surface.GetAt(5, 5), kRed);
    EXPECT_THROW(draw::Polygon(surface, kRed, {Vector2(0, 0), Vector2(1, 1)}), std::invalid_argument);

    Surface untouched(10, 10);
    const Rect touched = draw::Circle(untouched, kRed, Vector2(-100, -100), 5);
    EXPECT_TRUE(touched.Empty());
    EXPECT_EQ(untouched.GetAt(0, 0), kBlack);
}

TEST(TransformTest, FlipScaleRotate) {
    Surface surface(4, 2);
    surface.SetAt(0, 0, kRed);

    const Surface flipped = transform::Flip(surface, true, true);
    EXPECT_EQ(flipped.GetAt(3, 1), kRed);

    const Surface scaled = transform::Scale(surface, 8, 4);
    EXPECT_EQ(scaled.Width(), 8);
    EXPECT_EQ(scaled.GetAt(1, 1), kRed);
    EXPECT_THROW(transform::Scale(surface, 0, 4), std::invalid_argument);

    const Surface rotated = transform::Rotate(surface, 90.0);
    EXPECT_EQ(rotated.Width(), 2);
    EXPECT_EQ(rotated.Height(), 4);
    // Counter-clockwise: the top-left pixel ends up bottom-left.
    EXPECT_EQ(rotated.GetAt(0, 3), kRed);
}

TEST(FontTest, SizeAndRender) {
    EXPECT_EQ(font::Size("AB"), std::make_pair(11, 7));
    EXPECT_EQ(font::Size("AB\nC", 2), std::make_pair(22, 30));
    EXPECT_THROW(font::Size("A", 0), std::invalid_argument);

    const Surface text = font::Render("I", kRed);
    EXPECT_EQ(text.Width(), 5);
    EXPECT_EQ(text.Height(), 7);
    EXPECT_EQ(text.GetAt(2, 3), kRed);
    EXPECT_EQ(text.GetAt(0, 3).a, 0);

    const Surface boxed = font::Render("i", kRed, 1, Color(0, 0, 255));
    EXPECT_EQ(boxed.GetAt(0, 3), Color(0, 0, 255));
    EXPECT_EQ(boxed.GetAt(2, 3), kRed);
}

}  // namespace
}  // namespace evalbox::gfx
