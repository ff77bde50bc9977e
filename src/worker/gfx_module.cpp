#include "worker/gfx_module.hpp"

#include <boost/python.hpp>

#include <cmath>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "gfx/color.hpp"
#include "gfx/draw.hpp"
#include "gfx/font.hpp"
#include "gfx/rect.hpp"
#include "gfx/surface.hpp"
#include "gfx/transform.hpp"
#include "gfx/vector2.hpp"

namespace py = boost::python;

namespace evalbox::worker {

namespace {

[[noreturn]] void RaiseTypeError(const std::string& message) {
    PyErr_SetString(PyExc_TypeError, message.c_str());
    py::throw_error_already_set();
    throw std::logic_error("unreachable");
}

std::string TypeName(const py::object& value) {
    return Py_TYPE(value.ptr())->tp_name;
}

bool IsSequence(const py::object& value) {
    return PyList_Check(value.ptr()) || PyTuple_Check(value.ptr());
}

int CheckedInt(double raw, const char* what) {
    if (!std::isfinite(raw) || raw < std::numeric_limits<int>::min() || raw > std::numeric_limits<int>::max()) {
        throw std::invalid_argument(std::string(what) + " is out of range");
    }
    return static_cast<int>(raw);
}

int ToInt(const py::object& value, const char* what) {
    py::extract<double> number(value);
    if (!number.check()) {
        RaiseTypeError(std::string(what) + " must be a number, not " + TypeName(value));
    }
    return CheckedInt(number(), what);
}

gfx::Color ToColor(const py::object& value) {
    py::extract<const gfx::Color&> color(value);
    if (color.check()) {
        return color();
    }
    py::extract<std::string> name(value);
    if (name.check()) {
        return gfx::Color::FromName(name());
    }
    if (IsSequence(value)) {
        const auto size = py::len(value);
        if (size == 3 || size == 4) {
            return gfx::Color(ToInt(value[0], "red"), ToInt(value[1], "green"), ToInt(value[2], "blue"),
                              size == 4 ? ToInt(value[3], "alpha") : 255);
        }
    }
    RaiseTypeError("expected a Color, a color name or an (r, g, b[, a]) tuple, not " + TypeName(value));
}

gfx::Vector2 ToVector(const py::object& value) {
    py::extract<const gfx::Vector2&> vector(value);
    if (vector.check()) {
        return vector();
    }
    if (IsSequence(value) && py::len(value) == 2) {
        py::extract<double> x(value[0]);
        py::extract<double> y(value[1]);
        if (x.check() && y.check()) {
            return {x(), y()};
        }
    }
    RaiseTypeError("expected a Vector2 or an (x, y) pair, not " + TypeName(value));
}

gfx::Rect ToRect(const py::object& value) {
    py::extract<const gfx::Rect&> rect(value);
    if (rect.check()) {
        return rect();
    }
    if (IsSequence(value)) {
        const auto size = py::len(value);
        if (size == 4) {
            return {ToInt(value[0], "x"), ToInt(value[1], "y"), ToInt(value[2], "width"), ToInt(value[3], "height")};
        }
        if (size == 2) {
            const gfx::Vector2 position = ToVector(value[0]);
            const gfx::Vector2 extent = ToVector(value[1]);
            return {CheckedInt(position.x, "x"), CheckedInt(position.y, "y"),
                    CheckedInt(extent.x, "width"), CheckedInt(extent.y, "height")};
        }
    }
    RaiseTypeError("expected a Rect or an (x, y, width, height) tuple, not " + TypeName(value));
}

std::vector<gfx::Vector2> ToPoints(const py::object& value) {
    if (!IsSequence(value)) {
        RaiseTypeError("points must be a list or tuple, not " + TypeName(value));
    }
    std::vector<gfx::Vector2> points;
    const auto size = py::len(value);
    points.reserve(static_cast<std::size_t>(size));
    for (long i = 0; i < size; ++i) {
        points.push_back(ToVector(value[i]));
    }
    return points;
}

// --- Color

int ColorRed(const gfx::Color& color) { return color.r; }
int ColorGreen(const gfx::Color& color) { return color.g; }
int ColorBlue(const gfx::Color& color) { return color.b; }
int ColorAlpha(const gfx::Color& color) { return color.a; }

gfx::Color* ColorFromName(const std::string& name) {
    return new gfx::Color(gfx::Color::FromName(name));
}

bool ColorEquals(const gfx::Color& self, const py::object& other) {
    py::extract<const gfx::Color&> color(other);
    return color.check() && color() == self;
}

int ColorItem(const gfx::Color& color, int index) {
    switch (index < 0 ? index + 4 : index) {
        case 0: return color.r;
        case 1: return color.g;
        case 2: return color.b;
        case 3: return color.a;
        default: throw std::out_of_range("color index out of range");
    }
}

int ColorLength(const gfx::Color&) {
    return 4;
}

// --- Rect

gfx::Rect RectClip(const gfx::Rect& self, const py::object& other) { return self.Clip(ToRect(other)); }
gfx::Rect RectUnion(const gfx::Rect& self, const py::object& other) { return self.Union(ToRect(other)); }
bool RectCollideRect(const gfx::Rect& self, const py::object& other) { return self.CollideRect(ToRect(other)); }
py::tuple RectCenter(const gfx::Rect& rect) { return py::make_tuple(rect.CenterX(), rect.CenterY()); }
py::tuple RectSize(const gfx::Rect& rect) { return py::make_tuple(rect.w, rect.h); }

bool RectEquals(const gfx::Rect& self, const py::object& other) {
    py::extract<const gfx::Rect&> rect(other);
    return rect.check() && rect() == self;
}

bool RectCollidePoint(const gfx::Rect& self, const py::object& point) {
    const gfx::Vector2 position = ToVector(point);
    const double x = std::floor(position.x);
    const double y = std::floor(position.y);
    // No rect reaches a point outside int range; NaN fails both comparisons.
    constexpr double kMin = std::numeric_limits<int>::min();
    constexpr double kMax = std::numeric_limits<int>::max();
    if (!(x >= kMin && x <= kMax && y >= kMin && y <= kMax)) {
        return false;
    }
    return self.CollidePoint(static_cast<int>(x), static_cast<int>(y));
}

// --- Vector2

bool VectorEquals(const gfx::Vector2& self, const py::object& other) {
    py::extract<const gfx::Vector2&> vector(other);
    return vector.check() && vector() == self;
}

double VectorItem(const gfx::Vector2& vector, int index) {
    switch (index < 0 ? index + 2 : index) {
        case 0: return vector.x;
        case 1: return vector.y;
        default: throw std::out_of_range("vector index out of range");
    }
}

int VectorLength(const gfx::Vector2&) {
    return 2;
}

double VectorDot(const gfx::Vector2& self, const py::object& other) { return self.Dot(ToVector(other)); }
double VectorCross(const gfx::Vector2& self, const py::object& other) { return self.Cross(ToVector(other)); }
double VectorDistance(const gfx::Vector2& self, const py::object& other) { return self.DistanceTo(ToVector(other)); }
gfx::Vector2 VectorLerp(const gfx::Vector2& self, const py::object& other, double t) {
    return self.Lerp(ToVector(other), t);
}

// --- Surface

gfx::Surface* MakeSurface(const py::object& size) {
    if (!IsSequence(size) || py::len(size) != 2) {
        RaiseTypeError("Surface expects a (width, height) pair, not " + TypeName(size));
    }
    return new gfx::Surface(ToInt(size[0], "width"), ToInt(size[1], "height"));
}

py::tuple SurfaceSize(const gfx::Surface& surface) {
    return py::make_tuple(surface.Width(), surface.Height());
}

void SurfaceFill(gfx::Surface& surface, const py::object& color, const py::object& area) {
    if (area.is_none()) {
        surface.Fill(ToColor(color));
    } else {
        surface.Fill(ToColor(color), ToRect(area));
    }
}

gfx::Color SurfaceGetAt(const gfx::Surface& surface, const py::object& position) {
    const gfx::Vector2 point = ToVector(position);
    return surface.GetAt(CheckedInt(point.x, "x"), CheckedInt(point.y, "y"));
}

void SurfaceSetAt(gfx::Surface& surface, const py::object& position, const py::object& color) {
    const gfx::Vector2 point = ToVector(position);
    surface.SetAt(CheckedInt(point.x, "x"), CheckedInt(point.y, "y"), ToColor(color));
}

gfx::Rect SurfaceBlit(gfx::Surface& surface, const gfx::Surface& source, const py::object& destination) {
    py::extract<const gfx::Rect&> rect(destination);
    if (rect.check()) {
        return surface.Blit(source, rect().x, rect().y);
    }
    const gfx::Vector2 point = ToVector(destination);
    return surface.Blit(source, CheckedInt(point.x, "x"), CheckedInt(point.y, "y"));
}

gfx::Surface SurfaceCopy(const gfx::Surface& surface) {
    return surface.Copy();
}

std::string SurfaceRepr(const gfx::Surface& surface) {
    return "<Surface(" + std::to_string(surface.Width()) + "x" + std::to_string(surface.Height()) + ")>";
}

// --- draw

gfx::Rect DrawLine(gfx::Surface& surface, const py::object& color, const py::object& start,
                   const py::object& end, int width) {
    return gfx::draw::Line(surface, ToColor(color), ToVector(start), ToVector(end), width);
}

gfx::Rect DrawLines(gfx::Surface& surface, const py::object& color, bool closed,
                    const py::object& points, int width) {
    return gfx::draw::Lines(surface, ToColor(color), closed, ToPoints(points), width);
}

gfx::Rect DrawRect(gfx::Surface& surface, const py::object& color, const py::object& rect, int width) {
    return gfx::draw::Rectangle(surface, ToColor(color), ToRect(rect), width);
}

gfx::Rect DrawCircle(gfx::Surface& surface, const py::object& color, const py::object& center,
                     const py::object& radius, int width) {
    return gfx::draw::Circle(surface, ToColor(color), ToVector(center), ToInt(radius, "radius"), width);
}

gfx::Rect DrawEllipse(gfx::Surface& surface, const py::object& color, const py::object& rect, int width) {
    return gfx::draw::Ellipse(surface, ToColor(color), ToRect(rect), width);
}

gfx::Rect DrawPolygon(gfx::Surface& surface, const py::object& color, const py::object& points, int width) {
    return gfx::draw::Polygon(surface, ToColor(color), ToPoints(points), width);
}

// --- transform

gfx::Surface TransformScale(const gfx::Surface& surface, const py::object& size) {
    if (!IsSequence(size) || py::len(size) != 2) {
        RaiseTypeError("scale expects a (width, height) pair, not " + TypeName(size));
    }
    return gfx::transform::Scale(surface, ToInt(size[0], "width"), ToInt(size[1], "height"));
}

// --- font

gfx::Surface FontRender(const std::string& text, const py::object& color, int scale, const py::object& background) {
    std::optional<gfx::Color> fill;
    if (!background.is_none()) {
        fill = ToColor(background);
    }
    return gfx::font::Render(text, ToColor(color), scale, fill);
}

py::tuple FontSize(const std::string& text, int scale) {
    const auto [width, height] = gfx::font::Size(text, scale);
    return py::make_tuple(width, height);
}

py::object AddSubmodule(const char* name) {
    const std::string qualified = std::string("gfx.") + name;
    py::object module(py::handle<>(py::borrowed(PyImport_AddModule(qualified.c_str()))));
    py::scope().attr(name) = module;
    return module;
}

void RegisterGfx() {
    py::scope().attr("__doc__") = "Software raster graphics: surfaces, colours, shapes and text.";

    py::class_<gfx::Color>("Color", py::init<int, int, int, py::optional<int>>())
        .def("__init__", py::make_constructor(&ColorFromName))
        .add_property("r", &ColorRed)
        .add_property("g", &ColorGreen)
        .add_property("b", &ColorBlue)
        .add_property("a", &ColorAlpha)
        .def("__eq__", &ColorEquals)
        .def("__getitem__", &ColorItem)
        .def("__len__", &ColorLength)
        .def("__repr__", &gfx::Color::Repr);

    py::class_<gfx::Rect>("Rect", py::init<int, int, int, int>(
                              (py::arg("x"), py::arg("y"), py::arg("w"), py::arg("h"))))
        .def_readwrite("x", &gfx::Rect::x)
        .def_readwrite("y", &gfx::Rect::y)
        .def_readwrite("w", &gfx::Rect::w)
        .def_readwrite("h", &gfx::Rect::h)
        .add_property("left", &gfx::Rect::Left)
        .add_property("top", &gfx::Rect::Top)
        .add_property("right", &gfx::Rect::Right)
        .add_property("bottom", &gfx::Rect::Bottom)
        .add_property("centerx", &gfx::Rect::CenterX)
        .add_property("centery", &gfx::Rect::CenterY)
        .add_property("center", &RectCenter)
        .add_property("size", &RectSize)
        .def("move", &gfx::Rect::Move)
        .def("inflate", &gfx::Rect::Inflate)
        .def("normalize", &gfx::Rect::Normalized)
        .def("clip", &RectClip)
        .def("union", &RectUnion)
        .def("collidepoint", &RectCollidePoint)
        .def("colliderect", &RectCollideRect)
        .def("__eq__", &RectEquals)
        .def("__repr__", &gfx::Rect::Repr);

    py::class_<gfx::Vector2>("Vector2", py::init<>())
        .def(py::init<double, double>())
        .def_readwrite("x", &gfx::Vector2::x)
        .def_readwrite("y", &gfx::Vector2::y)
        .def(py::self + py::self)
        .def(py::self - py::self)
        .def(-py::self)
        .def(py::self * double())
        .def(double() * py::self)
        .def(py::self / double())
        .def("dot", &VectorDot)
        .def("cross", &VectorCross)
        .def("length", &gfx::Vector2::Length)
        .def("length_squared", &gfx::Vector2::LengthSquared)
        .def("distance_to", &VectorDistance)
        .def("normalize", &gfx::Vector2::Normalize)
        .def("rotate", &gfx::Vector2::Rotate)
        .def("lerp", &VectorLerp)
        .def("__eq__", &VectorEquals)
        .def("__getitem__", &VectorItem)
        .def("__len__", &VectorLength)
        .def("__repr__", &gfx::Vector2::Repr);

    py::class_<gfx::Surface>("Surface", py::init<int, int>((py::arg("width"), py::arg("height"))))
        .def("__init__", py::make_constructor(&MakeSurface))
        .add_property("width", &gfx::Surface::Width)
        .add_property("height", &gfx::Surface::Height)
        .def("get_width", &gfx::Surface::Width)
        .def("get_height", &gfx::Surface::Height)
        .def("get_size", &SurfaceSize)
        .def("get_rect", &gfx::Surface::GetRect)
        .def("fill", &SurfaceFill, (py::arg("color"), py::arg("rect") = py::object()))
        .def("get_at", &SurfaceGetAt)
        .def("set_at", &SurfaceSetAt)
        .def("blit", &SurfaceBlit)
        .def("copy", &SurfaceCopy)
        .def("__repr__", &SurfaceRepr);

    {
        py::scope draw_scope = AddSubmodule("draw");
        py::def("line", &DrawLine,
                (py::arg("surface"), py::arg("color"), py::arg("start"), py::arg("end"), py::arg("width") = 1));
        py::def("lines", &DrawLines,
                (py::arg("surface"), py::arg("color"), py::arg("closed"), py::arg("points"), py::arg("width") = 1));
        py::def("rect", &DrawRect,
                (py::arg("surface"), py::arg("color"), py::arg("rect"), py::arg("width") = 0));
        py::def("circle", &DrawCircle,
                (py::arg("surface"), py::arg("color"), py::arg("center"), py::arg("radius"), py::arg("width") = 0));
        py::def("ellipse", &DrawEllipse,
                (py::arg("surface"), py::arg("color"), py::arg("rect"), py::arg("width") = 0));
        py::def("polygon", &DrawPolygon,
                (py::arg("surface"), py::arg("color"), py::arg("points"), py::arg("width") = 0));
    }
    {
        py::scope transform_scope = AddSubmodule("transform");
        py::def("flip", &gfx::transform::Flip, (py::arg("surface"), py::arg("flip_x"), py::arg("flip_y")));
        py::def("scale", &TransformScale, (py::arg("surface"), py::arg("size")));
        py::def("rotate", &gfx::transform::Rotate, (py::arg("surface"), py::arg("angle")));
    }
    {
        py::scope font_scope = AddSubmodule("font");
        py::def("render", &FontRender,
                (py::arg("text"), py::arg("color"), py::arg("scale") = 1, py::arg("background") = py::object()));
        py::def("size", &FontSize, (py::arg("text"), py::arg("scale") = 1));
    }
}

}  // namespace

PyTypeObject* SurfaceType() {
    return py::converter::registered<gfx::Surface>::converters.get_class_object();
}

}  // namespace evalbox::worker

BOOST_PYTHON_MODULE(gfx) {
    evalbox::worker::RegisterGfx();
}
