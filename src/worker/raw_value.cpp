#include "worker/raw_value.hpp"

#include <boost/python.hpp>

#include <cmath>
#include <limits>

#include "worker/gfx_module.hpp"

namespace py = boost::python;

namespace evalbox::worker {

namespace {

constexpr std::int64_t kMax = std::numeric_limits<std::int64_t>::max();
constexpr std::int64_t kMin = std::numeric_limits<std::int64_t>::min();

std::optional<std::int64_t> SaturatingLong(PyObject* value) {
    int overflow = 0;
    const long long result = PyLong_AsLongLongAndOverflow(value, &overflow);
    if (overflow > 0) {
        return kMax;
    }
    if (overflow < 0) {
        return kMin;
    }
    if (result == -1 && PyErr_Occurred()) {
        PyErr_Clear();
        return std::nullopt;
    }
    return static_cast<std::int64_t>(result);
}

std::optional<std::int64_t> SaturatingFloat(double value) {
    if (std::isnan(value)) {
        return std::nullopt;
    }
    const double truncated = std::trunc(value);
    if (truncated >= 9.2233720368547758e18) {
        return kMax;
    }
    if (truncated <= -9.2233720368547758e18) {
        return kMin;
    }
    return static_cast<std::int64_t>(truncated);
}

SurfaceRef MakeSurfaceRef(const py::object& value) {
    SurfaceRef ref;
    ref.owner = value;
    ref.surface = &static_cast<const gfx::Surface&>(py::extract<const gfx::Surface&>(value));
    return ref;
}

}  // namespace

bool IsSurface(PyObject* value) {
    return Py_TYPE(value) == SurfaceType();
}

std::optional<std::string> EncodeUtf8(PyObject* value) {
    if (!PyUnicode_Check(value)) {
        return std::nullopt;
    }
    py::handle<> bytes(py::allow_null(PyUnicode_AsEncodedString(value, "utf-8", "replace")));
    if (!bytes) {
        PyErr_Clear();
        return std::nullopt;
    }
    return std::string(PyBytes_AS_STRING(bytes.get()), static_cast<std::size_t>(PyBytes_GET_SIZE(bytes.get())));
}

RawValue Classify(const py::object& value) {
    PyObject* raw = value.ptr();
    if (PyUnicode_CheckExact(raw)) {
        auto text = EncodeUtf8(raw);
        if (!text.has_value()) {
            return Unrecognized{};
        }
        return Text{std::move(*text)};
    }
    if (PyBool_Check(raw)) {
        return Number{raw == Py_True ? 1 : 0};
    }
    if (PyLong_CheckExact(raw)) {
        const auto number = SaturatingLong(raw);
        return number.has_value() ? RawValue(Number{*number}) : RawValue(Unrecognized{});
    }
    if (PyFloat_CheckExact(raw)) {
        const auto number = SaturatingFloat(PyFloat_AS_DOUBLE(raw));
        return number.has_value() ? RawValue(Number{*number}) : RawValue(Unrecognized{});
    }
    if (IsSurface(raw)) {
        return MakeSurfaceRef(value);
    }
    if (PyList_CheckExact(raw) || PyTuple_CheckExact(raw)) {
        SurfaceSequence sequence;
        // Snapshot first: the list must not change size while we walk it.
        const py::tuple items(value);
        const auto size = py::len(items);
        for (long i = 0; i < size; ++i) {
            py::object item = items[i];
            if (IsSurface(item.ptr())) {
                sequence.surfaces.push_back(MakeSurfaceRef(item));
            }
        }
        return sequence;
    }
    return Unrecognized{};
}

std::optional<std::int64_t> AsNumber(const RawValue& value) {
    if (const auto* number = std::get_if<Number>(&value)) {
        return number->value;
    }
    return std::nullopt;
}

}  // namespace evalbox::worker
