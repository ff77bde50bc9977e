#pragma once

#include <Python.h>
#include <boost/python/object.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "gfx/surface.hpp"

namespace evalbox::worker {

struct Unrecognized {};

struct Text {
    std::string value;
};

struct Number {
    std::int64_t value = 0;
};

// Keeps the owning Python object alive alongside the borrowed surface.
struct SurfaceRef {
    boost::python::object owner;
    const gfx::Surface* surface = nullptr;
};

struct SurfaceSequence {
    std::vector<SurfaceRef> surfaces;
};

// The closed set of shapes a raw field may take when it is read back out of
// the script's reach. Everything else is Unrecognized and never transported.
using RawValue = std::variant<Unrecognized, Text, Number, SurfaceRef, SurfaceSequence>;

// Exact-type classification: str -> Text; int, bool, float -> Number (int()
// truncation, saturating at the int64 range, NaN unrecognized); gfx.Surface ->
// SurfaceRef; list or tuple -> SurfaceSequence of its surface elements.
RawValue Classify(const boost::python::object& value);

std::optional<std::int64_t> AsNumber(const RawValue& value);

// UTF-8 bytes of a str, replacing what cannot be encoded; nullopt for non-str.
std::optional<std::string> EncodeUtf8(PyObject* value);

bool IsSurface(PyObject* value);

}  // namespace evalbox::worker
