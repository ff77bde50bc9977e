#include "worker/raw_result.hpp"

#include <boost/python.hpp>

#include <memory>
#include <stdexcept>
#include <string>

#include "gfx/surface.hpp"
#include "media/animation_params.hpp"
#include "worker/gfx_module.hpp"
#include "worker/raw_value.hpp"

namespace py = boost::python;

namespace evalbox::worker {

namespace {

py::object GetText(const RawResult& raw) { return raw.text; }
void SetText(RawResult& raw, const py::object& value) { raw.text = value; }
py::object GetImg(const RawResult& raw) { return raw.img; }
void SetImg(RawResult& raw, const py::object& value) { raw.img = value; }
py::object GetFrames(const RawResult& raw) { return raw.frames; }
void SetFrames(RawResult& raw, const py::object& value) { raw.frames = value; }
py::object GetDelay(const RawResult& raw) { return raw.delay; }
void SetDelay(RawResult& raw, const py::object& value) { raw.delay = value; }
py::object GetLoops(const RawResult& raw) { return raw.loops; }
void SetLoops(RawResult& raw, const py::object& value) { raw.loops = value; }

[[noreturn]] void Raise(PyObject* type, const std::string& message) {
    PyErr_SetString(type, message.c_str());
    py::throw_error_already_set();
    throw std::logic_error("unreachable");
}

std::int64_t FrameDelayMs(const py::object& delay) {
    const auto number = AsNumber(Classify(delay));
    if (!number.has_value()) {
        if (PyFloat_Check(delay.ptr())) {
            Raise(PyExc_ValueError, "add_frame() delay must be a finite number of milliseconds");
        }
        Raise(PyExc_TypeError,
              std::string("add_frame() delay must be a number, not ") + Py_TYPE(delay.ptr())->tp_name);
    }
    if (*number < 0 || *number > media::kMaxDelayMs) {
        Raise(PyExc_ValueError, "add_frame() delay must be between 0 and " +
                                    std::to_string(media::kMaxDelayMs) + " milliseconds");
    }
    return *number;
}

void RegisterRuntime() {
    py::class_<RawResult, std::shared_ptr<RawResult>, boost::noncopyable>("Output", py::no_init)
        .add_property("text", &GetText, &SetText)
        .add_property("img", &GetImg, &SetImg)
        .add_property("frames", &GetFrames, &SetFrames)
        .add_property("delay", &GetDelay, &SetDelay)
        .add_property("loops", &GetLoops, &SetLoops)
        .def("add_frame", &RawResult::AddFrame, (py::arg("surface"), py::arg("delay") = py::object()));
}

}  // namespace

RawResult::RawResult()
    : text(py::str(""))
    , frames(py::list())
    , delay(kDefaultDelayMs)
    , loops(0) {}

void RawResult::AddFrame(const py::object& surface, const py::object& delay) {
    if (Py_TYPE(surface.ptr()) != SurfaceType()) {
        Raise(PyExc_TypeError,
              std::string("add_frame() expects a gfx.Surface, not ") + Py_TYPE(surface.ptr())->tp_name);
    }
    if (!PyList_Check(frames.ptr())) {
        Raise(PyExc_TypeError, "output.frames must be a list to add frames");
    }
    std::optional<std::int64_t> delay_ms;
    if (!delay.is_none()) {
        delay_ms = FrameDelayMs(delay);
    }
    const gfx::Surface& source = py::extract<const gfx::Surface&>(surface);
    py::object copy(source.Copy());
    frames.attr("append")(copy);
    if (delay_ms.has_value()) {
        frame_delays.push_back(FrameDelay{copy, *delay_ms});
    }
}

}  // namespace evalbox::worker

BOOST_PYTHON_MODULE(evalbox_runtime) {
    evalbox::worker::RegisterRuntime();
}
