#pragma once

#include <Python.h>
#include <boost/python/object.hpp>

#include <cstdint>
#include <optional>
#include <vector>

#include "sandbox/output_envelope.hpp"

extern "C" PyObject* PyInit_evalbox_runtime();

namespace evalbox::worker {

// Worker-local result of one run. Scripts see it as `output` and may assign
// anything to its fields; only the sanitizer reads it back.
struct RawResult {
    RawResult();

    boost::python::object text;    // "" initially
    boost::python::object img;     // None: the still image
    boost::python::object frames;  // []: the animation
    boost::python::object delay;   // 200 ms per frame
    boost::python::object loops;   // 0 = repeat forever

    // Appends a copy of `surface` to `frames`; TypeError for anything else.
    // An explicit `delay` (0..65535 ms) applies to that frame only; None
    // leaves it on output.delay.
    void AddFrame(const boost::python::object& surface, const boost::python::object& delay);

    struct FrameDelay {
        boost::python::object frame;  // the copy appended to `frames`
        std::int64_t delay_ms = 0;
    };
    std::vector<FrameDelay> frame_delays;

    std::optional<sandbox::SandboxError> error;
    double duration = -1.0;
};

constexpr long kDefaultDelayMs = 200;

}  // namespace evalbox::worker
