#pragma once

#include <Python.h>

// Module init for the script-facing `gfx` package (draw, transform and font
// are attached as submodules).
extern "C" PyObject* PyInit_gfx();

namespace evalbox::worker {

// The registered gfx.Surface class; only valid once `gfx` has been imported.
PyTypeObject* SurfaceType();

}  // namespace evalbox::worker
