#include "worker/interpreter.hpp"

#include <Python.h>

#include <stdexcept>
#include <string>

#include "worker/gfx_module.hpp"
#include "worker/raw_result.hpp"

namespace evalbox::worker {

void InitializeInterpreter() {
    if (Py_IsInitialized()) {
        return;
    }
    if (PyImport_AppendInittab("gfx", &PyInit_gfx) == -1 ||
        PyImport_AppendInittab("evalbox_runtime", &PyInit_evalbox_runtime) == -1) {
        throw std::runtime_error("failed to register built-in modules");
    }

    PyConfig config;
    PyConfig_InitIsolatedConfig(&config);
    config.site_import = 0;
    config.install_signal_handlers = 0;
    config.write_bytecode = 0;
    config.user_site_directory = 0;
    config.buffered_stdio = 0;
    const PyStatus status = Py_InitializeFromConfig(&config);
    PyConfig_Clear(&config);
    if (PyStatus_Exception(status)) {
        throw std::runtime_error(std::string("failed to start the interpreter: ") +
                                 (status.err_msg != nullptr ? status.err_msg : "unknown error"));
    }
    // Registers the Output and gfx classes with Boost.Python before any
    // result object has to cross into the interpreter.
    for (const char* name : {"evalbox_runtime", "gfx"}) {
        PyObject* module = PyImport_ImportModule(name);
        if (module == nullptr) {
            PyErr_Clear();
            throw std::runtime_error(std::string("failed to import built-in module ") + name);
        }
        Py_DECREF(module);
    }
}

}  // namespace evalbox::worker
