#include "worker/capability_surface.hpp"

#include <boost/python.hpp>
#include <boost/python/raw_function.hpp>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace py = boost::python;

namespace evalbox::worker {

namespace {

constexpr const char* kGfxModule = "gfx";

bool IsPublic(const std::string& name) {
    return !name.empty() && name.front() != '_';
}

[[noreturn]] void RaiseTypeError(const std::string& message) {
    PyErr_SetString(PyExc_TypeError, message.c_str());
    py::throw_error_already_set();
    throw std::logic_error("unreachable");
}

// Resolves sep / end: None means the default, anything but str is rejected.
py::object TextArgument(const py::dict& kwargs, const char* name, const char* fallback) {
    if (!kwargs.has_key(name)) {
        return py::str(fallback);
    }
    py::object value = kwargs[name];
    if (value.is_none()) {
        return py::str(fallback);
    }
    if (!PyUnicode_Check(value.ptr())) {
        RaiseTypeError(std::string(name) + " must be None or a string, not " + Py_TYPE(value.ptr())->tp_name);
    }
    return value;
}

class PrintFunction {
public:
    explicit PrintFunction(py::object output) : output_(std::move(output)) {}

    py::object operator()(const py::tuple& args, const py::dict& kwargs) {
        const py::list keys = kwargs.keys();
        for (long i = 0; i < py::len(keys); ++i) {
            const std::string key = py::extract<std::string>(keys[i]);
            if (key != "sep" && key != "end" && key != "flush") {
                RaiseTypeError("print() got an unexpected keyword argument '" + key + "'");
            }
        }
        const py::object sep = TextArgument(kwargs, "sep", " ");
        const py::object end = TextArgument(kwargs, "end", "\n");

        py::list parts;
        for (long i = 0; i < py::len(args); ++i) {
            parts.append(py::str(args[i]));
        }
        py::object line = sep.attr("join")(parts) + end;

        py::object current = output_.attr("text");
        if (!PyUnicode_Check(current.ptr())) {
            current = py::str(current);
        }
        output_.attr("text") = current + line;
        return py::object();
    }

private:
    py::object output_;
};

py::dict ModuleDict(const py::object& module) {
    return py::extract<py::dict>(module.attr("__dict__"));
}

py::dict CopyDict(const py::dict& source) {
    py::dict copy;
    copy.update(source);
    return copy;
}

py::object NewModule(const std::string& name) {
    py::object module(py::handle<>(PyModule_New(name.c_str())));
    py::dict namespace_dict = ModuleDict(module);
    // PyModule_New seeds import metadata; a proxy carries none of it.
    for (const char* key : {"__loader__", "__spec__", "__package__"}) {
        if (namespace_dict.has_key(key)) {
            py::delitem(namespace_dict, py::str(key));
        }
    }
    return module;
}

}  // namespace

const std::vector<std::string>& CapabilitySurface::RemovedBuiltins() {
    static const std::vector<std::string> kRemoved = {
        "getattr", "setattr", "delattr", "globals", "locals", "vars",
        "__import__", "exec", "eval", "compile", "open",
        "input", "exit", "quit", "help", "print",
        "breakpoint", "copyright", "credits", "license", "type",
        "__loader__", "__spec__", "__debug__"
    };
    return kRemoved;
}

const std::vector<std::string>& CapabilitySurface::ModuleNames() {
    static const std::vector<std::string> kModules = {
        "math", "cmath", "random", "re", "time", "string", "itertools", kGfxModule
    };
    return kModules;
}

const std::vector<std::string>& CapabilitySurface::HiddenAttributes() {
    // Formatter.get_field resolves dotted field names the way getattr does.
    static const std::vector<std::string> kHidden = {
        "string.Formatter"
    };
    return kHidden;
}

bool CapabilitySurface::IsHidden(const std::string& module, const std::string& attribute) {
    const std::string qualified = module + "." + attribute;
    return std::find(HiddenAttributes().begin(), HiddenAttributes().end(), qualified) != HiddenAttributes().end();
}

const CapabilitySurface& CapabilitySurface::Instance() {
    static const CapabilitySurface instance;
    return instance;
}

CapabilitySurface::CapabilitySurface() {
    py::object builtins_module = py::import("builtins");
    builtins_ = ModuleDict(builtins_module).copy();
    for (const auto& name : RemovedBuiltins()) {
        if (builtins_.has_key(name)) {
            py::delitem(builtins_, py::str(name));
        }
    }
    for (const auto& name : ModuleNames()) {
        modules_.push_back(Snapshot(name, py::import(name.c_str()), name == kGfxModule));
    }
}

CapabilitySurface::ModuleTemplate CapabilitySurface::Snapshot(const std::string& name,
                                                              const py::object& module,
                                                              bool keep_submodules) {
    ModuleTemplate snapshot;
    snapshot.name = name;
    const py::list items = ModuleDict(module).items();
    for (long i = 0; i < py::len(items); ++i) {
        const py::object key = items[i][0];
        const py::object value = items[i][1];
        py::extract<std::string> key_text(key);
        if (!key_text.check() || !IsPublic(key_text()) || IsHidden(name, key_text())) {
            continue;
        }
        if (PyModule_Check(value.ptr())) {
            if (keep_submodules) {
                snapshot.children.push_back(Snapshot(key_text(), value, true));
            }
            continue;
        }
        snapshot.attributes[key] = value;
    }
    return snapshot;
}

py::object CapabilitySurface::MakeProxy(const ModuleTemplate& module, const std::string& qualified_name) {
    py::object proxy = NewModule(qualified_name);
    py::dict namespace_dict = ModuleDict(proxy);
    namespace_dict.update(module.attributes);
    for (const auto& child : module.children) {
        namespace_dict[child.name] = MakeProxy(child, qualified_name + "." + child.name);
    }
    return proxy;
}

py::dict CapabilitySurface::NewNamespace(const py::object& output) const {
    py::dict globals;
    globals["__builtins__"] = CopyDict(builtins_);
    globals["__name__"] = "__main__";
    for (const auto& module : modules_) {
        globals[module.name] = MakeProxy(module, module.name);
    }
    globals["print"] = MakePrintFunction(output);
    globals["output"] = output;
    return globals;
}

py::object MakePrintFunction(const py::object& output) {
    return py::raw_function(PrintFunction(output));
}

}  // namespace evalbox::worker
