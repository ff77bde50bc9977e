#include "worker/script_runner.hpp"

#include <boost/python.hpp>

#include <chrono>
#include <optional>

#include "sandbox/precheck.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"
#include "worker/capability_surface.hpp"
#include "worker/raw_value.hpp"

namespace py = boost::python;

namespace evalbox::worker {

namespace {

constexpr const char* kTag = "worker";

std::optional<long> IntAttribute(PyObject* object, const char* name) {
    py::handle<> value(py::allow_null(PyObject_GetAttrString(object, name)));
    if (!value) {
        PyErr_Clear();
        return std::nullopt;
    }
    if (!PyLong_Check(value.get())) {
        return std::nullopt;
    }
    const long result = PyLong_AsLong(value.get());
    if (result == -1 && PyErr_Occurred()) {
        PyErr_Clear();
        return std::nullopt;
    }
    return result;
}

std::optional<std::string> TextAttribute(PyObject* object, const char* name) {
    py::handle<> value(py::allow_null(PyObject_GetAttrString(object, name)));
    if (!value) {
        PyErr_Clear();
        return std::nullopt;
    }
    return EncodeUtf8(value.get());
}

std::string TypeName(PyObject* type) {
    return reinterpret_cast<PyTypeObject*>(type)->tp_name;
}

std::string FormatSyntaxError(PyObject* type, PyObject* value) {
    std::string message = TypeName(type);
    const auto lineno = IntAttribute(value, "lineno");
    if (lineno.has_value()) {
        message += " at line " + std::to_string(*lineno);
    }
    const auto description = TextAttribute(value, "msg");
    if (description.has_value()) {
        message += ": " + *description;
    }
    const auto text = TextAttribute(value, "text");
    if (text.has_value() && !utils::TrimRight(*text).empty()) {
        message += "\n" + utils::TrimRight(*text);
        const auto offset = IntAttribute(value, "offset");
        const long column = offset.has_value() && *offset > 0 ? *offset - 1 : 0;
        message += "\n" + std::string(static_cast<std::size_t>(column), ' ') + "^";
    }
    return message;
}

// Line of the innermost traceback entry whose code was compiled from the script.
std::optional<long> ScriptLine(PyObject* traceback) {
    std::optional<long> line;
    py::handle<> entry(py::allow_null(py::xincref(traceback)));
    while (entry && entry.get() != Py_None) {
        py::handle<> frame(py::allow_null(PyObject_GetAttrString(entry.get(), "tb_frame")));
        py::handle<> code(py::allow_null(frame ? PyObject_GetAttrString(frame.get(), "f_code") : nullptr));
        if (!code) {
            PyErr_Clear();
            break;
        }
        const auto filename = TextAttribute(code.get(), "co_filename");
        if (filename.has_value() && *filename == kScriptFilename) {
            const auto entry_line = IntAttribute(entry.get(), "tb_lineno");
            if (entry_line.has_value()) {
                line = entry_line;
            }
        }
        py::handle<> next(py::allow_null(PyObject_GetAttrString(entry.get(), "tb_next")));
        if (!next) {
            PyErr_Clear();
            break;
        }
        entry = next;
    }
    return line;
}

// str(args[0]), or nullopt when the exception carries no arguments.
std::optional<std::string> FirstArgument(PyObject* value) {
    py::handle<> args(py::allow_null(PyObject_GetAttrString(value, "args")));
    if (!args) {
        PyErr_Clear();
        return std::nullopt;
    }
    if (!PyTuple_Check(args.get()) || PyTuple_GET_SIZE(args.get()) == 0) {
        return std::nullopt;
    }
    py::handle<> text(py::allow_null(PyObject_Str(PyTuple_GET_ITEM(args.get(), 0))));
    if (!text) {
        PyErr_Clear();
        return std::string("<unprintable>");
    }
    return EncodeUtf8(text.get()).value_or("<unprintable>");
}

std::string FormatRuntimeError(PyObject* type, PyObject* value, PyObject* traceback) {
    std::string message = TypeName(type);
    const auto line = ScriptLine(traceback);
    if (line.has_value()) {
        message += " at line " + std::to_string(*line);
    }
    if (value != nullptr) {
        const auto argument = FirstArgument(value);
        if (argument.has_value()) {
            message += ": " + *argument;
        }
    }
    return message;
}

}  // namespace

std::string ImportBlockedMessage() {
    return "Imports are not supported here. These modules are already available without importing: " +
           utils::Join(CapabilitySurface::ModuleNames(), ", ") + ".";
}

sandbox::SandboxError ClassifyPendingError() {
    PyObject* type = nullptr;
    PyObject* value = nullptr;
    PyObject* traceback = nullptr;
    PyErr_Fetch(&type, &value, &traceback);
    if (type == nullptr) {
        return {sandbox::ErrorKind::InternalError, "error classification without a pending exception"};
    }
    PyErr_NormalizeException(&type, &value, &traceback);
    py::handle<> type_handle(type);
    py::handle<> value_handle(py::allow_null(value));
    py::handle<> traceback_handle(py::allow_null(traceback));

    sandbox::SandboxError error;
    if (PyErr_GivenExceptionMatches(type, PyExc_ImportError)) {
        error.kind = sandbox::ErrorKind::ImportBlocked;
        error.message = ImportBlockedMessage();
    } else if (PyErr_GivenExceptionMatches(type, PyExc_SyntaxError) && value != nullptr) {
        error.kind = sandbox::ErrorKind::SyntaxError;
        error.message = FormatSyntaxError(type, value);
    } else {
        error.kind = sandbox::ErrorKind::RuntimeError;
        error.message = FormatRuntimeError(type, value, traceback);
    }
    PyErr_Clear();
    return error;
}

std::shared_ptr<RawResult> RunScript(const std::string& source) {
    auto raw = std::make_shared<RawResult>();
    const auto precheck = sandbox::Precheck(source);
    if (!precheck.passed) {
        raw->error = sandbox::SandboxError{sandbox::ErrorKind::SuspiciousPattern,
                                           sandbox::DescribeSuspiciousPattern(precheck)};
        return raw;
    }

    if (source.find('\0') != std::string::npos) {
        raw->error = sandbox::SandboxError{sandbox::ErrorKind::SyntaxError,
                                           "SyntaxError: source code cannot contain null bytes"};
        return raw;
    }

    py::object output(raw);
    py::dict globals = CapabilitySurface::Instance().NewNamespace(output);

    const auto start = std::chrono::steady_clock::now();
    py::handle<> code(py::allow_null(
        Py_CompileStringExFlags(source.c_str(), kScriptFilename, Py_file_input, nullptr, -1)));
    bool failed = !code;
    if (code) {
        py::handle<> result(py::allow_null(PyEval_EvalCode(code.get(), globals.ptr(), globals.ptr())));
        failed = !result;
    }
    raw->duration = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    if (failed) {
        raw->error = ClassifyPendingError();
        utils::Log(utils::LogLevel::kDebug, kTag, "script raised",
                   {{"kind", sandbox::ToString(raw->error->kind)}});
    }
    return raw;
}

}  // namespace evalbox::worker
