#pragma once

#include <optional>
#include <string>

namespace evalbox::sandbox {

enum class ErrorKind {
    SuspiciousPattern,
    ImportBlocked,
    SyntaxError,
    RuntimeError,
    Timeout,
    MemoryExceeded,
    BadDelay,
    BadLoopCount,
    InternalError
};

const char* ToString(ErrorKind kind);
std::optional<ErrorKind> ErrorKindFromString(const std::string& value);

struct SandboxError {
    ErrorKind kind = ErrorKind::InternalError;
    std::string message;
};

// The only structure that crosses from the worker back into the host.
// Images never travel inside it: has_image / has_animation only announce
// that run-<id>.png / run-<id>.gif were written to the working directory.
struct OutputEnvelope {
    std::string text;
    bool has_image = false;
    bool has_animation = false;
    std::optional<SandboxError> error;
    double duration = -1.0;
};

OutputEnvelope MakeErrorEnvelope(ErrorKind kind, std::string message, double duration = -1.0);

inline bool IsInternal(const OutputEnvelope& envelope) {
    return envelope.error.has_value() && envelope.error->kind == ErrorKind::InternalError;
}

}  // namespace evalbox::sandbox
