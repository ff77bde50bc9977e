#include "sandbox/output_envelope.hpp"

#include <utility>

namespace evalbox::sandbox {

const char* ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::SuspiciousPattern: return "SuspiciousPattern";
        case ErrorKind::ImportBlocked: return "ImportBlocked";
        case ErrorKind::SyntaxError: return "SyntaxError";
        case ErrorKind::RuntimeError: return "RuntimeError";
        case ErrorKind::Timeout: return "Timeout";
        case ErrorKind::MemoryExceeded: return "MemoryExceeded";
        case ErrorKind::BadDelay: return "BadDelay";
        case ErrorKind::BadLoopCount: return "BadLoopCount";
        case ErrorKind::InternalError: return "InternalError";
    }
    return "InternalError";
}

std::optional<ErrorKind> ErrorKindFromString(const std::string& value) {
    static const ErrorKind kKinds[] = {
        ErrorKind::SuspiciousPattern,
        ErrorKind::ImportBlocked,
        ErrorKind::SyntaxError,
        ErrorKind::RuntimeError,
        ErrorKind::Timeout,
        ErrorKind::MemoryExceeded,
        ErrorKind::BadDelay,
        ErrorKind::BadLoopCount,
        ErrorKind::InternalError
    };
    for (const auto kind : kKinds) {
        if (value == ToString(kind)) {
            return kind;
        }
    }
    return std::nullopt;
}

OutputEnvelope MakeErrorEnvelope(ErrorKind kind, std::string message, double duration) {
    OutputEnvelope envelope{};
    envelope.error = SandboxError{kind, std::move(message)};
    envelope.duration = duration;
    return envelope;
}

}  // namespace evalbox::sandbox
