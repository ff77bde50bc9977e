#include <boost/python.hpp>

#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <unistd.h>

#include "sandbox/envelope_codec.hpp"
#include "sandbox/output_envelope.hpp"
#include "sandbox/run_id.hpp"
#include "utils/logging.hpp"
#include "worker/interpreter.hpp"
#include "worker/sanitizer.hpp"
#include "worker/script_runner.hpp"

namespace {

constexpr const char* kTag = "worker";

struct WorkerArgs {
    std::string run_id;
    std::filesystem::path output_dir = ".";
    std::string log_level = "info";
};

std::optional<WorkerArgs> ParseArgs(int argc, char** argv) {
    WorkerArgs args;
    for (int i = 1; i < argc; ++i) {
        const std::string flag = argv[i];
        if (i + 1 >= argc) {
            return std::nullopt;
        }
        const std::string value = argv[++i];
        if (flag == "--run-id") {
            args.run_id = value;
        } else if (flag == "--output-dir") {
            args.output_dir = value;
        } else if (flag == "--log-level") {
            args.log_level = value;
        } else {
            return std::nullopt;
        }
    }
    if (args.run_id.empty()) {
        return std::nullopt;
    }
    return args;
}

bool WriteAll(int fd, const std::string& payload) {
    std::size_t written = 0;
    while (written < payload.size()) {
        const auto count = ::write(fd, payload.data() + written, payload.size() - written);
        if (count < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        written += static_cast<std::size_t>(count);
    }
    return true;
}

std::string PendingPythonError() {
    const auto error = evalbox::worker::ClassifyPendingError();
    return error.message;
}

evalbox::sandbox::OutputEnvelope Execute(const WorkerArgs& args, const std::string& source) {
    using evalbox::sandbox::ErrorKind;
    using evalbox::sandbox::MakeErrorEnvelope;
    if (!evalbox::sandbox::IsValidRunId(args.run_id)) {
        return MakeErrorEnvelope(ErrorKind::InternalError, "invalid run id '" + args.run_id + "'");
    }
    try {
        evalbox::worker::InitializeInterpreter();
        const auto raw = evalbox::worker::RunScript(source);
        return evalbox::worker::Sanitize(*raw, evalbox::worker::MediaTarget{args.output_dir, args.run_id});
    } catch (const boost::python::error_already_set&) {
        return MakeErrorEnvelope(ErrorKind::InternalError, "sandbox setup failed: " + PendingPythonError());
    } catch (const std::exception& ex) {
        return MakeErrorEnvelope(ErrorKind::InternalError, std::string("sandbox setup failed: ") + ex.what());
    }
}

}  // namespace

int main(int argc, char** argv) {
    const auto args = ParseArgs(argc, argv);
    if (!args.has_value()) {
        std::cerr << "Usage: evalbox_worker --run-id <id> [--output-dir <dir>] [--log-level <level>]"
                  << std::endl;
        return 2;
    }
    evalbox::utils::SetLogConfig(evalbox::utils::LogConfig{evalbox::utils::ParseLogLevel(args->log_level)});

    // The real stdout becomes the private result channel; anything the
    // interpreter or a library writes to fd 1 lands on stderr instead.
    const int channel = ::dup(STDOUT_FILENO);
    if (channel < 0 || ::dup2(STDERR_FILENO, STDOUT_FILENO) < 0) {
        evalbox::utils::Log(evalbox::utils::LogLevel::kError, kTag, "failed to set up the result channel");
        return 1;
    }

    const std::string source{std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>()};
    const auto envelope = Execute(*args, source);
    if (evalbox::sandbox::IsInternal(envelope)) {
        evalbox::utils::Log(evalbox::utils::LogLevel::kError, kTag, envelope.error->message,
                            {{"run_id", args->run_id}});
    }

    const bool sent = WriteAll(channel, evalbox::sandbox::EncodeEnvelope(envelope));
    ::close(channel);
    // Skip interpreter finalization and static destructors: nothing the script
    // left behind may run once the result is out.
    std::_Exit(sent ? 0 : 1);
}
