#include "sandbox/sandbox.hpp"

#include <boost/asio/io_context.hpp>
#include <chrono>
#include <exception>
#include <utility>

#include "config/config_loader.hpp"
#include "utils/logging.hpp"

namespace evalbox::sandbox {

namespace {

constexpr const char* kTag = "sandbox";

void LogOutcome(const RunRequest& request, const RunReport& report) {
    std::unordered_map<std::string, std::string> fields{
        {"run_id", request.run_id},
        {"state", ToString(report.state)},
        {"pid", std::to_string(report.worker_pid)},
        {"duration", std::to_string(report.envelope.duration)}
    };
    if (report.envelope.error.has_value()) {
        fields["error"] = ToString(report.envelope.error->kind);
    }
    if (IsInternal(report.envelope)) {
        fields["message"] = report.envelope.error->message;
        utils::Log(utils::LogLevel::kError, kTag, "sandbox failure", std::move(fields));
        return;
    }
    utils::Log(utils::LogLevel::kInfo, kTag, "run finished", std::move(fields));
}

}  // namespace

SupervisorOptions OptionsFromConfig(const config::Config& config) {
    SupervisorOptions options{};
    options.worker_path = ResolveWorkerPath(config.sandbox.worker_path);
    options.work_dir = config.sandbox.work_dir.empty() ? "." : config.sandbox.work_dir;
    if (config.sandbox.poll_interval_ms > 0) {
        options.poll_interval = std::chrono::milliseconds(config.sandbox.poll_interval_ms);
    }
    if (config.sandbox.channel_grace_ms >= 0) {
        options.channel_grace = std::chrono::milliseconds(config.sandbox.channel_grace_ms);
    }
    return options;
}

RunReport RunWithReport(const config::Config& config, RunRequest request) {
    RunReport report{};
    report.state = RunState::Failed;
    try {
        boost::asio::io_context io;
        Supervisor supervisor(io, OptionsFromConfig(config));
        bool done = false;
        supervisor.AsyncRun(request, [&report, &done](RunReport result) {
            report = std::move(result);
            done = true;
        });
        io.run();
        if (!done) {
            report.envelope = MakeErrorEnvelope(
                ErrorKind::InternalError, "supervisor stopped without a result");
        }
    } catch (const std::exception& ex) {
        report.envelope = MakeErrorEnvelope(
            ErrorKind::InternalError, std::string("sandbox failure: ") + ex.what());
        report.state = RunState::Failed;
    }
    LogOutcome(request, report);
    return report;
}

OutputEnvelope Run(const config::Config& config,
                   const std::string& source,
                   const std::string& run_id,
                   double timeout_seconds,
                   std::size_t max_memory_bytes) {
    RunRequest request{};
    request.source = source;
    request.run_id = run_id;
    request.timeout = std::chrono::duration<double>(timeout_seconds);
    request.max_memory = max_memory_bytes;
    return RunWithReport(config, std::move(request)).envelope;
}

OutputEnvelope Run(const config::Config& config,
                   const std::string& source,
                   const std::string& run_id) {
    return Run(config, source, run_id, config.sandbox.timeout_s, config.sandbox.max_memory_bytes);
}

const config::Config& InitHost() {
    static const config::Config config = [] {
        auto loaded = config::LoadConfig();
        utils::SetLogConfig(utils::LogConfig{utils::ParseLogLevel(loaded.logging.level)});
        return loaded;
    }();
    return config;
}

OutputEnvelope Run(const std::string& source,
                   const std::string& run_id,
                   double timeout_seconds,
                   std::size_t max_memory_bytes) {
    return Run(InitHost(), source, run_id, timeout_seconds, max_memory_bytes);
}

}  // namespace evalbox::sandbox
