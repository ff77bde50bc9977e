#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>

#include <boost/asio/io_context.hpp>

#include "sandbox/output_envelope.hpp"

namespace evalbox::sandbox {

// Spawned -> Running -> {Completed, TimedOut, MemoryExceeded}; Failed marks an
// engine-side defect (spawn failure, missing or undecodable result).
enum class RunState {
    Spawned,
    Running,
    Completed,
    TimedOut,
    MemoryExceeded,
    Failed
};

const char* ToString(RunState state);

struct RunRequest {
    std::string source;
    std::string run_id;
    std::chrono::duration<double> timeout{5.0};
    std::size_t max_memory = std::size_t{1} << 28;
};

struct RunReport {
    OutputEnvelope envelope;
    RunState state = RunState::Failed;
    int worker_pid = -1;
};

struct SupervisorOptions {
    std::filesystem::path worker_path;
    std::filesystem::path work_dir = ".";
    std::chrono::milliseconds poll_interval{50};
    std::chrono::milliseconds channel_grace{1000};
};

class Supervisor {
public:
    using CompletionHandler = std::function<void(RunReport)>;

    Supervisor(boost::asio::io_context& io, SupervisorOptions options);

    // Never blocks: the worker is polled from a timer on `io`, and `handler`
    // is posted to `io` exactly once.
    void AsyncRun(RunRequest request, CompletionHandler handler);

    const SupervisorOptions& Options() const { return options_; }

private:
    boost::asio::io_context& io_;
    SupervisorOptions options_;
};

// Empty `configured` means "evalbox_worker next to this executable, else on PATH".
std::filesystem::path ResolveWorkerPath(const std::string& configured);

}  // namespace evalbox::sandbox
