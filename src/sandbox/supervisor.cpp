#include "sandbox/supervisor.hpp"

#include <boost/version.hpp>
#if BOOST_VERSION >= 108600
#include <boost/process/v1.hpp>
#include <boost/process/v1/extend.hpp>
#else
#include <boost/process.hpp>
#include <boost/process/extend.hpp>
#endif

#include <boost/asio/post.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/write.hpp>

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <optional>
#include <signal.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <string>
#include <utility>
#include <vector>

#include "sandbox/envelope_codec.hpp"
#include "sandbox/precheck.hpp"
#include "sandbox/process_probe.hpp"
#include "sandbox/run_id.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace evalbox::sandbox {
#if BOOST_VERSION >= 108600
namespace bp = boost::process::v1;
#else
namespace bp = boost::process;
#endif

namespace {

constexpr const char* kTag = "supervisor";
constexpr const char* kWorkerName = "evalbox_worker";

using Clock = std::chrono::steady_clock;

void IgnoreSigpipe() {
    // A worker that dies before draining stdin must not take the host down with it.
    static std::once_flag once;
    std::call_once(once, [] {
        struct sigaction action {};
        action.sa_handler = SIG_IGN;
        sigemptyset(&action.sa_mask);
        action.sa_flags = 0;
        sigaction(SIGPIPE, &action, nullptr);
    });
}

bp::environment BuildWorkerEnvironment() {
    bp::environment env;
    env["PATH"] = "/usr/local/bin:/usr/bin:/bin";
    const char* kPassthroughVars[] = {
        "LANG",
        "LC_ALL",
        "TZ"
    };
    for (const auto* key : kPassthroughVars) {
        if (const char* value = std::getenv(key)) {
            env[key] = value;
        }
    }
    return env;
}

std::string DescribeStatus(int native_status) {
    if (WIFEXITED(native_status)) {
        return "exit code " + std::to_string(WEXITSTATUS(native_status));
    }
    if (WIFSIGNALED(native_status)) {
        return "signal " + std::to_string(WTERMSIG(native_status));
    }
    return "status " + std::to_string(native_status);
}

class RunSession : public std::enable_shared_from_this<RunSession> {
public:
    RunSession(boost::asio::io_context& io,
               const SupervisorOptions& options,
               RunRequest request,
               Supervisor::CompletionHandler handler)
        : io_(io)
        , options_(options)
        , request_(std::move(request))
        , handler_(std::move(handler))
        , timer_(io)
        , stdin_pipe_(io)
        , stdout_pipe_(io) {}

    void Start() {
        if (!IsValidRunId(request_.run_id)) {
            Finish(RunState::Failed, MakeErrorEnvelope(
                ErrorKind::InternalError,
                "invalid run id '" + request_.run_id + "'"));
            return;
        }
        const double timeout = request_.timeout.count();
        if (!std::isfinite(timeout) || timeout < 0.0) {
            Finish(RunState::Failed, MakeErrorEnvelope(
                ErrorKind::InternalError,
                "invalid timeout " + std::to_string(timeout) + ", expected a finite number of seconds >= 0"));
            return;
        }
        const auto precheck = Precheck(request_.source);
        if (!precheck.passed) {
            utils::Log(utils::LogLevel::kInfo, kTag, "script rejected before spawn",
                       {{"run_id", request_.run_id}, {"token", precheck.matched}});
            Finish(RunState::Completed, MakeErrorEnvelope(
                ErrorKind::SuspiciousPattern,
                DescribeSuspiciousPattern(precheck)));
            return;
        }
        if (!Spawn()) {
            return;
        }
        WriteSource();
        ReadChannel();
        SchedulePoll();
    }

private:
    bool Spawn() {
        std::error_code fs_ec;
        auto work_dir = std::filesystem::absolute(options_.work_dir, fs_ec);
        if (fs_ec) {
            work_dir = options_.work_dir;
        }
        try {
            child_ = bp::child(
                bp::exe = options_.worker_path.string(),
                bp::args = std::vector<std::string>{
                    "--run-id", request_.run_id,
                    "--output-dir", work_dir.string(),
                    "--log-level", utils::ToLower(utils::ToString(utils::GetLogConfig().min_level))},
                BuildWorkerEnvironment(),
                bp::start_dir = work_dir.string(),
                bp::std_in < stdin_pipe_,
                bp::std_out > stdout_pipe_,
                bp::extend::on_exec_setup = [](auto&) {
                    // Runs in the forked child: die with the host, never dump core.
                    ::prctl(PR_SET_PDEATHSIG, SIGKILL);
                    struct rlimit no_core {};
                    ::setrlimit(RLIMIT_CORE, &no_core);
                });
        } catch (const bp::process_error& ex) {
            Finish(RunState::Failed, MakeErrorEnvelope(
                ErrorKind::InternalError,
                std::string("failed to spawn worker: ") + ex.what()));
            return false;
        }
        pid_ = child_.id();
        spawned_at_ = Clock::now();
        state_ = RunState::Spawned;
        utils::Log(utils::LogLevel::kDebug, kTag, "worker spawned",
                   {{"run_id", request_.run_id}, {"pid", std::to_string(pid_)}});
        return true;
    }

    void WriteSource() {
        auto self = shared_from_this();
        boost::asio::async_write(
            stdin_pipe_,
            boost::asio::buffer(request_.source),
            [self](const boost::system::error_code& ec, std::size_t) {
                if (ec && !self->finished_) {
                    utils::Log(utils::LogLevel::kWarn, kTag, "failed to send script to worker",
                               {{"run_id", self->request_.run_id}, {"error", ec.message()}});
                }
                boost::system::error_code close_ec;
                self->stdin_pipe_.close(close_ec);
            });
    }

    void ReadChannel() {
        auto self = shared_from_this();
        boost::asio::async_read(
            stdout_pipe_,
            boost::asio::dynamic_buffer(channel_data_),
            [self](const boost::system::error_code& ec, std::size_t) {
                if (ec && ec != boost::asio::error::eof && !self->finished_) {
                    self->channel_error_ = ec.message();
                }
                self->channel_closed_ = true;
            });
    }

    void SchedulePoll() {
        auto self = shared_from_this();
        timer_.expires_after(options_.poll_interval);
        timer_.async_wait([self](const boost::system::error_code& ec) {
            if (ec) {
                return;
            }
            self->Poll();
        });
    }

    void Poll() {
        if (finished_) {
            return;
        }
        state_ = RunState::Running;
        const auto now = Clock::now();

        if (!exited_at_.has_value()) {
            if (now - spawned_at_ > request_.timeout) {
                KillWorker();
                OutputEnvelope envelope = MakeErrorEnvelope(
                    ErrorKind::Timeout,
                    "Script exceeded the time limit of " +
                        utils::FormatSeconds(request_.timeout.count()) + " seconds.",
                    request_.timeout.count());
                Finish(RunState::TimedOut, std::move(envelope));
                return;
            }

            // No sample means the process is already gone; fall through to the
            // liveness check and read whatever the worker left on the channel.
            const auto resident = ReadResidentBytes(pid_);
            if (resident.has_value() && *resident > request_.max_memory) {
                KillWorker();
                Finish(RunState::MemoryExceeded, MakeErrorEnvelope(
                    ErrorKind::MemoryExceeded,
                    "Script exceeded the memory limit of " +
                        std::to_string(request_.max_memory) + " bytes."));
                return;
            }

            std::error_code ec;
            if (!child_.running(ec)) {
                exited_at_ = now;
                exit_description_ = ec ? "unknown status (" + ec.message() + ")"
                                       : DescribeStatus(child_.native_exit_code());
            }
        }

        if (exited_at_.has_value()) {
            if (channel_closed_) {
                FinishFromChannel();
                return;
            }
            if (now - *exited_at_ > options_.channel_grace) {
                Finish(RunState::Failed, MakeErrorEnvelope(
                    ErrorKind::InternalError,
                    "worker exited (" + exit_description_ + ") without closing its result channel"));
                return;
            }
        }
        SchedulePoll();
    }

    void FinishFromChannel() {
        if (!channel_error_.empty()) {
            Finish(RunState::Failed, MakeErrorEnvelope(
                ErrorKind::InternalError,
                "failed to read worker result (" + channel_error_ + "), worker " + exit_description_));
            return;
        }
        OutputEnvelope envelope = DecodeEnvelope(channel_data_);
        if (IsInternal(envelope)) {
            envelope.error->message += " (worker " + exit_description_ + ")";
            Finish(RunState::Failed, std::move(envelope));
            return;
        }
        Finish(RunState::Completed, std::move(envelope));
    }

    void KillWorker() {
        std::error_code ec;
        child_.terminate(ec);
        if (ec) {
            utils::Log(utils::LogLevel::kWarn, kTag, "failed to kill worker",
                       {{"run_id", request_.run_id}, {"pid", std::to_string(pid_)},
                        {"error", ec.message()}});
            return;
        }
        // terminate() only reaps with WNOHANG; SIGKILL cannot be ignored, so a
        // blocking wait here is short and leaves no zombie behind.
        if (pid_ > 0) {
            int status = 0;
            while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
            }
        }
    }

    void Finish(RunState state, OutputEnvelope envelope) {
        if (finished_) {
            return;
        }
        finished_ = true;
        utils::Log(utils::LogLevel::kDebug, kTag, "run state changed",
                   {{"run_id", request_.run_id}, {"from", ToString(state_)}, {"to", ToString(state)}});
        state_ = state;
        timer_.cancel();
        boost::system::error_code ec;
        stdin_pipe_.close(ec);
        stdout_pipe_.close(ec);

        RunReport report{};
        report.envelope = std::move(envelope);
        report.state = state;
        report.worker_pid = pid_;

        auto handler = std::move(handler_);
        handler_ = nullptr;
        if (handler) {
            boost::asio::post(io_, [handler, report]() { handler(report); });
        }
    }

    boost::asio::io_context& io_;
    SupervisorOptions options_;
    RunRequest request_;
    Supervisor::CompletionHandler handler_;
    boost::asio::steady_timer timer_;
    bp::async_pipe stdin_pipe_;
    bp::async_pipe stdout_pipe_;
    bp::child child_;
    int pid_ = -1;
    RunState state_ = RunState::Spawned;
    Clock::time_point spawned_at_{};
    std::optional<Clock::time_point> exited_at_;
    std::string exit_description_ = "still running";
    std::string channel_data_;
    std::string channel_error_;
    bool channel_closed_ = false;
    bool finished_ = false;
};

}  // namespace

const char* ToString(RunState state) {
    switch (state) {
        case RunState::Spawned: return "Spawned";
        case RunState::Running: return "Running";
        case RunState::Completed: return "Completed";
        case RunState::TimedOut: return "TimedOut";
        case RunState::MemoryExceeded: return "MemoryExceeded";
        case RunState::Failed: return "Failed";
    }
    return "Failed";
}

Supervisor::Supervisor(boost::asio::io_context& io, SupervisorOptions options)
    : io_(io)
    , options_(std::move(options)) {
    IgnoreSigpipe();
}

void Supervisor::AsyncRun(RunRequest request, CompletionHandler handler) {
    std::shared_ptr<RunSession> session;
    try {
        session = std::make_shared<RunSession>(io_, options_, std::move(request), handler);
    } catch (const boost::system::system_error& ex) {
        RunReport report{};
        report.envelope = MakeErrorEnvelope(
            ErrorKind::InternalError,
            std::string("failed to set up worker channel: ") + ex.what());
        report.state = RunState::Failed;
        boost::asio::post(io_, [handler, report]() { handler(report); });
        return;
    }
    session->Start();
}

std::filesystem::path ResolveWorkerPath(const std::string& configured) {
    if (!configured.empty()) {
        return configured;
    }
    std::error_code ec;
    const auto self_exe = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (!ec) {
        const auto sibling = self_exe.parent_path() / kWorkerName;
        if (std::filesystem::exists(sibling, ec)) {
            return sibling;
        }
    }
    const auto found = bp::search_path(kWorkerName);
    if (!found.empty()) {
        return found.string();
    }
    return kWorkerName;
}

}  // namespace evalbox::sandbox
