#include "sandbox/run_id.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>

namespace evalbox::sandbox {
namespace {

constexpr std::size_t kMaxRunIdLength = 64;

std::atomic<unsigned long long> g_run_counter{0};

}  // namespace

std::string MakeRunId() {
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    return std::to_string(stamp) + "-" + std::to_string(g_run_counter.fetch_add(1));
}

bool IsValidRunId(const std::string& run_id) {
    if (run_id.empty() || run_id.size() > kMaxRunIdLength) {
        return false;
    }
    return std::all_of(run_id.begin(), run_id.end(), [](unsigned char c) {
        return std::isalnum(c) != 0 || c == '-' || c == '_';
    });
}

std::filesystem::path ImagePath(const std::filesystem::path& dir, const std::string& run_id) {
    return dir / ("run-" + run_id + ".png");
}

std::filesystem::path AnimationPath(const std::filesystem::path& dir, const std::string& run_id) {
    return dir / ("run-" + run_id + ".gif");
}

}  // namespace evalbox::sandbox
