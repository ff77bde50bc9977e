#include "utils/logging.hpp"

#include <atomic>
#include <iostream>
#include <map>
#include <mutex>
#include <sstream>

#include "utils/common.hpp"

namespace evalbox::utils {
namespace {

std::atomic<LogLevel> g_min_level{LogLevel::kInfo};
std::mutex g_output_mutex;

}  // namespace

LogLevel ParseLogLevel(const std::string& value, LogLevel fallback) {
    const std::string lowered = ToLower(value);
    if (lowered == "debug") {
        return LogLevel::kDebug;
    }
    if (lowered == "info") {
        return LogLevel::kInfo;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::kWarn;
    }
    if (lowered == "error") {
        return LogLevel::kError;
    }
    return fallback;
}

void SetLogConfig(const LogConfig& config) {
    g_min_level.store(config.min_level);
}

LogConfig GetLogConfig() {
    LogConfig config{};
    config.min_level = g_min_level.load();
    return config;
}

void Log(const LogMessage& msg) {
    if (static_cast<int>(msg.level) < static_cast<int>(g_min_level.load())) {
        return;
    }
    std::ostringstream line;
    line << "[" << msg.tag << "] " << ToString(msg.level) << " " << msg.message;
    // Sorted so that lines are stable across runs.
    const std::map<std::string, std::string> sorted(msg.fields.begin(), msg.fields.end());
    for (const auto& [key, value] : sorted) {
        line << " " << key << "=" << value;
    }
    std::lock_guard<std::mutex> lock(g_output_mutex);
    std::cerr << line.str() << std::endl;
}

}  // namespace evalbox::utils
