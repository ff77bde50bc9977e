#pragma once

#include <string>
#include <unordered_map>
#include <utility>

namespace evalbox::utils {

enum class LogLevel {
    kDebug,
    kInfo,
    kWarn,
    kError
};

inline const char* ToString(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug: return "DEBUG";
        case LogLevel::kInfo: return "INFO";
        case LogLevel::kWarn: return "WARN";
        case LogLevel::kError: return "ERROR";
    }
    return "UNKNOWN";
}

LogLevel ParseLogLevel(const std::string& value, LogLevel fallback = LogLevel::kInfo);

struct LogMessage {
    LogLevel level;
    std::string tag;
    std::string message;
    std::unordered_map<std::string, std::string> fields;
};

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

void SetLogConfig(const LogConfig& config);
LogConfig GetLogConfig();

// Writes "[tag] LEVEL message key=value ..." to stderr when the level passes the filter.
void Log(const LogMessage& msg);

inline void Log(LogLevel level,
                std::string tag,
                std::string message,
                std::unordered_map<std::string, std::string> fields = {}) {
    Log(LogMessage{level, std::move(tag), std::move(message), std::move(fields)});
}

}  // namespace evalbox::utils
