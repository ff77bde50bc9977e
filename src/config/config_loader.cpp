#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "nlohmann/json.hpp"

namespace evalbox::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("sandbox") && data["sandbox"].is_object()) {
        const auto& sandbox = data["sandbox"];
        if (sandbox.contains("timeoutS") && sandbox["timeoutS"].is_number()) {
            config.sandbox.timeout_s = sandbox["timeoutS"].get<double>();
        }
        if (sandbox.contains("maxMemoryBytes") && sandbox["maxMemoryBytes"].is_number_unsigned()) {
            config.sandbox.max_memory_bytes = sandbox["maxMemoryBytes"].get<std::size_t>();
        }
        if (sandbox.contains("pollIntervalMs") && sandbox["pollIntervalMs"].is_number_integer()) {
            config.sandbox.poll_interval_ms = sandbox["pollIntervalMs"].get<int>();
        }
        if (sandbox.contains("channelGraceMs") && sandbox["channelGraceMs"].is_number_integer()) {
            config.sandbox.channel_grace_ms = sandbox["channelGraceMs"].get<int>();
        }
        if (sandbox.contains("workerPath") && sandbox["workerPath"].is_string()) {
            config.sandbox.worker_path = sandbox["workerPath"].get<std::string>();
        }
        if (sandbox.contains("workDir") && sandbox["workDir"].is_string()) {
            config.sandbox.work_dir = sandbox["workDir"].get<std::string>();
        }
    }

    if (data.contains("logging") && data["logging"].is_object()) {
        const auto& logging = data["logging"];
        if (logging.contains("level") && logging["level"].is_string()) {
            config.logging.level = logging["level"].get<std::string>();
        }
    }
}

void ApplyConfigFile(Config& config, const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return;
    }
    try {
        std::ifstream input(path);
        nlohmann::json data;
        input >> data;
        ApplyConfigFromJson(config, data);
    } catch (const nlohmann::json::exception&) {
        // Keep defaults on parse errors
    }
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

std::size_t ParseSize(const std::string& value, std::size_t fallback) {
    if (value.empty() || !std::all_of(value.begin(), value.end(), [](unsigned char c) {
            return std::isdigit(c) != 0;
        })) {
        return fallback;
    }
    try {
        return static_cast<std::size_t>(std::stoull(value));
    } catch (const std::exception&) {
        return fallback;
    }
}

double ParseDouble(const std::string& value, double fallback) {
    try {
        return std::stod(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

}  // namespace

std::filesystem::path GetConfigPath() {
    return GetHomePath() / ".evalbox" / "config.json";
}

Config LoadConfigFromFile(const std::filesystem::path& path) {
    Config config{};
    ApplyConfigFile(config, path);
    return config;
}

Config LoadConfig() {
    Config config{};
    ApplyConfigFile(config, GetConfigPath());

    const auto timeout = GetEnv("EVALBOX_SANDBOX__TIMEOUT_S");
    if (!timeout.empty()) {
        config.sandbox.timeout_s = ParseDouble(timeout, config.sandbox.timeout_s);
    }

    const auto max_memory = GetEnv("EVALBOX_SANDBOX__MAX_MEMORY_BYTES");
    if (!max_memory.empty()) {
        config.sandbox.max_memory_bytes = ParseSize(max_memory, config.sandbox.max_memory_bytes);
    }

    const auto poll_interval = GetEnv("EVALBOX_SANDBOX__POLL_INTERVAL_MS");
    if (!poll_interval.empty()) {
        config.sandbox.poll_interval_ms = ParseInt(poll_interval, config.sandbox.poll_interval_ms);
    }

    const auto channel_grace = GetEnv("EVALBOX_SANDBOX__CHANNEL_GRACE_MS");
    if (!channel_grace.empty()) {
        config.sandbox.channel_grace_ms = ParseInt(channel_grace, config.sandbox.channel_grace_ms);
    }

    const auto worker_path = GetEnv("EVALBOX_SANDBOX__WORKER_PATH");
    if (!worker_path.empty()) {
        config.sandbox.worker_path = worker_path;
    }

    const auto work_dir = GetEnv("EVALBOX_SANDBOX__WORK_DIR");
    if (!work_dir.empty()) {
        config.sandbox.work_dir = work_dir;
    }

    const auto log_level = GetEnv("EVALBOX_LOGGING__LEVEL");
    if (!log_level.empty()) {
        config.logging.level = log_level;
    }

    return config;
}

}  // namespace evalbox::config
