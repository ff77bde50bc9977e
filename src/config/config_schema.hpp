#pragma once

#include <cstddef>
#include <string>

namespace evalbox::config {

struct SandboxConfig {
    double timeout_s = 5.0;
    std::size_t max_memory_bytes = std::size_t{1} << 28;
    int poll_interval_ms = 50;
    int channel_grace_ms = 1000;
    std::string worker_path;
    std::string work_dir = ".";
};

struct LoggingConfig {
    std::string level = "info";
};

struct Config {
    SandboxConfig sandbox;
    LoggingConfig logging;
};

}  // namespace evalbox::config
