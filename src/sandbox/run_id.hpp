#pragma once

#include <filesystem>
#include <string>

namespace evalbox::sandbox {

// Unique per process: steady-clock nanoseconds plus a counter.
std::string MakeRunId();

bool IsValidRunId(const std::string& run_id);

std::filesystem::path ImagePath(const std::filesystem::path& dir, const std::string& run_id);
std::filesystem::path AnimationPath(const std::filesystem::path& dir, const std::string& run_id);

}  // namespace evalbox::sandbox
