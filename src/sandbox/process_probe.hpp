#pragma once

#include <cstddef>
#include <optional>
#include <sys/types.h>

namespace evalbox::sandbox {

// Resident set size of a live process, or nullopt when the process is gone
// (or is a zombie whose memory has already been released).
std::optional<std::size_t> ReadResidentBytes(pid_t pid);

}  // namespace evalbox::sandbox
