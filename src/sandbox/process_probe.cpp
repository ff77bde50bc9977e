#include "sandbox/process_probe.hpp"

#include <fstream>
#include <string>
#include <unistd.h>

namespace evalbox::sandbox {

std::optional<std::size_t> ReadResidentBytes(pid_t pid) {
    if (pid <= 0) {
        return std::nullopt;
    }
    std::ifstream statm("/proc/" + std::to_string(pid) + "/statm");
    if (!statm.is_open()) {
        return std::nullopt;
    }
    std::size_t total_pages = 0;
    std::size_t resident_pages = 0;
    if (!(statm >> total_pages >> resident_pages)) {
        return std::nullopt;
    }
    if (total_pages == 0) {
        return std::nullopt;
    }
    static const long kPageSize = ::sysconf(_SC_PAGESIZE);
    return resident_pages * static_cast<std::size_t>(kPageSize > 0 ? kPageSize : 4096);
}

}  // namespace evalbox::sandbox
