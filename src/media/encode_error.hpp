#pragma once

#include <stdexcept>
#include <string>

namespace evalbox::media {

// Raised when an image file cannot be produced (I/O or encoder failure).
class EncodeError : public std::runtime_error {
public:
    explicit EncodeError(const std::string& message) : std::runtime_error(message) {}
};

}  // namespace evalbox::media
