#pragma once

#include <filesystem>

#include "gfx/surface.hpp"

namespace evalbox::media {

// Writes an 8-bit RGBA PNG; throws EncodeError on failure.
void WritePng(const gfx::Surface& surface, const std::filesystem::path& path);

}  // namespace evalbox::media
