#pragma once

#include <cstdint>
#include <filesystem>
#include <vector>

#include "gfx/surface.hpp"
#include "media/animation_params.hpp"

namespace evalbox::media {

// Palette layout shared by every frame: a 6x6x6 colour cube, then the
// transparent entry.
constexpr int kCubeLevels = 6;
constexpr std::uint8_t kTransparentIndex = kCubeLevels * kCubeLevels * kCubeLevels;

std::uint8_t PaletteIndex(std::uint8_t r, std::uint8_t g, std::uint8_t b, std::uint8_t a);

// GIF89a stream: logical screen sized to the largest frame, every frame at the
// origin and disposed to background. Throws EncodeError when `frames` is empty.
std::vector<std::uint8_t> EncodeGif(const std::vector<const gfx::Surface*>& frames,
                                    const AnimationParams& params);

void WriteGif(const std::vector<const gfx::Surface*>& frames,
              const AnimationParams& params,
              const std::filesystem::path& path);

}  // namespace evalbox::media
