#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace evalbox::media {

constexpr std::int64_t kMaxDelayMs = 65535;
constexpr std::int64_t kMaxExtraLoops = 100;

struct AnimationParams {
    // Per-frame delay as stored in a GIF graphic control extension.
    std::uint16_t delay_cs = 20;
    // Per-frame overrides of delay_cs; frames past the end use delay_cs.
    std::vector<std::uint16_t> frame_delays_cs;
    // NETSCAPE2.0 repeat count (0 = forever); nullopt writes no loop extension.
    std::optional<std::uint16_t> loop_count = 0;
};

// Clamps a frame delay in milliseconds to [0, kMaxDelayMs].
std::uint16_t ClampDelayMs(std::int64_t delay_ms);

// `loops` counts plays: 1 plays once (no extension); anything else becomes
// clamp(loops - 1, 0, kMaxExtraLoops) extra repeats.
std::optional<std::uint16_t> LoopExtensionCount(std::int64_t loops);

AnimationParams MakeAnimationParams(std::int64_t delay_ms, std::int64_t loops);

std::uint16_t FrameDelayCs(const AnimationParams& params, std::size_t frame);

}  // namespace evalbox::media
