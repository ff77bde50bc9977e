#include "media/animation_params.hpp"

#include <algorithm>

namespace evalbox::media {

std::uint16_t ClampDelayMs(std::int64_t delay_ms) {
    return static_cast<std::uint16_t>(std::clamp<std::int64_t>(delay_ms, 0, kMaxDelayMs));
}

std::optional<std::uint16_t> LoopExtensionCount(std::int64_t loops) {
    if (loops == 1) {
        return std::nullopt;
    }
    if (loops <= 0) {
        return 0;
    }
    return static_cast<std::uint16_t>(std::min<std::int64_t>(loops - 1, kMaxExtraLoops));
}

AnimationParams MakeAnimationParams(std::int64_t delay_ms, std::int64_t loops) {
    AnimationParams params;
    params.delay_cs = static_cast<std::uint16_t>(ClampDelayMs(delay_ms) / 10);
    params.loop_count = LoopExtensionCount(loops);
    return params;
}

std::uint16_t FrameDelayCs(const AnimationParams& params, std::size_t frame) {
    return frame < params.frame_delays_cs.size() ? params.frame_delays_cs[frame] : params.delay_cs;
}

}  // namespace evalbox::media
