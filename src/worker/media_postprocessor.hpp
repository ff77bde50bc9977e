#pragma once

#include <filesystem>
#include <string>

#include "sandbox/output_envelope.hpp"
#include "worker/raw_result.hpp"
#include "worker/raw_value.hpp"

namespace evalbox::worker {

struct MediaTarget {
    std::filesystem::path output_dir;
    std::string run_id;
};

// output.img holding exactly a gfx.Surface -> run-<id>.png, has_image.
void WriteStillImage(const RawValue& image, const MediaTarget& target, sandbox::OutputEnvelope& envelope);

// output.frames holding at least one gfx.Surface -> run-<id>.gif, has_animation.
// Bad delay / loops become BadDelay / BadLoopCount unless the script already failed.
void WriteAnimation(const RawResult& raw, const MediaTarget& target, sandbox::OutputEnvelope& envelope);

void ProcessMedia(const RawResult& raw, const MediaTarget& target, sandbox::OutputEnvelope& envelope);

}  // namespace evalbox::worker
