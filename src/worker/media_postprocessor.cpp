#include "worker/media_postprocessor.hpp"

#include <cstdint>
#include <optional>
#include <system_error>
#include <unordered_map>
#include <vector>

#include "media/encode_error.hpp"
#include "media/gif_writer.hpp"
#include "media/png_writer.hpp"
#include "sandbox/run_id.hpp"
#include "utils/logging.hpp"

namespace evalbox::worker {

namespace {

constexpr const char* kTag = "media";

std::string TypeName(const boost::python::object& value) {
    return Py_TYPE(value.ptr())->tp_name;
}

void SetParameterError(sandbox::OutputEnvelope& envelope, sandbox::ErrorKind kind, std::string message) {
    if (envelope.error.has_value()) {
        utils::Log(utils::LogLevel::kDebug, kTag, "animation skipped after script error",
                   {{"kind", sandbox::ToString(kind)}});
        return;
    }
    envelope.error = sandbox::SandboxError{kind, std::move(message)};
}

void SetEncoderError(sandbox::OutputEnvelope& envelope, const std::filesystem::path& path, const std::string& what) {
    utils::Log(utils::LogLevel::kError, kTag, "encoder failed", {{"path", path.string()}, {"error", what}});
    std::error_code ec;
    std::filesystem::remove(path, ec);
    envelope.error = sandbox::SandboxError{sandbox::ErrorKind::InternalError, what};
}

}  // namespace

void WriteStillImage(const RawValue& image, const MediaTarget& target, sandbox::OutputEnvelope& envelope) {
    const auto* surface = std::get_if<SurfaceRef>(&image);
    if (surface == nullptr) {
        return;
    }
    const auto path = sandbox::ImagePath(target.output_dir, target.run_id);
    try {
        media::WritePng(*surface->surface, path);
        envelope.has_image = true;
    } catch (const media::EncodeError& ex) {
        SetEncoderError(envelope, path, ex.what());
    }
}

void WriteAnimation(const RawResult& raw, const MediaTarget& target, sandbox::OutputEnvelope& envelope) {
    const RawValue frames = Classify(raw.frames);
    const auto* sequence = std::get_if<SurfaceSequence>(&frames);
    if (sequence == nullptr || sequence->surfaces.empty()) {
        return;
    }
    // Frames added with an explicit delay are found by identity, so the
    // script may reorder or rebuild output.frames.
    std::unordered_map<PyObject*, std::int64_t> explicit_delays;
    for (const auto& entry : raw.frame_delays) {
        explicit_delays[entry.frame.ptr()] = entry.delay_ms;
    }
    std::vector<std::optional<std::int64_t>> frame_delays;
    frame_delays.reserve(sequence->surfaces.size());
    bool needs_default = false;
    for (const auto& ref : sequence->surfaces) {
        const auto found = explicit_delays.find(ref.owner.ptr());
        if (found == explicit_delays.end()) {
            frame_delays.emplace_back();
            needs_default = true;
        } else {
            frame_delays.emplace_back(found->second);
        }
    }

    std::optional<std::int64_t> delay = kDefaultDelayMs;
    if (needs_default) {
        delay = AsNumber(Classify(raw.delay));
        if (!delay.has_value()) {
            SetParameterError(envelope, sandbox::ErrorKind::BadDelay,
                              "output.delay must be a number of milliseconds between 0 and 65535, not " +
                                  TypeName(raw.delay));
            return;
        }
    }
    const auto loops = AsNumber(Classify(raw.loops));
    if (!loops.has_value()) {
        SetParameterError(envelope, sandbox::ErrorKind::BadLoopCount,
                          "output.loops must be an integer, not " + TypeName(raw.loops));
        return;
    }

    std::vector<const gfx::Surface*> surfaces;
    surfaces.reserve(sequence->surfaces.size());
    for (const auto& ref : sequence->surfaces) {
        surfaces.push_back(ref.surface);
    }
    auto params = media::MakeAnimationParams(*delay, *loops);
    params.frame_delays_cs.reserve(frame_delays.size());
    for (const auto& frame_delay : frame_delays) {
        params.frame_delays_cs.push_back(frame_delay.has_value()
                                             ? static_cast<std::uint16_t>(media::ClampDelayMs(*frame_delay) / 10)
                                             : params.delay_cs);
    }
    const auto path = sandbox::AnimationPath(target.output_dir, target.run_id);
    try {
        media::WriteGif(surfaces, params, path);
        envelope.has_animation = true;
    } catch (const media::EncodeError& ex) {
        SetEncoderError(envelope, path, ex.what());
    }
}

void ProcessMedia(const RawResult& raw, const MediaTarget& target, sandbox::OutputEnvelope& envelope) {
    WriteStillImage(Classify(raw.img), target, envelope);
    WriteAnimation(raw, target, envelope);
}

}  // namespace evalbox::worker
