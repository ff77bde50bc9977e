#include "worker/sanitizer.hpp"

#include <cmath>

#include "utils/logging.hpp"
#include "worker/raw_value.hpp"

namespace evalbox::worker {

sandbox::OutputEnvelope Sanitize(const RawResult& raw, const MediaTarget& target) {
    sandbox::OutputEnvelope envelope;

    const RawValue text = Classify(raw.text);
    if (const auto* value = std::get_if<Text>(&text)) {
        envelope.text = value->value;
    } else {
        utils::Log(utils::LogLevel::kDebug, "sanitizer", "dropped output.text of unexpected type");
    }
    if (std::isfinite(raw.duration)) {
        envelope.duration = raw.duration;
    }
    envelope.error = raw.error;

    ProcessMedia(raw, target, envelope);
    return envelope;
}

}  // namespace evalbox::worker
