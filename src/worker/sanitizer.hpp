#pragma once

#include "sandbox/output_envelope.hpp"
#include "worker/media_postprocessor.hpp"
#include "worker/raw_result.hpp"

namespace evalbox::worker {

// The trust boundary: copies only fields of the exact expected shape out of
// the raw result, turns surfaces into side-channel files, and drops the rest.
sandbox::OutputEnvelope Sanitize(const RawResult& raw, const MediaTarget& target);

}  // namespace evalbox::worker
