#pragma once

#include <string>

#include "sandbox/output_envelope.hpp"

namespace evalbox::sandbox {

// Single JSON document written by the worker on its channel.
std::string EncodeEnvelope(const OutputEnvelope& envelope);

// Strict decode: fields of an unexpected JSON type are dropped, and a payload
// that is not a JSON object becomes an InternalError envelope.
OutputEnvelope DecodeEnvelope(const std::string& payload);

}  // namespace evalbox::sandbox
