#pragma once

#include <memory>
#include <string>

#include "sandbox/output_envelope.hpp"
#include "worker/raw_result.hpp"

namespace evalbox::worker {

// Filename scripts are compiled under; frames with any other filename belong
// to the engine or to library code.
constexpr const char* kScriptFilename = "<sandbox>";

// Pre-checks, compiles and evaluates `source` against a fresh namespace built
// from the capability surface. Failures are classified into the result's
// error; no Python exception is left pending on return.
std::shared_ptr<RawResult> RunScript(const std::string& source);

// Fetches, classifies and clears the pending Python exception.
sandbox::SandboxError ClassifyPendingError();

std::string ImportBlockedMessage();

}  // namespace evalbox::worker
