#pragma once

#include <cstddef>
#include <string>

#include "config/config_schema.hpp"
#include "sandbox/output_envelope.hpp"
#include "sandbox/supervisor.hpp"

namespace evalbox::sandbox {

// Host start-up: loads the config once and applies its logging level.
// Later calls return the same config and leave logging alone.
const config::Config& InitHost();

// Runs one untrusted script to completion on a private io_context. Never throws;
// engine defects come back as InternalError envelopes. Uses the InitHost config.
OutputEnvelope Run(const std::string& source,
                   const std::string& run_id,
                   double timeout_seconds,
                   std::size_t max_memory_bytes);

// Limits come from config.sandbox.timeout_s and max_memory_bytes.
OutputEnvelope Run(const config::Config& config,
                   const std::string& source,
                   const std::string& run_id);

OutputEnvelope Run(const config::Config& config,
                   const std::string& source,
                   const std::string& run_id,
                   double timeout_seconds,
                   std::size_t max_memory_bytes);

// Same as Run, but keeps the supervisor's terminal state and worker pid.
RunReport RunWithReport(const config::Config& config, RunRequest request);

SupervisorOptions OptionsFromConfig(const config::Config& config);

}  // namespace evalbox::sandbox
