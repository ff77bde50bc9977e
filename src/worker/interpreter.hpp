#pragma once

namespace evalbox::worker {

// Starts the embedded interpreter once per process in isolated mode (no site
// import, no environment, no signal handlers) with the `gfx` and
// `evalbox_runtime` modules built in. Throws std::runtime_error on failure.
void InitializeInterpreter();

}  // namespace evalbox::worker
