#pragma once

#include "deployment_run.hpp"

namespace rollout {

// Shared entry point of the deploy and update tools: installs the signal
// handlers, wires the real collaborators and maps the outcome to an exit code.
int run_cli(RunKind kind);

} // namespace rollout
