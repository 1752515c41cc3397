#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "process_runner.hpp"

namespace rollout {

// The container orchestration tool as seen by the sequencer. Stop and start
// must be idempotent with respect to an already stopped or running stack.
class Orchestrator {
public:
    virtual ~Orchestrator() = default;

    virtual CommandResult stop_all() = 0;
    virtual CommandResult pull_images() = 0;
    virtual CommandResult build_images() = 0;      // without the layer cache
    virtual CommandResult start_detached() = 0;
    virtual CommandResult status() = 0;
    virtual CommandResult logs(std::size_t tail) = 0;
    virtual CommandResult service_logs(const std::string& service, std::size_t tail) = 0;
    virtual CommandResult exec(const std::string& service, const std::vector<std::string>& argv) = 0;

    // Human readable command prefix, used in follow-up hints
    virtual std::string command_name() const = 0;
};

} // namespace rollout
