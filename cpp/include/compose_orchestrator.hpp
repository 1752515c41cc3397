#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include "orchestrator.hpp"
#include "process_runner.hpp"

namespace rollout {

// Drives docker-compose (or the "docker compose" plugin) in the project
// directory through the process runner.
class ComposeOrchestrator : public Orchestrator {
public:
    ComposeOrchestrator(
        const ProcessRunner& runner,
        const std::string& compose_command,
        const std::filesystem::path& project_dir,
        std::chrono::seconds timeout
    );

    CommandResult stop_all() override;
    CommandResult pull_images() override;
    CommandResult build_images() override;
    CommandResult start_detached() override;
    CommandResult status() override;
    CommandResult logs(std::size_t tail) override;
    CommandResult service_logs(const std::string& service, std::size_t tail) override;
    CommandResult exec(const std::string& service, const std::vector<std::string>& argv) override;

    std::string command_name() const override { return command_name_; }

    // Exposed for tests
    CommandSpec make_spec(const std::vector<std::string>& args) const;

private:
    CommandResult compose(const std::vector<std::string>& args);

    const ProcessRunner& runner_;
    std::vector<std::string> prefix_;
    std::string command_name_;
    std::filesystem::path project_dir_;
    std::chrono::seconds timeout_;
};

} // namespace rollout
