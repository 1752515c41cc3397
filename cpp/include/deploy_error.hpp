#pragma once

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

#include "deployment_run.hpp"
#include "process_runner.hpp"

namespace rollout {

class DeployError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The environment/secrets file is absent
class ConfigurationMissing : public DeployError {
public:
    explicit ConfigurationMissing(const std::filesystem::path& env_file);

    const std::filesystem::path& env_file() const { return env_file_; }

private:
    std::filesystem::path env_file_;
};

// Another run holds the advisory lock
class LockUnavailable : public DeployError {
public:
    LockUnavailable(const std::filesystem::path& lock_file, std::optional<long> holder_pid);

    std::optional<long> holder_pid() const { return holder_pid_; }

private:
    std::optional<long> holder_pid_;
};

// The orchestration tool (or git) returned a non-success result
class CommandFailure : public DeployError {
public:
    CommandFailure(Step step, CommandResult result);

    Step step() const { return step_; }
    const CommandResult& result() const { return result_; }

private:
    Step step_;
    CommandResult result_;
};

class Interrupted : public DeployError {
public:
    Interrupted() : DeployError("interrupted by signal") {}
};

class SettingsError : public DeployError {
public:
    SettingsError(const std::string& name, const std::string& value, const std::string& expected);
};

} // namespace rollout
