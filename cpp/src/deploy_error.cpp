#include "deploy_error.hpp"

namespace rollout {

ConfigurationMissing::ConfigurationMissing(const std::filesystem::path& env_file)
    : DeployError(env_file.string() + " file not found. Please create it from .env.example")
    , env_file_(env_file)
{
}

LockUnavailable::LockUnavailable(const std::filesystem::path& lock_file, std::optional<long> holder_pid)
    : DeployError("another deployment is in progress (lock " + lock_file.string()
                  + (holder_pid ? " held by pid " + std::to_string(*holder_pid) : std::string(" is held"))
                  + ")")
    , holder_pid_(holder_pid)
{
}

CommandFailure::CommandFailure(Step step, CommandResult result)
    : DeployError(std::string(to_string(step)) + " failed: " + result.describe())
    , step_(step)
    , result_(std::move(result))
{
}

SettingsError::SettingsError(const std::string& name, const std::string& value, const std::string& expected)
    : DeployError("invalid value '" + value + "' for " + name + " (expected " + expected + ")")
{
}

} // namespace rollout
