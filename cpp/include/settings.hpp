#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "readiness.hpp"

namespace rollout {

// Runtime configuration of the deploy and update tools. Every field can be
// overridden through a ROLLOUT_* environment variable.
struct Settings {
    std::filesystem::path project_dir;
    std::string env_file = ".env";
    std::string compose_command = "docker-compose";
    std::string service = "bot";
    std::string db_service = "mongodb";
    std::string db_name = "giveaway";
    std::string health_url = "http://localhost/health";
    std::chrono::milliseconds health_timeout{3000};
    ReadinessMode readiness_mode = ReadinessMode::Poll;
    std::chrono::seconds readiness_window{30};
    std::size_t log_tail = 50;
    std::string backup_root = "/backup";
    std::string git_remote = "origin";
    std::string git_branch = "main";
    bool strict_health = false;
    bool update_verify = true;
    bool tls_verify = false;
    std::chrono::seconds command_timeout{0};
    std::vector<std::string> directories{"logs", "ssl"};

    std::filesystem::path env_file_path() const;
    std::filesystem::path lock_file_path() const;
    ReadinessPolicy readiness_policy() const;

    using Lookup = std::function<std::optional<std::string>(const std::string&)>;

    // Throws SettingsError on a malformed value
    static Settings from_lookup(const Lookup& lookup);
    static Settings from_env();
};

} // namespace rollout
