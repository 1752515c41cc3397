#include "settings.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

#include "deploy_error.hpp"
#include "health_probe.hpp"

namespace {

std::string lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool parse_bool(const std::string& name, const std::string& raw) {
    const std::string value = lower(raw);
    if (value == "1" || value == "true" || value == "yes" || value == "on") {
        return true;
    }
    if (value == "0" || value == "false" || value == "no" || value == "off") {
        return false;
    }
    throw rollout::SettingsError(name, raw, "a boolean");
}

// Upper bounds: a day for durations
constexpr long long MAX_SECONDS = 24 * 60 * 60;
constexpr long long MAX_MILLISECONDS = MAX_SECONDS * 1000;
constexpr long long MAX_LOG_TAIL = 1000000;

long long parse_count(const std::string& name, const std::string& raw, long long min, long long max) {
    const std::string expected = "an integer between " + std::to_string(min) + " and " + std::to_string(max);
    std::size_t consumed = 0;
    long long value = 0;
    try {
        value = std::stoll(raw, &consumed);
    } catch (const std::exception&) {
        throw rollout::SettingsError(name, raw, expected);
    }
    if (consumed != raw.size() || value < min || value > max) {
        throw rollout::SettingsError(name, raw, expected);
    }
    return value;
}

}

namespace rollout {

std::filesystem::path Settings::env_file_path() const {
    return project_dir / env_file;
}

std::filesystem::path Settings::lock_file_path() const {
    return project_dir / ".rollout.lock";
}

ReadinessPolicy Settings::readiness_policy() const {
    ReadinessPolicy policy;
    policy.mode = readiness_mode;
    policy.deadline = readiness_window;
    return policy;
}

Settings Settings::from_lookup(const Lookup& lookup) {
    Settings settings;
    settings.project_dir = std::filesystem::current_path();

    auto text = [&](const char* name, std::string& field) {
        if (auto value = lookup(name); value && !value->empty()) {
            field = *value;
        }
    };

    if (auto dir = lookup("ROLLOUT_PROJECT_DIR"); dir && !dir->empty()) {
        settings.project_dir = std::filesystem::absolute(*dir);
    }
    text("ROLLOUT_ENV_FILE", settings.env_file);
    text("ROLLOUT_COMPOSE", settings.compose_command);
    text("ROLLOUT_SERVICE", settings.service);
    text("ROLLOUT_DB_SERVICE", settings.db_service);
    text("ROLLOUT_DB_NAME", settings.db_name);
    text("ROLLOUT_HEALTH_URL", settings.health_url);
    text("ROLLOUT_BACKUP_ROOT", settings.backup_root);
    text("ROLLOUT_GIT_REMOTE", settings.git_remote);
    text("ROLLOUT_GIT_BRANCH", settings.git_branch);

    if (settings.compose_command.find_first_not_of(" \t") == std::string::npos) {
        throw SettingsError("ROLLOUT_COMPOSE", settings.compose_command, "a command");
    }

    try {
        HealthEndpoint::parse(settings.health_url);
    } catch (const std::invalid_argument& e) {
        throw SettingsError("ROLLOUT_HEALTH_URL", settings.health_url, e.what());
    }

    if (auto value = lookup("ROLLOUT_HEALTH_TIMEOUT_MS"); value && !value->empty()) {
        settings.health_timeout = std::chrono::milliseconds(parse_count("ROLLOUT_HEALTH_TIMEOUT_MS", *value, 1, MAX_MILLISECONDS));
    }
    if (auto value = lookup("ROLLOUT_READINESS"); value && !value->empty()) {
        const std::string mode = lower(*value);
        if (mode == "poll") {
            settings.readiness_mode = ReadinessMode::Poll;
        } else if (mode == "fixed") {
            settings.readiness_mode = ReadinessMode::Fixed;
        } else {
            throw SettingsError("ROLLOUT_READINESS", *value, "poll or fixed");
        }
    }
    if (auto value = lookup("ROLLOUT_READINESS_SECONDS"); value && !value->empty()) {
        settings.readiness_window = std::chrono::seconds(parse_count("ROLLOUT_READINESS_SECONDS", *value, 0, MAX_SECONDS));
    }
    if (auto value = lookup("ROLLOUT_LOG_TAIL"); value && !value->empty()) {
        settings.log_tail = static_cast<std::size_t>(parse_count("ROLLOUT_LOG_TAIL", *value, 1, MAX_LOG_TAIL));
    }
    if (auto value = lookup("ROLLOUT_COMMAND_TIMEOUT_SECONDS"); value && !value->empty()) {
        settings.command_timeout = std::chrono::seconds(parse_count("ROLLOUT_COMMAND_TIMEOUT_SECONDS", *value, 0, MAX_SECONDS));
    }
    if (auto value = lookup("ROLLOUT_STRICT_HEALTH"); value && !value->empty()) {
        settings.strict_health = parse_bool("ROLLOUT_STRICT_HEALTH", *value);
    }
    if (auto value = lookup("ROLLOUT_UPDATE_VERIFY"); value && !value->empty()) {
        settings.update_verify = parse_bool("ROLLOUT_UPDATE_VERIFY", *value);
    }
    if (auto value = lookup("ROLLOUT_TLS_VERIFY"); value && !value->empty()) {
        settings.tls_verify = parse_bool("ROLLOUT_TLS_VERIFY", *value);
    }

    return settings;
}

Settings Settings::from_env() {
    return from_lookup([](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (!value) {
            return std::nullopt;
        }
        return std::string(value);
    });
}

} // namespace rollout
