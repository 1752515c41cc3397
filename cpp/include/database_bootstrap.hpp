#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace rollout {

struct IndexSpec {
    std::string collection;
    std::string field;
    bool unique = false;
};

struct SettingsSeed {
    bool monitoring_enabled = true;
    long long owner_id = 0;
};

// Collections, indexes and the settings document the database container
// creates on its first start. Rendered to a mongo shell script for the
// container's init directory.
struct BootstrapPlan {
    std::string database;
    std::vector<IndexSpec> indexes;
    SettingsSeed settings;

    static BootstrapPlan standard(const std::string& database, long long owner_id);

    std::string render_script() const;
};

// Leading integer of the value, decimal or 0x-prefixed hex, 0 when there is
// none or it does not fit in 64 bits
long long parse_owner_id(const std::string& raw);

// OWNER_ID from the process environment, else from the env file, else 0
long long resolve_owner_id(const std::optional<std::string>& process_value,
                           const std::filesystem::path& env_file);

// Writes through a temporary file in the same directory, then renames
void write_file_atomically(const std::filesystem::path& path, const std::string& content);

} // namespace rollout
