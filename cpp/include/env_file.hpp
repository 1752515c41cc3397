#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace rollout {

// KEY=VALUE file supplying the stack's runtime secrets. The sequencer only
// checks that it exists; the bootstrap renderer reads OWNER_ID from it.
class EnvFile {
public:
    static bool exists(const std::filesystem::path& path);

    // Throws DeployError if the file cannot be read
    static EnvFile load(const std::filesystem::path& path);

    // Accepts "export " prefixes, # comments and quoted values
    static EnvFile parse(const std::string& text);

    std::optional<std::string> get(const std::string& key) const;
    bool contains(const std::string& key) const { return values_.count(key) != 0; }
    std::size_t size() const { return values_.size(); }

private:
    std::map<std::string, std::string> values_;
};

} // namespace rollout
