#include "env_file.hpp"
#include <fstream>
#include <sstream>
#include <system_error>

#include "deploy_error.hpp"

namespace {

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r");
    return value.substr(first, last - first + 1);
}

std::string unquote(const std::string& value) {
    if (value.size() >= 2) {
        const char quote = value.front();
        if ((quote == '"' || quote == '\'') && value.back() == quote) {
            return value.substr(1, value.size() - 2);
        }
    }
    // Unquoted values may carry a trailing " # comment"
    const auto comment = value.find(" #");
    return comment == std::string::npos ? value : trim(value.substr(0, comment));
}

}

namespace rollout {

bool EnvFile::exists(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

EnvFile EnvFile::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw DeployError("cannot read " + path.string());
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    return parse(oss.str());
}

EnvFile EnvFile::parse(const std::string& text) {
    EnvFile env;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        line = trim(line);
        if (line.empty() || line.front() == '#') {
            continue;
        }
        if (line.compare(0, 7, "export ") == 0) {
            line = trim(line.substr(7));
        }

        const auto eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        const std::string key = trim(line.substr(0, eq));
        if (key.empty()) {
            continue;
        }
        env.values_[key] = unquote(trim(line.substr(eq + 1)));
    }
    return env;
}

std::optional<std::string> EnvFile::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace rollout
