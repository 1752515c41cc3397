#include "database_bootstrap.hpp"
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include "deploy_error.hpp"
#include "env_file.hpp"

namespace {

std::string quote_js(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\\' || c == '\'') {
            quoted += '\\';
        }
        quoted += c;
    }
    return quoted + "'";
}

}

namespace rollout {

BootstrapPlan BootstrapPlan::standard(const std::string& database, long long owner_id) {
    BootstrapPlan plan;
    plan.database = database;
    plan.indexes = {
        {"users", "user_id", true},
        {"accounts", "user_id", false},
        {"accounts", "phone_number", false},
        {"sessions", "account_id", false},
        {"sessions", "created_at", false},
        {"logs", "timestamp", false},
        {"logs", "user_id", false},
        {"logs", "event_type", false},
    };
    plan.settings.monitoring_enabled = true;
    plan.settings.owner_id = owner_id;
    return plan;
}

std::string BootstrapPlan::render_script() const {
    std::ostringstream oss;
    oss << "// Runs when the database container starts with an empty data directory\n";
    oss << "db = db.getSiblingDB(" << quote_js(database) << ");\n\n";

    oss << "// Collections and their indexes\n";
    for (const auto& index : indexes) {
        oss << "db.getCollection(" << quote_js(index.collection) << ").createIndex({ \""
            << index.field << "\": 1 }";
        if (index.unique) {
            oss << ", { unique: true }";
        }
        oss << ");\n";
    }

    oss << "\n// Initial settings\n";
    oss << "db.settings.insertOne({\n";
    oss << "  \"monitoring_enabled\": " << (settings.monitoring_enabled ? "true" : "false") << ",\n";
    oss << "  \"owner_id\": " << settings.owner_id << ",\n";
    oss << "  \"created_at\": new Date()\n";
    oss << "});\n\n";

    oss << "print(\"Database initialized successfully\");\n";
    return oss.str();
}

long long parse_owner_id(const std::string& raw) {
    std::size_t pos = 0;
    while (pos < raw.size() && std::isspace(static_cast<unsigned char>(raw[pos]))) {
        ++pos;
    }
    bool negative = false;
    if (pos < raw.size() && (raw[pos] == '+' || raw[pos] == '-')) {
        negative = raw[pos] == '-';
        ++pos;
    }

    int base = 10;
    if (pos + 1 < raw.size() && raw[pos] == '0' && (raw[pos + 1] == 'x' || raw[pos + 1] == 'X')) {
        base = 16;
        pos += 2;
    }

    const std::size_t digits = pos;
    while (pos < raw.size() &&
           (base == 16 ? std::isxdigit(static_cast<unsigned char>(raw[pos]))
                       : std::isdigit(static_cast<unsigned char>(raw[pos])))) {
        ++pos;
    }
    if (pos == digits) {
        return 0;
    }
    try {
        const long long value = std::stoll(raw.substr(digits, pos - digits), nullptr, base);
        return negative ? -value : value;
    } catch (const std::out_of_range&) {
        return 0;
    }
}

long long resolve_owner_id(const std::optional<std::string>& process_value,
                           const std::filesystem::path& env_file) {
    if (process_value) {
        return parse_owner_id(*process_value);
    }
    if (EnvFile::exists(env_file)) {
        if (auto value = EnvFile::load(env_file).get("OWNER_ID")) {
            return parse_owner_id(*value);
        }
    }
    return 0;
}

void write_file_atomically(const std::filesystem::path& path, const std::string& content) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            throw DeployError("cannot create " + path.parent_path().string() + ": " + ec.message());
        }
    }

    std::filesystem::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw DeployError("cannot write " + tmp.string());
        }
        out << content;
        out.flush();
        if (!out) {
            throw DeployError("short write to " + tmp.string());
        }
    }

    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
        throw DeployError("cannot replace " + path.string() + ": " + ec.message());
    }
}

} // namespace rollout
