#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

#include "database_bootstrap.hpp"
#include "deploy_error.hpp"
#include "settings.hpp"

// Renders the first-start database script: indexes plus the settings seed.
// Usage: render-db-init [output-path]   (stdout when no path is given)
int main(int argc, char* argv[]) {
    if (argc > 2) {
        std::cerr << "Usage: " << argv[0] << " [output-path]" << std::endl;
        return 2;
    }

    try {
        const rollout::Settings settings = rollout::Settings::from_env();

        std::optional<std::string> owner;
        if (const char* value = std::getenv("OWNER_ID")) {
            owner = value;
        }
        const long long owner_id = rollout::resolve_owner_id(owner, settings.env_file_path());

        const std::string script =
            rollout::BootstrapPlan::standard(settings.db_name, owner_id).render_script();

        if (argc == 2) {
            rollout::write_file_atomically(argv[1], script);
            std::cerr << "[render-db-init] Wrote " << argv[1]
                      << " (database " << settings.db_name << ", owner " << owner_id << ")" << std::endl;
        } else {
            std::cout << script;
        }

    } catch (const rollout::SettingsError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
