#include "cli.hpp"
#include <atomic>
#include <csignal>
#include <iostream>

#include "compose_orchestrator.hpp"
#include "deploy_error.hpp"
#include "health_probe.hpp"
#include "process_runner.hpp"
#include "sequencer.hpp"
#include "settings.hpp"
#include "source_repository.hpp"

namespace {

std::atomic<bool> stop_requested(false);

// Async-signal-safe: only set the flag; the runner and the sequencer poll it
void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        stop_requested = true;
    }
}

}

namespace rollout {

int run_cli(RunKind kind) {
    std::cout << R"(
╔═══════════════════════════════════════════════════════════╗
║                                                           ║
║     ⚓ ROLLOUT - service stack sequencer ⚓               ║
║                                                           ║
║     stop → pull → build → start → wait → verify           ║
║                                                           ║
╚═══════════════════════════════════════════════════════════╝
)" << std::endl;

    // Setup signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        const Settings settings = Settings::from_env();

        ProcessRunner runner(stop_requested, std::cout);
        ComposeOrchestrator orchestrator(
            runner,
            settings.compose_command,
            settings.project_dir,
            settings.command_timeout
        );
        HttpHealthProbe probe(
            HealthEndpoint::parse(settings.health_url),
            settings.health_timeout,
            settings.tls_verify
        );
        GitSourceRepository source(
            runner,
            settings.project_dir,
            settings.git_remote,
            settings.git_branch,
            settings.command_timeout
        );

        Sequencer sequencer(settings, orchestrator, probe, source, stop_requested);
        const DeploymentRun run = kind == RunKind::Deploy ? sequencer.run() : sequencer.run_update();

        return to_int(exit_code_for(run.outcome, settings.strict_health));

    } catch (const SettingsError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return to_int(ExitCode::InvalidSettings);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}

} // namespace rollout
