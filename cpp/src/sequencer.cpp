#include "sequencer.hpp"
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include "deploy_error.hpp"
#include "env_file.hpp"

namespace rollout {

namespace {

Outcome outcome_for(Step step) {
    switch (step) {
        case Step::BackupDatabase: return Outcome::BackupFailed;
        case Step::UpdateSource:   return Outcome::SourceUpdateFailed;
        case Step::BuildImages:    return Outcome::BuildFailed;
        default:                   return Outcome::StartFailed;
    }
}

std::string join(const std::vector<std::string>& parts) {
    std::string joined;
    for (const auto& part : parts) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += part;
    }
    return joined;
}

}

std::string backup_destination(const std::string& root, std::chrono::system_clock::time_point when) {
    const std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm local{};
    localtime_r(&t, &local);

    std::string base = root;
    while (base.size() > 1 && base.back() == '/') {
        base.pop_back();
    }

    std::ostringstream oss;
    oss << base;
    if (base != "/") {
        oss << "/";
    }
    oss << std::put_time(&local, "%Y%m%d_%H%M%S");
    return oss.str();
}

Sequencer::Sequencer(
    const Settings& settings,
    Orchestrator& orchestrator,
    HealthProbe& probe,
    SourceRepository& source,
    const std::atomic<bool>& stop_flag
)
    : settings_(settings)
    , orchestrator_(orchestrator)
    , probe_(probe)
    , source_(source)
    , stop_flag_(stop_flag)
    , sleep_([&stop_flag](std::chrono::milliseconds duration) {
        return interruptible_sleep(duration, stop_flag);
    })
    , clock_([] { return std::chrono::system_clock::now(); })
    , monotonic_clock_([] { return std::chrono::steady_clock::now(); })
{
}

DeploymentRun Sequencer::run() {
    return execute(RunKind::Deploy, [this](DeploymentRun& run) {
        out() << "🚀 Starting deployment..." << std::endl;
        validate(run);

        RunLock lock(settings_.lock_file_path());
        acquire_lock(run, lock);

        prepare_directories(run);
        stop_existing(run);
        pull_images(run);
        build_images(run);
        start_services(run);
        verify(run);
    });
}

DeploymentRun Sequencer::run_update() {
    return execute(RunKind::Update, [this](DeploymentRun& run) {
        out() << "🔄 Updating " << settings_.service << "..." << std::endl;
        validate(run);

        RunLock lock(settings_.lock_file_path());
        acquire_lock(run, lock);

        backup_database(run);
        update_source(run);

        out() << "🔨 Rebuilding and restarting..." << std::endl;
        stop_existing(run);
        build_images(run);
        start_services(run);

        if (settings_.update_verify) {
            verify(run);
        } else {
            run.outcome = Outcome::Success;
            out() << "✅ Update completed!" << std::endl;
        }
    });
}

DeploymentRun Sequencer::execute(RunKind kind, const std::function<void(DeploymentRun&)>& lifecycle) {
    DeploymentRun run;
    run.kind = kind;
    run.started_at = clock_();

    try {
        lifecycle(run);
    } catch (const ConfigurationMissing& e) {
        run.outcome = Outcome::ConfigurationMissing;
        run.error = e.what();
        err() << "❌ " << e.what() << std::endl;
    } catch (const LockUnavailable& e) {
        run.outcome = Outcome::Locked;
        run.error = e.what();
        err() << "❌ Cannot " << to_string(kind) << ": " << e.what() << std::endl;
    } catch (const CommandFailure& e) {
        run.outcome = outcome_for(e.step());
        run.error = e.what();
        err() << "❌ " << e.what() << std::endl;

        // Surface the tool's own words; the operator fixes the cause
        const std::string& output = e.result().output;
        if (!output.empty()) {
            err() << "---- " << to_string(e.step()) << " output"
                  << (e.result().truncated ? " (tail)" : "") << " ----\n" << output;
            if (output.back() != '\n') {
                err() << '\n';
            }
            err() << "----" << std::endl;
        }
    } catch (const Interrupted& e) {
        run.outcome = Outcome::Interrupted;
        run.error = e.what();
        err() << "⚠️  " << to_string(kind) << " " << e.what()
              << "; check '" << orchestrator_.command_name() << " ps' for the stack state" << std::endl;
    } catch (const DeployError& e) {
        run.outcome = Outcome::EnvironmentError;
        run.error = e.what();
        err() << "❌ " << e.what() << std::endl;
    } catch (const std::exception& e) {
        // Spawn and filesystem errors from the host, not from the stack
        run.outcome = Outcome::EnvironmentError;
        run.error = e.what();
        err() << "❌ " << to_string(kind) << " aborted: " << e.what() << std::endl;
    }

    out() << "[Sequencer] " << to_string(kind) << " finished: " << to_string(run.outcome) << "\n"
          << run.summary() << std::endl;
    return run;
}

void Sequencer::validate(DeploymentRun& run) {
    const auto started = std::chrono::steady_clock::now();
    const auto env_path = settings_.env_file_path();
    if (!EnvFile::exists(env_path)) {
        record(run, Step::Validate, false, "missing " + env_path.string(), started);
        throw ConfigurationMissing(env_path);
    }
    record(run, Step::Validate, true, env_path.filename().string(), started);
}

void Sequencer::acquire_lock(DeploymentRun& run, RunLock& lock) {
    checkpoint();
    const auto started = std::chrono::steady_clock::now();
    bool acquired = false;
    try {
        acquired = lock.try_acquire();
    } catch (const DeployError& e) {
        record(run, Step::AcquireLock, false, e.what(), started);
        throw;
    }
    if (!acquired) {
        const auto holder = lock.holder_pid();
        record(run, Step::AcquireLock, false, "held by another run", started);
        throw LockUnavailable(lock.path(), holder);
    }
    record(run, Step::AcquireLock, true, lock.path().filename().string(), started);
}

void Sequencer::prepare_directories(DeploymentRun& run) {
    checkpoint();
    const auto started = std::chrono::steady_clock::now();

    std::vector<std::string> created;
    bool ok = true;
    for (const auto& name : settings_.directories) {
        const auto path = settings_.project_dir / name;
        std::error_code ec;
        if (std::filesystem::create_directories(path, ec)) {
            created.push_back(name);
        }
        if (ec) {
            ok = false;
            err() << "[Sequencer] Could not create " << path.string() << ": " << ec.message() << std::endl;
        }
    }

    // Never fatal: the services report missing mounts themselves
    record(run, Step::PrepareDirectories, ok,
           created.empty() ? "already present" : "created " + join(created), started);
}

void Sequencer::backup_database(DeploymentRun& run) {
    const std::string destination = backup_destination(settings_.backup_root, clock_());
    out() << "💾 Creating database backup (" << destination << ")..." << std::endl;
    command_step(run, Step::BackupDatabase, true, [this, &destination] {
        return orchestrator_.exec(settings_.db_service, {"mongodump", "--out", destination});
    });
}

void Sequencer::update_source(DeploymentRun& run) {
    out() << "📥 Pulling latest changes (" << source_.describe() << ")..." << std::endl;
    command_step(run, Step::UpdateSource, true, [this] {
        return source_.pull_latest();
    });
}

void Sequencer::stop_existing(DeploymentRun& run) {
    out() << "🛑 Stopping existing containers..." << std::endl;
    command_step(run, Step::StopExisting, false, [this] {
        return orchestrator_.stop_all();
    });
}

void Sequencer::pull_images(DeploymentRun& run) {
    out() << "📥 Pulling latest images..." << std::endl;
    // Locally built images have nothing to pull
    command_step(run, Step::PullImages, false, [this] {
        return orchestrator_.pull_images();
    });
}

void Sequencer::build_images(DeploymentRun& run) {
    out() << "🔨 Building images..." << std::endl;
    command_step(run, Step::BuildImages, true, [this] {
        return orchestrator_.build_images();
    });
}

void Sequencer::start_services(DeploymentRun& run) {
    out() << "🔄 Starting services..." << std::endl;
    command_step(run, Step::StartServices, true, [this] {
        return orchestrator_.start_detached();
    });
}

void Sequencer::verify(DeploymentRun& run) {
    await_readiness(run);

    out() << "🔍 Checking service status..." << std::endl;
    command_step(run, Step::CheckStatus, false, [this] {
        return orchestrator_.status();
    });

    out() << "📋 Showing recent logs..." << std::endl;
    command_step(run, Step::CollectLogs, false, [this] {
        return orchestrator_.logs(settings_.log_tail);
    });

    out() << "🏥 Performing health check (" << probe_.target() << ")..." << std::endl;
    checkpoint();
    const auto started = std::chrono::steady_clock::now();
    const HealthProbeResult health = probe_.probe();
    record(run, Step::HealthProbe, health.healthy, health.detail, started);

    const std::string compose = orchestrator_.command_name();
    const char* what = run.kind == RunKind::Update ? "Update" : "Deployment";

    if (health.healthy) {
        run.outcome = Outcome::Success;
        out() << "✅ " << what << " successful! " << settings_.service << " is running." << std::endl;
    } else {
        // Reported, not remediated: no rollback and no retry
        run.outcome = Outcome::HealthCheckFailed;
        run.error = "health check failed: " + health.detail;
        err() << "❌ Health check failed (" << health.detail << "). Please check the logs." << std::endl;
        command_step(run, Step::CollectServiceLogs, false, [this] {
            return orchestrator_.service_logs(settings_.service, settings_.log_tail);
        });
    }

    out() << "🎉 " << what << " completed!" << std::endl;
    out() << "Use '" << compose << " logs -f " << settings_.service << "' to follow logs" << std::endl;
    out() << "Use '" << compose << " down' to stop services" << std::endl;
}

void Sequencer::await_readiness(DeploymentRun& run) {
    checkpoint();
    const ReadinessPolicy policy = settings_.readiness_policy();
    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(policy.deadline).count();
    if (policy.mode == ReadinessMode::Fixed) {
        out() << "⏳ Waiting " << seconds << "s for services to be ready..." << std::endl;
    } else {
        out() << "⏳ Waiting up to " << seconds << "s for " << probe_.target() << " to answer..." << std::endl;
    }

    const auto started = std::chrono::steady_clock::now();
    ReadinessWaiter waiter(policy, probe_, sleep_, monotonic_clock_);
    const ReadinessReport report = waiter.wait();
    record(run, Step::AwaitReadiness, report.ready, report.detail, started);

    if (report.interrupted) {
        throw Interrupted();
    }
    if (!report.ready) {
        err() << "[Sequencer] Services not ready within " << seconds
              << "s (" << report.detail << "), continuing" << std::endl;
    }
}

CommandResult Sequencer::command_step(
    DeploymentRun& run,
    Step step,
    bool fatal,
    const std::function<CommandResult()>& call
) {
    checkpoint();
    const auto started = std::chrono::steady_clock::now();
    CommandResult result = call();

    if (result.interrupted) {
        record(run, step, false, "interrupted", started);
        throw Interrupted();
    }

    record(run, step, result.ok(), result.ok() ? "ok" : result.describe(), started);
    if (!result.ok()) {
        if (fatal) {
            throw CommandFailure(step, std::move(result));
        }
        err() << "[Sequencer] " << to_string(step) << " failed (" << result.describe()
              << "), continuing" << std::endl;
    }
    return result;
}

void Sequencer::checkpoint() const {
    if (stop_flag_.load()) {
        throw Interrupted();
    }
}

void Sequencer::record(
    DeploymentRun& run,
    Step step,
    bool ok,
    const std::string& detail,
    std::chrono::steady_clock::time_point started
) const {
    run.steps.push_back(StepRecord{
        step,
        ok,
        detail,
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started)
    });
}

} // namespace rollout
