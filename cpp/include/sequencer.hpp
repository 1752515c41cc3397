#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <iostream>
#include <string>
#include <vector>

#include "deployment_run.hpp"
#include "health_probe.hpp"
#include "orchestrator.hpp"
#include "readiness.hpp"
#include "run_lock.hpp"
#include "settings.hpp"
#include "source_repository.hpp"

namespace rollout {

// "/backup" + 2026-10-19 14:03:07 -> "/backup/20261019_140307" (local time)
std::string backup_destination(const std::string& root, std::chrono::system_clock::time_point when);

// Runs the fixed deploy and update lifecycles against a service stack.
//
// Deploy:  Validate, AcquireLock, PrepareDirectories, StopExisting,
//          PullImages, BuildImages, StartServices, AwaitReadiness,
//          CheckStatus, CollectLogs, HealthProbe [, CollectServiceLogs]
// Update:  Validate, AcquireLock, BackupDatabase, UpdateSource,
//          StopExisting, BuildImages, StartServices [, verification tail]
//
// Fatal failures end the run early and are reported through the Outcome;
// run() and run_update() do not throw. Host-level errors such as a lock file
// that cannot be opened end the run as EnvironmentError.
class Sequencer {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    Sequencer(
        const Settings& settings,
        Orchestrator& orchestrator,
        HealthProbe& probe,
        SourceRepository& source,
        const std::atomic<bool>& stop_flag
    );

    void set_sleep(SleepFunction sleep) { sleep_ = std::move(sleep); }
    void set_clock(Clock clock) { clock_ = std::move(clock); }
    void set_monotonic_clock(MonotonicClock clock) { monotonic_clock_ = std::move(clock); }
    void set_output(std::ostream& out, std::ostream& err) {
        out_ = &out;
        err_ = &err;
    }

    DeploymentRun run();
    DeploymentRun run_update();

private:
    DeploymentRun execute(RunKind kind, const std::function<void(DeploymentRun&)>& lifecycle);

    void validate(DeploymentRun& run);
    void acquire_lock(DeploymentRun& run, RunLock& lock);
    void prepare_directories(DeploymentRun& run);
    void backup_database(DeploymentRun& run);
    void update_source(DeploymentRun& run);
    void stop_existing(DeploymentRun& run);
    void pull_images(DeploymentRun& run);
    void build_images(DeploymentRun& run);
    void start_services(DeploymentRun& run);
    void verify(DeploymentRun& run);
    void await_readiness(DeploymentRun& run);

    CommandResult command_step(
        DeploymentRun& run,
        Step step,
        bool fatal,
        const std::function<CommandResult()>& call
    );

    void checkpoint() const;
    void record(DeploymentRun& run, Step step, bool ok, const std::string& detail,
                std::chrono::steady_clock::time_point started) const;

    std::ostream& out() const { return *out_; }
    std::ostream& err() const { return *err_; }

    const Settings& settings_;
    Orchestrator& orchestrator_;
    HealthProbe& probe_;
    SourceRepository& source_;
    const std::atomic<bool>& stop_flag_;

    SleepFunction sleep_;
    Clock clock_;
    MonotonicClock monotonic_clock_;
    std::ostream* out_ = &std::cout;
    std::ostream* err_ = &std::cerr;
};

} // namespace rollout
