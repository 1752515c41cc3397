#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace rollout {

enum class Step {
    Validate,
    AcquireLock,
    PrepareDirectories,
    BackupDatabase,
    UpdateSource,
    StopExisting,
    PullImages,
    BuildImages,
    StartServices,
    AwaitReadiness,
    CheckStatus,
    CollectLogs,
    HealthProbe,
    CollectServiceLogs
};

enum class Outcome {
    Success,
    HealthCheckFailed,
    ConfigurationMissing,
    Locked,
    BackupFailed,
    SourceUpdateFailed,
    BuildFailed,
    StartFailed,
    EnvironmentError,   // the host itself failed us: lock file, filesystem, spawning
    Interrupted
};

enum class RunKind {
    Deploy,
    Update
};

// Process exit status of the deploy and update tools
enum class ExitCode : int {
    Success = 0,
    ConfigurationMissing = 1,
    InvalidSettings = 2,
    CommandFailed = 3,
    HealthCheckFailed = 4,
    Locked = 5,
    EnvironmentError = 6,
    Interrupted = 130
};

const char* to_string(Step step);
const char* to_string(Outcome outcome);
const char* to_string(RunKind kind);

struct StepRecord {
    Step step;
    bool ok;
    std::string detail;
    std::chrono::milliseconds duration{0};
};

struct DeploymentRun {
    RunKind kind = RunKind::Deploy;
    std::chrono::system_clock::time_point started_at;
    std::vector<StepRecord> steps;
    Outcome outcome = Outcome::Success;
    std::string error;

    bool succeeded() const {
        return outcome == Outcome::Success;
    }

    // True if the step was attempted at least once
    bool ran(Step step) const;

    std::vector<Step> step_sequence() const;

    // Sum of the recorded step durations
    std::chrono::milliseconds elapsed() const;

    // One line per step, for the closing summary
    std::string summary() const;
};

// Health failures only change the exit status in strict mode
ExitCode exit_code_for(Outcome outcome, bool strict_health);

inline int to_int(ExitCode code) {
    return static_cast<int>(code);
}

} // namespace rollout
