#include "deployment_run.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace rollout {

const char* to_string(Step step) {
    switch (step) {
        case Step::Validate:           return "Validate";
        case Step::AcquireLock:        return "AcquireLock";
        case Step::PrepareDirectories: return "PrepareDirectories";
        case Step::BackupDatabase:     return "BackupDatabase";
        case Step::UpdateSource:       return "UpdateSource";
        case Step::StopExisting:       return "StopExisting";
        case Step::PullImages:         return "PullImages";
        case Step::BuildImages:        return "BuildImages";
        case Step::StartServices:      return "StartServices";
        case Step::AwaitReadiness:     return "AwaitReadiness";
        case Step::CheckStatus:        return "CheckStatus";
        case Step::CollectLogs:        return "CollectLogs";
        case Step::HealthProbe:        return "HealthProbe";
        case Step::CollectServiceLogs: return "CollectServiceLogs";
    }
    return "Unknown";
}

const char* to_string(Outcome outcome) {
    switch (outcome) {
        case Outcome::Success:              return "Success";
        case Outcome::HealthCheckFailed:    return "HealthCheckFailed";
        case Outcome::ConfigurationMissing: return "ConfigurationMissing";
        case Outcome::Locked:               return "Locked";
        case Outcome::BackupFailed:         return "BackupFailed";
        case Outcome::SourceUpdateFailed:   return "SourceUpdateFailed";
        case Outcome::BuildFailed:          return "BuildFailed";
        case Outcome::StartFailed:          return "StartFailed";
        case Outcome::EnvironmentError:     return "EnvironmentError";
        case Outcome::Interrupted:          return "Interrupted";
    }
    return "Unknown";
}

const char* to_string(RunKind kind) {
    return kind == RunKind::Deploy ? "deploy" : "update";
}

bool DeploymentRun::ran(Step step) const {
    return std::any_of(steps.begin(), steps.end(), [step](const StepRecord& record) {
        return record.step == step;
    });
}

std::vector<Step> DeploymentRun::step_sequence() const {
    std::vector<Step> sequence;
    sequence.reserve(steps.size());
    for (const auto& record : steps) {
        sequence.push_back(record.step);
    }
    return sequence;
}

std::chrono::milliseconds DeploymentRun::elapsed() const {
    std::chrono::milliseconds total{0};
    for (const auto& record : steps) {
        total += record.duration;
    }
    return total;
}

std::string DeploymentRun::summary() const {
    std::ostringstream oss;
    for (const auto& record : steps) {
        oss << "  " << (record.ok ? "ok    " : "failed") << "  "
            << std::left << std::setw(20) << to_string(record.step)
            << std::right << std::setw(8) << record.duration.count() << " ms";
        if (!record.detail.empty()) {
            oss << "  " << record.detail;
        }
        oss << "\n";
    }
    oss << "  outcome: " << to_string(outcome);
    return oss.str();
}

ExitCode exit_code_for(Outcome outcome, bool strict_health) {
    switch (outcome) {
        case Outcome::Success:
            return ExitCode::Success;
        case Outcome::HealthCheckFailed:
            return strict_health ? ExitCode::HealthCheckFailed : ExitCode::Success;
        case Outcome::ConfigurationMissing:
            return ExitCode::ConfigurationMissing;
        case Outcome::Locked:
            return ExitCode::Locked;
        case Outcome::BackupFailed:
        case Outcome::SourceUpdateFailed:
        case Outcome::BuildFailed:
        case Outcome::StartFailed:
            return ExitCode::CommandFailed;
        case Outcome::EnvironmentError:
            return ExitCode::EnvironmentError;
        case Outcome::Interrupted:
            return ExitCode::Interrupted;
    }
    return ExitCode::CommandFailed;
}

} // namespace rollout
