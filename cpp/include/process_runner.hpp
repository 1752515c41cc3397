#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <iosfwd>
#include <string>
#include <vector>

namespace rollout {

struct CommandSpec {
    std::string program;
    std::vector<std::string> args;
    std::filesystem::path working_dir;
    std::chrono::seconds timeout{0};   // 0 = no limit
    std::size_t max_output_bytes = 64 * 1024;
    std::chrono::seconds terminate_grace{10};  // SIGTERM to SIGKILL
};

struct CommandResult {
    int exit_code = 0;
    std::string output;                // merged stdout/stderr, tail only
    bool truncated = false;
    bool interrupted = false;
    bool timed_out = false;
    std::string error;                 // set when the process could not be started

    bool ok() const {
        return error.empty() && !interrupted && !timed_out && exit_code == 0;
    }

    std::string describe() const;
};

// "docker-compose build --no-cache"
std::string format_command(const CommandSpec& spec);

// Splits a command prefix such as "docker compose" on whitespace
std::vector<std::string> split_command(const std::string& command);

// Runs external commands to completion, echoing their output as it arrives.
// The stop flag is polled while the child runs; once it is raised the child
// gets SIGTERM, then SIGKILL after its grace period, and the result is marked
// interrupted.
class ProcessRunner {
public:
    ProcessRunner(const std::atomic<bool>& stop_flag, std::ostream& echo);

    CommandResult run(const CommandSpec& spec) const;

private:
    static constexpr int POLL_INTERVAL_MS = 100;
    static constexpr int DRAIN_GRACE_MS = 500;

    const std::atomic<bool>& stop_flag_;
    std::ostream& echo_;
};

} // namespace rollout
