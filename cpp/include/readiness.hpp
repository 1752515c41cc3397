#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <string>

#include "health_probe.hpp"

namespace rollout {

enum class ReadinessMode {
    Poll,   // probe until healthy or the deadline is spent
    Fixed   // blind delay of the whole deadline
};

struct ReadinessPolicy {
    ReadinessMode mode = ReadinessMode::Poll;
    std::chrono::milliseconds deadline{30000};
    std::chrono::milliseconds initial_backoff{1000};
    std::chrono::milliseconds max_backoff{5000};
};

struct ReadinessReport {
    bool ready = false;
    bool interrupted = false;
    int attempts = 0;
    std::chrono::milliseconds waited{0};
    std::string detail;
};

// Returns false when the sleep was cut short by a stop request
using SleepFunction = std::function<bool(std::chrono::milliseconds)>;

// Source of "now" for deadlines, steady_clock unless a test injects one
using MonotonicClock = std::function<std::chrono::steady_clock::time_point()>;

// Sleeps in short slices so a raised stop flag ends the wait promptly
bool interruptible_sleep(std::chrono::milliseconds duration, const std::atomic<bool>& stop_flag);

class ReadinessWaiter {
public:
    ReadinessWaiter(const ReadinessPolicy& policy, HealthProbe& probe, SleepFunction sleep,
                    MonotonicClock clock = [] { return std::chrono::steady_clock::now(); });

    ReadinessReport wait();

private:
    ReadinessReport wait_fixed();
    ReadinessReport poll_until_ready();

    ReadinessPolicy policy_;
    HealthProbe& probe_;
    SleepFunction sleep_;
    MonotonicClock clock_;
};

} // namespace rollout
