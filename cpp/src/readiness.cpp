#include "readiness.hpp"
#include <algorithm>
#include <thread>

namespace rollout {

bool interruptible_sleep(std::chrono::milliseconds duration, const std::atomic<bool>& stop_flag) {
    constexpr std::chrono::milliseconds slice{100};
    const auto deadline = std::chrono::steady_clock::now() + duration;
    while (!stop_flag.load()) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return true;
        }
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(slice, deadline - now));
    }
    return false;
}

ReadinessWaiter::ReadinessWaiter(const ReadinessPolicy& policy, HealthProbe& probe, SleepFunction sleep,
                                 MonotonicClock clock)
    : policy_(policy)
    , probe_(probe)
    , sleep_(std::move(sleep))
    , clock_(std::move(clock))
{
    // A zero backoff would never consume the deadline
    if (policy_.initial_backoff.count() <= 0) {
        policy_.initial_backoff = std::chrono::milliseconds(1);
    }
    policy_.max_backoff = std::max(policy_.max_backoff, policy_.initial_backoff);
}

ReadinessReport ReadinessWaiter::wait() {
    return policy_.mode == ReadinessMode::Fixed ? wait_fixed() : poll_until_ready();
}

ReadinessReport ReadinessWaiter::wait_fixed() {
    ReadinessReport report;
    if (!sleep_(policy_.deadline)) {
        report.interrupted = true;
        report.detail = "interrupted during fixed delay";
        return report;
    }
    report.ready = true;
    report.waited = policy_.deadline;
    report.detail = "waited " + std::to_string(policy_.deadline.count() / 1000) + "s";
    return report;
}

ReadinessReport ReadinessWaiter::poll_until_ready() {
    ReadinessReport report;
    auto backoff = policy_.initial_backoff;
    const auto started = clock_();
    const auto deadline = started + policy_.deadline;

    // Time spent on each health check counts against the deadline too
    for (;;) {
        ++report.attempts;
        const HealthProbeResult result = probe_.probe();
        const auto now = clock_();
        report.waited = std::chrono::duration_cast<std::chrono::milliseconds>(now - started);
        if (result.healthy) {
            report.ready = true;
            report.detail = "ready after " + std::to_string(report.attempts) + " probe(s)";
            return report;
        }

        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        if (remaining.count() <= 0) {
            report.detail = "not ready after " + std::to_string(report.attempts)
                          + " probe(s): " + result.detail;
            return report;
        }

        const auto nap = std::min(backoff, remaining);
        if (!sleep_(nap)) {
            report.interrupted = true;
            report.waited = std::chrono::duration_cast<std::chrono::milliseconds>(clock_() - started);
            report.detail = "interrupted while waiting for readiness";
            return report;
        }
        backoff = std::min(backoff * 2, policy_.max_backoff);
    }
}

} // namespace rollout
