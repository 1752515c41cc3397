#pragma once

#include <filesystem>
#include <optional>

namespace rollout {

// Exclusive advisory lock held for the duration of a run, so two deploys
// cannot race on the same stack. Backed by flock(2); the holder's pid is
// written into the file for diagnostics.
class RunLock {
public:
    explicit RunLock(std::filesystem::path path);
    ~RunLock();

    RunLock(const RunLock&) = delete;
    RunLock& operator=(const RunLock&) = delete;

    // Non-blocking. Returns false if another holder has the lock; throws
    // DeployError if the lock file cannot be opened.
    bool try_acquire();
    void release() noexcept;

    bool held() const { return fd_ >= 0; }
    const std::filesystem::path& path() const { return path_; }

    // Pid recorded by the current holder, if any
    std::optional<long> holder_pid() const;

private:
    std::filesystem::path path_;
    int fd_ = -1;
};

} // namespace rollout
