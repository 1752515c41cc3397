#include "run_lock.hpp"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iostream>
#include <string>

#include <fcntl.h>
#include <signal.h>
#include <sys/file.h>
#include <unistd.h>

#include "deploy_error.hpp"

namespace rollout {

RunLock::RunLock(std::filesystem::path path)
    : path_(std::move(path))
{
}

RunLock::~RunLock() {
    release();
}

bool RunLock::try_acquire() {
    if (held()) {
        return true;
    }

    int fd = ::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw DeployError("cannot open lock file " + path_.string() + ": " + std::strerror(errno));
    }

    if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
        const int err = errno;
        ::close(fd);
        if (err == EWOULDBLOCK) {
            return false;
        }
        throw DeployError("cannot lock " + path_.string() + ": " + std::strerror(err));
    }

    fd_ = fd;
    const std::string pid = std::to_string(::getpid()) + "\n";
    if (::ftruncate(fd_, 0) != 0 || ::write(fd_, pid.data(), pid.size()) < 0) {
        std::cerr << "[RunLock] Could not record pid in " << path_.string()
                  << ": " << std::strerror(errno) << std::endl;
    }
    return true;
}

void RunLock::release() noexcept {
    if (fd_ < 0) {
        return;
    }
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
    fd_ = -1;
}

std::optional<long> RunLock::holder_pid() const {
    std::ifstream file(path_);
    if (!file) {
        return std::nullopt;
    }
    long pid = 0;
    file >> pid;
    // A pid left behind by a finished run is stale
    if (pid <= 0 || ::kill(static_cast<pid_t>(pid), 0) != 0) {
        return std::nullopt;
    }
    return pid;
}

} // namespace rollout
