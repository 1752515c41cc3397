#pragma once

#include <chrono>
#include <filesystem>
#include <string>

#include "process_runner.hpp"

namespace rollout {

// Where the deployable sources come from. The update path fetches the latest
// revision before rebuilding.
class SourceRepository {
public:
    virtual ~SourceRepository() = default;

    virtual CommandResult pull_latest() = 0;
    virtual std::string describe() const = 0;
};

class GitSourceRepository : public SourceRepository {
public:
    GitSourceRepository(
        const ProcessRunner& runner,
        const std::filesystem::path& work_tree,
        const std::string& remote,
        const std::string& branch,
        std::chrono::seconds timeout
    );

    CommandResult pull_latest() override;
    std::string describe() const override;

private:
    const ProcessRunner& runner_;
    std::filesystem::path work_tree_;
    std::string remote_;
    std::string branch_;
    std::chrono::seconds timeout_;
};

} // namespace rollout
