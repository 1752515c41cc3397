#include "source_repository.hpp"

namespace rollout {

GitSourceRepository::GitSourceRepository(
    const ProcessRunner& runner,
    const std::filesystem::path& work_tree,
    const std::string& remote,
    const std::string& branch,
    std::chrono::seconds timeout
)
    : runner_(runner)
    , work_tree_(work_tree)
    , remote_(remote)
    , branch_(branch)
    , timeout_(timeout)
{
}

CommandResult GitSourceRepository::pull_latest() {
    CommandSpec spec;
    spec.program = "git";
    spec.args = {"pull", remote_, branch_};
    spec.working_dir = work_tree_;
    spec.timeout = timeout_;
    return runner_.run(spec);
}

std::string GitSourceRepository::describe() const {
    return "git " + remote_ + "/" + branch_;
}

} // namespace rollout
