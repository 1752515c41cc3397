#include "compose_orchestrator.hpp"
#include <stdexcept>

namespace rollout {

ComposeOrchestrator::ComposeOrchestrator(
    const ProcessRunner& runner,
    const std::string& compose_command,
    const std::filesystem::path& project_dir,
    std::chrono::seconds timeout
)
    : runner_(runner)
    , prefix_(split_command(compose_command))
    , command_name_(compose_command)
    , project_dir_(project_dir)
    , timeout_(timeout)
{
    if (prefix_.empty()) {
        throw std::invalid_argument("compose command must not be empty");
    }
}

CommandResult ComposeOrchestrator::stop_all() {
    return compose({"down"});
}

CommandResult ComposeOrchestrator::pull_images() {
    return compose({"pull"});
}

CommandResult ComposeOrchestrator::build_images() {
    return compose({"build", "--no-cache"});
}

CommandResult ComposeOrchestrator::start_detached() {
    return compose({"up", "-d"});
}

CommandResult ComposeOrchestrator::status() {
    return compose({"ps"});
}

CommandResult ComposeOrchestrator::logs(std::size_t tail) {
    return compose({"logs", "--tail=" + std::to_string(tail)});
}

CommandResult ComposeOrchestrator::service_logs(const std::string& service, std::size_t tail) {
    return compose({"logs", "--tail=" + std::to_string(tail), service});
}

CommandResult ComposeOrchestrator::exec(const std::string& service, const std::vector<std::string>& argv) {
    // -T: no TTY, the runner pipes the output
    std::vector<std::string> args{"exec", "-T", service};
    args.insert(args.end(), argv.begin(), argv.end());
    return compose(args);
}

CommandSpec ComposeOrchestrator::make_spec(const std::vector<std::string>& args) const {
    CommandSpec spec;
    spec.program = prefix_.front();
    spec.args.assign(prefix_.begin() + 1, prefix_.end());
    spec.args.insert(spec.args.end(), args.begin(), args.end());
    spec.working_dir = project_dir_;
    spec.timeout = timeout_;
    return spec;
}

CommandResult ComposeOrchestrator::compose(const std::vector<std::string>& args) {
    return runner_.run(make_spec(args));
}

} // namespace rollout
