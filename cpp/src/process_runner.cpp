#include "process_runner.hpp"
#include <array>
#include <cerrno>
#include <cstring>
#include <functional>
#include <iostream>
#include <sstream>
#include <system_error>
#include <thread>

#include <boost/asio.hpp>
#include <boost/process.hpp>

#include <signal.h>

namespace asio = boost::asio;
namespace bp = boost::process;

namespace {

void append_tail(std::string& dst, const char* src, std::size_t n, std::size_t limit, bool& truncated) {
    dst.append(src, n);
    if (dst.size() > limit) {
        dst.erase(0, dst.size() - limit);
        truncated = true;
    }
}

}

namespace rollout {

std::string CommandResult::describe() const {
    if (!error.empty()) {
        return "failed to start: " + error;
    }
    if (interrupted) {
        return "interrupted";
    }
    if (timed_out) {
        return "timed out";
    }
    return "exit code " + std::to_string(exit_code);
}

std::string format_command(const CommandSpec& spec) {
    std::ostringstream oss;
    oss << spec.program;
    for (const auto& arg : spec.args) {
        oss << " " << arg;
    }
    return oss.str();
}

std::vector<std::string> split_command(const std::string& command) {
    std::vector<std::string> parts;
    std::istringstream iss(command);
    std::string part;
    while (iss >> part) {
        parts.push_back(part);
    }
    return parts;
}

ProcessRunner::ProcessRunner(const std::atomic<bool>& stop_flag, std::ostream& echo)
    : stop_flag_(stop_flag)
    , echo_(echo)
{
}

CommandResult ProcessRunner::run(const CommandSpec& spec) const {
    CommandResult result;

    boost::filesystem::path exe = spec.program;
    if (spec.program.find('/') == std::string::npos) {
        exe = bp::search_path(spec.program);
    }
    if (exe.empty()) {
        result.exit_code = 127;
        result.error = spec.program + ": command not found";
        return result;
    }

    const std::filesystem::path working_dir =
        spec.working_dir.empty() ? std::filesystem::current_path() : spec.working_dir;

    asio::io_context ioc;
    bp::async_pipe pipe(ioc);
    bp::child child;

    try {
        child = bp::child(
            bp::exe(exe.string()),
            bp::args(spec.args),
            bp::start_dir(working_dir.string()),
            bp::std_in < bp::null,
            (bp::std_out & bp::std_err) > pipe
        );
    } catch (const bp::process_error& e) {
        result.exit_code = 127;
        result.error = e.what();
        return result;
    }

    std::array<char, 4096> buffer{};
    bool eof = false;

    // Output is echoed chunk by chunk so the operator sees the tool's own
    // progress while the tail is kept for error reports.
    std::function<void()> read_more = [&]() {
        pipe.async_read_some(
            asio::buffer(buffer),
            [&](const boost::system::error_code& ec, std::size_t bytes_transferred) {
                if (bytes_transferred > 0) {
                    echo_.write(buffer.data(), static_cast<std::streamsize>(bytes_transferred));
                    echo_.flush();
                    append_tail(result.output, buffer.data(), bytes_transferred,
                                spec.max_output_bytes, result.truncated);
                }
                if (ec) {
                    eof = true;
                    return;
                }
                read_more();
            }
        );
    };
    read_more();

    const auto poll = std::chrono::milliseconds(POLL_INTERVAL_MS);
    const auto deadline = std::chrono::steady_clock::now() + spec.timeout;

    auto running = [&child]() {
        std::error_code ec;
        return child.running(ec);
    };
    auto pump = [&]() {
        if (!eof) {
            ioc.run_for(poll);
        } else {
            std::this_thread::sleep_for(poll);
        }
    };

    // The child's exit ends the run, not the end of output: a background
    // grandchild may keep the pipe open long after the child is gone.
    while (running()) {
        if (stop_flag_.load()) {
            result.interrupted = true;
            break;
        }
        if (spec.timeout.count() > 0 && std::chrono::steady_clock::now() >= deadline) {
            result.timed_out = true;
            break;
        }
        pump();
    }

    if (result.interrupted || result.timed_out) {
        // SIGTERM first so the tool can clean up, SIGKILL once the grace runs out
        if (::kill(child.id(), SIGTERM) != 0 && errno != ESRCH) {
            std::cerr << "[ProcessRunner] Failed to signal " << spec.program
                      << ": " << std::strerror(errno) << std::endl;
        }
        const auto grace_end = std::chrono::steady_clock::now() + spec.terminate_grace;
        while (running() && std::chrono::steady_clock::now() < grace_end) {
            pump();
        }
        if (running()) {
            std::cerr << "[ProcessRunner] " << spec.program << " ignored SIGTERM, killing it" << std::endl;
            std::error_code ec;
            child.terminate(ec);
            if (ec) {
                std::cerr << "[ProcessRunner] Failed to terminate " << spec.program
                          << ": " << ec.message() << std::endl;
            }
        }
    }

    const auto drain_end = std::chrono::steady_clock::now() + std::chrono::milliseconds(DRAIN_GRACE_MS);
    while (!eof && std::chrono::steady_clock::now() < drain_end) {
        ioc.run_for(poll);
    }
    if (!eof) {
        boost::system::error_code ignored;
        pipe.close(ignored);
        ioc.restart();
        ioc.run();
    }

    std::error_code wait_ec;
    child.wait(wait_ec);

    if (result.interrupted) {
        result.exit_code = 130;
    } else if (result.timed_out) {
        result.exit_code = 124;
    } else {
        result.exit_code = child.exit_code();
    }
    return result;
}

} // namespace rollout
