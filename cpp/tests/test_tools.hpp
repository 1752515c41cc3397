#pragma once

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#include "health_probe.hpp"
#include "orchestrator.hpp"
#include "process_runner.hpp"
#include "source_repository.hpp"

namespace test {

    //
    // Temporary directory removed on destruction
    //
    class TempDir {
    public:
        TempDir() : dir_(make_dir()) {
        }

        ~TempDir() {
            std::error_code ec;
            std::filesystem::remove_all(dir_, ec);
            if (ec) {
                std::cerr << "Failed to clean up temporary directory " << dir_ << std::endl;
            }
        }

        TempDir(const TempDir&) = delete;
        TempDir& operator=(const TempDir&) = delete;

        const std::filesystem::path& path() const {
            return dir_;
        }

        std::filesystem::path write(const std::string& name, const std::string& content) const {
            const auto file = dir_ / name;
            std::ofstream out(file, std::ios::trunc);
            out << content;
            return file;
        }

    private:
        static std::filesystem::path make_dir() {
            const auto base = std::filesystem::temp_directory_path();
            std::random_device rd;
            std::mt19937 gen(rd());
            for (int i = 0; i < 1000; ++i) {
                const auto candidate = base / ("rollout-test-" + std::to_string(gen()));
                if (std::filesystem::create_directory(candidate)) {
                    return candidate;
                }
            }
            throw std::runtime_error("Tried too many times creating temporary directory");
        }

        std::filesystem::path dir_;
    };

    inline rollout::CommandResult succeeded(const std::string& output = "") {
        rollout::CommandResult result;
        result.output = output;
        return result;
    }

    inline rollout::CommandResult failed(int exit_code, const std::string& output = "") {
        rollout::CommandResult result;
        result.exit_code = exit_code;
        result.output = output;
        return result;
    }

    inline rollout::CommandResult interrupted() {
        rollout::CommandResult result;
        result.exit_code = 130;
        result.interrupted = true;
        return result;
    }

    //
    // Orchestrator double. Every call is appended to a journal shared with
    // the other doubles so tests can assert on the global call order.
    //
    class FakeOrchestrator : public rollout::Orchestrator {
    public:
        explicit FakeOrchestrator(std::vector<std::string>& journal) : journal_(journal) {
        }

        // Result returned for the named operation ("down", "build", ...)
        void fail(const std::string& op, rollout::CommandResult result) {
            results_[op] = std::move(result);
        }

        bool running() const {
            return running_;
        }

        std::vector<std::vector<std::string>> exec_calls;
        std::vector<std::size_t> log_tails;

        // Makes "down" fail while nothing is running, as some compose versions do
        bool refuse_stop_when_stopped = false;

        rollout::CommandResult stop_all() override {
            if (refuse_stop_when_stopped && !running_) {
                journal_.push_back("down");
                return failed(1, "no containers to stop");
            }
            auto result = call("down");
            if (result.ok()) {
                running_ = false;
            }
            return result;
        }

        rollout::CommandResult pull_images() override {
            return call("pull");
        }

        rollout::CommandResult build_images() override {
            return call("build");
        }

        rollout::CommandResult start_detached() override {
            auto result = call("up");
            if (result.ok()) {
                running_ = true;
            }
            return result;
        }

        rollout::CommandResult status() override {
            return call("ps");
        }

        rollout::CommandResult logs(std::size_t tail) override {
            log_tails.push_back(tail);
            return call("logs");
        }

        rollout::CommandResult service_logs(const std::string& service, std::size_t tail) override {
            log_tails.push_back(tail);
            return call("logs " + service);
        }

        rollout::CommandResult exec(const std::string& service, const std::vector<std::string>& argv) override {
            std::vector<std::string> full{service};
            full.insert(full.end(), argv.begin(), argv.end());
            exec_calls.push_back(full);
            return call("exec " + service);
        }

        std::string command_name() const override {
            return "docker-compose";
        }

    private:
        rollout::CommandResult call(const std::string& op) {
            journal_.push_back(op);
            auto it = results_.find(op);
            return it == results_.end() ? succeeded() : it->second;
        }

        std::vector<std::string>& journal_;
        std::map<std::string, rollout::CommandResult> results_;
        bool running_ = false;
    };

    //
    // Probe double answering from a script; the last answer repeats
    //
    class FakeProbe : public rollout::HealthProbe {
    public:
        explicit FakeProbe(std::vector<std::string>& journal) : journal_(journal) {
        }

        void answer(std::vector<bool> healthy) {
            answers_ = std::move(healthy);
        }

        int calls() const {
            return calls_;
        }

        rollout::HealthProbeResult probe() override {
            journal_.push_back("probe");
            if (on_call) {
                on_call();
            }
            const bool healthy = answers_.empty()
                ? true
                : answers_[std::min<std::size_t>(calls_, answers_.size() - 1)];
            ++calls_;

            rollout::HealthProbeResult result;
            result.healthy = healthy;
            result.status = healthy ? 200 : 0;
            result.detail = healthy ? "HTTP 200 OK" : "connect: Connection refused";
            return result;
        }

        std::string target() const override {
            return "http://localhost/health";
        }

        // Runs inside every call, e.g. to let a fake clock pass
        std::function<void()> on_call;

    private:
        std::vector<std::string>& journal_;
        std::vector<bool> answers_;
        int calls_ = 0;
    };

    class FakeSource : public rollout::SourceRepository {
    public:
        explicit FakeSource(std::vector<std::string>& journal) : journal_(journal) {
        }

        rollout::CommandResult result = succeeded();

        rollout::CommandResult pull_latest() override {
            journal_.push_back("git pull");
            return result;
        }

        std::string describe() const override {
            return "git origin/main";
        }

    private:
        std::vector<std::string>& journal_;
    };

} // namespace test
