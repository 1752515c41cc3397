#include <catch2/catch.hpp>
#include <algorithm>
#include <filesystem>
#include <string>
#include <vector>

#include "deployment_run.hpp"
#include "run_lock.hpp"
#include "stack_fixture.hpp"

using rollout::Outcome;
using rollout::Step;

// NOLINTBEGIN
SCENARIO("Deploying a stack", "[sequencer]") {
    GIVEN("A project without its env file") {
        test::StackFixture stack;
        std::filesystem::remove(stack.dir.path() / ".env");

        WHEN("A deploy is run") {
            auto run = stack.deploy();

            THEN("It stops at validation without touching the stack") {
                REQUIRE(run.outcome == Outcome::ConfigurationMissing);
                REQUIRE(stack.journal.empty());
                REQUIRE(run.step_sequence() == std::vector<Step>{Step::Validate});
            }

            THEN("No directory or lock file is created") {
                REQUIRE_FALSE(std::filesystem::exists(stack.dir.path() / "logs"));
                REQUIRE_FALSE(std::filesystem::exists(stack.settings.lock_file_path()));
            }

            THEN("The operator is told how to fix it") {
                REQUIRE(run.error.find(".env file not found") != std::string::npos);
                REQUIRE(stack.err.str().find(".env.example") != std::string::npos);
                REQUIRE(rollout::exit_code_for(run.outcome, false) == rollout::ExitCode::ConfigurationMissing);
            }
        }
    }

    GIVEN("A healthy stack") {
        test::StackFixture stack;

        WHEN("A deploy is run") {
            auto run = stack.deploy();

            THEN("Every lifecycle step runs once in order") {
                REQUIRE(run.outcome == Outcome::Success);
                REQUIRE(run.step_sequence() == std::vector<Step>{
                    Step::Validate,
                    Step::AcquireLock,
                    Step::PrepareDirectories,
                    Step::StopExisting,
                    Step::PullImages,
                    Step::BuildImages,
                    Step::StartServices,
                    Step::AwaitReadiness,
                    Step::CheckStatus,
                    Step::CollectLogs,
                    Step::HealthProbe,
                });
                REQUIRE(stack.journal == std::vector<std::string>{
                    "down", "pull", "build", "up", "probe", "ps", "logs", "probe"
                });
            }

            THEN("The run exits 0 and the stack is left running") {
                REQUIRE(rollout::exit_code_for(run.outcome, true) == rollout::ExitCode::Success);
                REQUIRE(stack.orchestrator.running());
                REQUIRE(stack.naps.empty());
            }

            THEN("The working directories exist") {
                REQUIRE(std::filesystem::is_directory(stack.dir.path() / "logs"));
                REQUIRE(std::filesystem::is_directory(stack.dir.path() / "ssl"));
            }

            THEN("Logs are bounded by the configured tail") {
                REQUIRE(stack.orchestrator.log_tails == std::vector<std::size_t>{50});
            }

            THEN("Follow-up hints are printed") {
                REQUIRE(stack.out.str().find("Deployment completed!") != std::string::npos);
                REQUIRE(stack.out.str().find("docker-compose logs -f bot") != std::string::npos);
                REQUIRE(stack.out.str().find("docker-compose down") != std::string::npos);
            }

            THEN("The lock is released afterwards") {
                rollout::RunLock lock(stack.settings.lock_file_path());
                REQUIRE(lock.try_acquire());
            }
        }

        WHEN("It is deployed twice") {
            auto first = stack.deploy();
            auto second = stack.deploy();

            THEN("Both runs succeed and the directories survive") {
                REQUIRE(first.succeeded());
                REQUIRE(second.succeeded());
                REQUIRE(std::filesystem::is_directory(stack.dir.path() / "logs"));
                REQUIRE(std::filesystem::is_directory(stack.dir.path() / "ssl"));
                REQUIRE(second.steps[2].step == Step::PrepareDirectories);
                REQUIRE(second.steps[2].ok);
                REQUIRE(second.steps[2].detail == "already present");
            }
        }
    }

    GIVEN("A stack whose stop command fails") {
        test::StackFixture stack;
        stack.orchestrator.fail("down", test::failed(1, "no such project"));

        WHEN("A deploy is run") {
            auto run = stack.deploy();

            THEN("The failure is logged and the deploy carries on") {
                REQUIRE(run.outcome == Outcome::Success);
                REQUIRE_FALSE(run.steps[3].ok);
                REQUIRE(run.ran(Step::StartServices));
                REQUIRE(stack.err.str().find("StopExisting failed") != std::string::npos);
            }
        }
    }

    GIVEN("A stack whose image pull fails") {
        test::StackFixture stack;
        stack.orchestrator.fail("pull", test::failed(1));

        WHEN("A deploy is run") {
            auto run = stack.deploy();

            THEN("Locally built images still get started") {
                REQUIRE(run.outcome == Outcome::Success);
                REQUIRE(run.ran(Step::BuildImages));
                REQUIRE(run.ran(Step::StartServices));
            }
        }
    }

    GIVEN("A stack whose build fails") {
        test::StackFixture stack;
        stack.orchestrator.fail("build", test::failed(2, "Step 4/9 : RUN npm ci\nnpm ERR! missing script\n"));

        WHEN("A deploy is run") {
            auto run = stack.deploy();

            THEN("Nothing after the build is invoked") {
                REQUIRE(run.outcome == Outcome::BuildFailed);
                REQUIRE(stack.journal == std::vector<std::string>{"down", "pull", "build"});
                REQUIRE_FALSE(run.ran(Step::StartServices));
                REQUIRE_FALSE(run.ran(Step::AwaitReadiness));
                REQUIRE_FALSE(run.ran(Step::CheckStatus));
                REQUIRE_FALSE(run.ran(Step::CollectLogs));
                REQUIRE_FALSE(run.ran(Step::HealthProbe));
                REQUIRE(stack.probe.calls() == 0);
            }

            THEN("The tool's output is shown verbatim") {
                REQUIRE(stack.err.str().find("npm ERR! missing script") != std::string::npos);
                REQUIRE(run.error == "BuildImages failed: exit code 2");
            }

            THEN("It maps to the command failure exit code") {
                REQUIRE(rollout::exit_code_for(run.outcome, false) == rollout::ExitCode::CommandFailed);
            }
        }
    }

    GIVEN("A stack whose start fails") {
        test::StackFixture stack;
        stack.orchestrator.fail("up", test::failed(1));

        WHEN("A deploy is run") {
            auto run = stack.deploy();

            THEN("No verification happens") {
                REQUIRE(run.outcome == Outcome::StartFailed);
                REQUIRE(run.step_sequence().back() == Step::StartServices);
                REQUIRE(stack.probe.calls() == 0);
            }
        }
    }

    GIVEN("A service that never answers its health endpoint") {
        test::StackFixture stack;
        stack.probe.answer({false});

        WHEN("A deploy is run") {
            auto run = stack.deploy();

            THEN("The run completes with a health failure") {
                REQUIRE(run.outcome == Outcome::HealthCheckFailed);
                REQUIRE(run.ran(Step::CheckStatus));
                REQUIRE(run.ran(Step::CollectLogs));
                REQUIRE(run.error.find("Connection refused") != std::string::npos);
            }

            THEN("The service's own logs are dumped last") {
                REQUIRE(run.step_sequence().back() == Step::CollectServiceLogs);
                REQUIRE(stack.journal.back() == "logs bot");
                REQUIRE(stack.err.str().find("Please check the logs") != std::string::npos);
            }

            THEN("The closing line and both hints are still printed") {
                REQUIRE(stack.out.str().find("Deployment completed!") != std::string::npos);
                REQUIRE(stack.out.str().find("docker-compose logs -f bot") != std::string::npos);
                REQUIRE(stack.out.str().find("docker-compose down") != std::string::npos);
            }

            THEN("The readiness wait never exceeds its deadline") {
                REQUIRE(stack.slept() == std::chrono::milliseconds(30000));
                for (const auto& nap : stack.naps) {
                    REQUIRE(nap <= std::chrono::milliseconds(5000));
                }
            }

            THEN("The exit status depends on strict mode") {
                REQUIRE(rollout::exit_code_for(run.outcome, false) == rollout::ExitCode::Success);
                REQUIRE(rollout::exit_code_for(run.outcome, true) == rollout::ExitCode::HealthCheckFailed);
            }
        }
    }

    GIVEN("A service that becomes healthy on the third probe") {
        test::StackFixture stack;
        stack.probe.answer({false, false, true});

        WHEN("A deploy is run") {
            auto run = stack.deploy();

            THEN("Polling stops at the first healthy answer") {
                REQUIRE(run.outcome == Outcome::Success);
                REQUIRE(stack.naps == std::vector<std::chrono::milliseconds>{
                    std::chrono::milliseconds(1000), std::chrono::milliseconds(2000)
                });
                REQUIRE(stack.probe.calls() == 4);
            }
        }
    }

    GIVEN("The fixed readiness delay") {
        test::StackFixture stack;
        stack.settings.readiness_mode = rollout::ReadinessMode::Fixed;
        stack.settings.readiness_window = std::chrono::seconds(30);

        WHEN("A deploy is run") {
            auto run = stack.deploy();

            THEN("It waits the whole window and probes once") {
                REQUIRE(run.succeeded());
                REQUIRE(stack.naps == std::vector<std::chrono::milliseconds>{std::chrono::milliseconds(30000)});
                REQUIRE(stack.probe.calls() == 1);
            }
        }
    }

    GIVEN("Another run holding the lock") {
        test::StackFixture stack;
        rollout::RunLock other(stack.settings.lock_file_path());
        REQUIRE(other.try_acquire());

        WHEN("A deploy is run") {
            auto run = stack.deploy();

            THEN("It refuses to start") {
                REQUIRE(run.outcome == Outcome::Locked);
                REQUIRE(stack.journal.empty());
                REQUIRE(run.step_sequence() == std::vector<Step>{Step::Validate, Step::AcquireLock});
                REQUIRE(rollout::exit_code_for(run.outcome, false) == rollout::ExitCode::Locked);
            }

            THEN("The holder is named") {
                REQUIRE(run.error.find("held by pid") != std::string::npos);
            }
        }
    }

    GIVEN("A lock path that cannot be opened as a file") {
        test::StackFixture stack;
        std::filesystem::create_directory(stack.settings.lock_file_path());

        WHEN("A deploy is run") {
            auto run = stack.deploy();

            THEN("The run ends as an environment error without touching the stack") {
                REQUIRE(run.outcome == Outcome::EnvironmentError);
                REQUIRE(stack.journal.empty());
                REQUIRE(run.step_sequence() == std::vector<Step>{Step::Validate, Step::AcquireLock});
                REQUIRE_FALSE(run.steps.back().ok);
                REQUIRE(run.error.find("cannot open lock file") != std::string::npos);
                REQUIRE(rollout::to_int(rollout::exit_code_for(run.outcome, false)) == 6);
            }

            THEN("The closing summary is still printed") {
                REQUIRE(stack.out.str().find("finished: EnvironmentError") != std::string::npos);
            }
        }
    }
}

SCENARIO("Stopping a stack is idempotent", "[sequencer]") {
    GIVEN("A compose tool that complains when nothing is running") {
        test::StackFixture stack;
        stack.orchestrator.refuse_stop_when_stopped = true;

        WHEN("The stack is deployed twice") {
            auto first = stack.deploy();
            auto second = stack.deploy();

            THEN("The complaint on a stopped stack does not stop the first deploy") {
                REQUIRE(first.outcome == Outcome::Success);
                REQUIRE(first.steps[3].step == Step::StopExisting);
                REQUIRE_FALSE(first.steps[3].ok);
                REQUIRE(first.ran(Step::StartServices));
            }

            THEN("The second deploy stops the running stack and starts it again") {
                REQUIRE(second.outcome == Outcome::Success);
                REQUIRE(second.steps[3].step == Step::StopExisting);
                REQUIRE(second.steps[3].ok);
                REQUIRE(std::count(stack.journal.begin(), stack.journal.end(), "down") == 2);
                REQUIRE(stack.orchestrator.running());
            }
        }
    }

    GIVEN("A stack that is not running") {
        test::StackFixture stack;

        WHEN("A deploy is run") {
            auto run = stack.deploy();

            THEN("The initial stop succeeds") {
                REQUIRE(run.steps[3].step == Step::StopExisting);
                REQUIRE(run.steps[3].ok);
            }
        }
    }
}

SCENARIO("Interrupting a deploy", "[sequencer]") {
    GIVEN("A stop request arriving during the build") {
        test::StackFixture stack;
        stack.orchestrator.fail("build", test::interrupted());

        WHEN("A deploy is run") {
            auto run = stack.deploy();

            THEN("No further step is started") {
                REQUIRE(run.outcome == Outcome::Interrupted);
                REQUIRE(stack.journal == std::vector<std::string>{"down", "pull", "build"});
                REQUIRE(rollout::exit_code_for(run.outcome, false) == rollout::ExitCode::Interrupted);
            }

            THEN("The operator is pointed at the stack state") {
                REQUIRE(stack.err.str().find("docker-compose ps") != std::string::npos);
            }
        }
    }

    GIVEN("A stop request raised before the run") {
        test::StackFixture stack;
        stack.stop = true;

        WHEN("A deploy is run") {
            auto run = stack.deploy();

            THEN("Nothing is invoked") {
                REQUIRE(run.outcome == Outcome::Interrupted);
                REQUIRE(stack.journal.empty());
            }
        }
    }

    GIVEN("A stop request arriving during the readiness wait") {
        test::StackFixture stack;
        stack.probe.answer({false});
        auto sequencer = stack.make_sequencer();
        sequencer.set_sleep([&stack](std::chrono::milliseconds) {
            stack.stop = true;
            return false;
        });

        WHEN("A deploy is run") {
            auto run = sequencer.run();

            THEN("Verification is abandoned") {
                REQUIRE(run.outcome == Outcome::Interrupted);
                REQUIRE(run.step_sequence().back() == Step::AwaitReadiness);
                REQUIRE_FALSE(run.ran(Step::CheckStatus));
            }
        }
    }
}
// NOLINTEND
