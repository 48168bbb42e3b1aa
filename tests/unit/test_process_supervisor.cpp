#include <chrono>
#include <csignal>
#include <signal.h>
#include <future>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/errors/toolgate_errors.hpp"
#include "process/process_supervisor.hpp"
#include "test_support.hpp"

namespace {

using namespace std::chrono_literals;
using toolgate::core::errors::ErrorCategory;
using toolgate::core::errors::get_error;
using toolgate::core::errors::get_value;
using toolgate::core::errors::is_error;
using toolgate::process::ProcessSupervisor;
using toolgate::process::SupervisorOptions;
using toolgate::protocol::ServerStatus;
using toolgate::test_support::fake_server_config;
using toolgate::test_support::wait_until;

SupervisorOptions fast_options() {
    SupervisorOptions options;
    options.handshake_timeout = 2s;
    options.stop_grace = 1s;
    options.health.probe_timeout = 500ms;
    return options;
}

TEST(ProcessSupervisorTest, StartRunsAfterSuccessfulHandshake) {
    ProcessSupervisor supervisor(fast_options());
    auto started = supervisor.start(fake_server_config("alpha"));
    ASSERT_FALSE(is_error(started));

    const auto& state = get_value(started);
    EXPECT_EQ(state.status, ServerStatus::Running);
    ASSERT_TRUE(state.process_id.has_value());
    EXPECT_TRUE(state.started_at_ms.has_value());
    EXPECT_FALSE(state.last_error.has_value());
    EXPECT_NE(supervisor.channel("alpha"), nullptr);
}

TEST(ProcessSupervisorTest, RefusesSecondStartWhileRunning) {
    ProcessSupervisor supervisor(fast_options());
    ASSERT_FALSE(is_error(supervisor.start(fake_server_config("alpha"))));

    auto again = supervisor.start(fake_server_config("alpha"));
    ASSERT_TRUE(is_error(again));
    EXPECT_EQ(get_error(again).code, "already_running");
    EXPECT_EQ(supervisor.state("alpha").status, ServerStatus::Running);
}

TEST(ProcessSupervisorTest, RefusesDisabledServer) {
    ProcessSupervisor supervisor(fast_options());
    auto config = fake_server_config("alpha");
    config.enabled = false;
    auto started = supervisor.start(config);
    ASSERT_TRUE(is_error(started));
    EXPECT_EQ(get_error(started).category, ErrorCategory::Configuration);
    EXPECT_EQ(get_error(started).code, "server_disabled");
    EXPECT_EQ(supervisor.state("alpha").status, ServerStatus::Stopped);
}

TEST(ProcessSupervisorTest, StopIsIdempotent) {
    ProcessSupervisor supervisor(fast_options());
    ASSERT_FALSE(is_error(supervisor.start(fake_server_config("alpha"))));

    auto first = supervisor.stop("alpha");
    EXPECT_EQ(first.status, ServerStatus::Stopped);
    EXPECT_FALSE(first.process_id.has_value());

    auto second = supervisor.stop("alpha");
    EXPECT_EQ(second.status, ServerStatus::Stopped);
    EXPECT_EQ(supervisor.channel("alpha"), nullptr);

    auto unknown = supervisor.stop("never-started");
    EXPECT_EQ(unknown.status, ServerStatus::Stopped);
}

TEST(ProcessSupervisorTest, FailedHandshakeLeavesErrorState) {
    auto options = fast_options();
    options.handshake_timeout = 300ms;
    ProcessSupervisor supervisor(options);

    auto started = supervisor.start(fake_server_config("alpha", {"--no-handshake"}));
    ASSERT_FALSE(is_error(started));
    const auto& state = get_value(started);
    EXPECT_EQ(state.status, ServerStatus::Error);
    EXPECT_FALSE(state.process_id.has_value());
    ASSERT_TRUE(state.last_error.has_value());
    EXPECT_NE(state.last_error->find("handshake failed"), std::string::npos);
    EXPECT_EQ(supervisor.channel("alpha"), nullptr);
}

TEST(ProcessSupervisorTest, EarlyExitLeavesErrorState) {
    ProcessSupervisor supervisor(fast_options());
    auto started = supervisor.start(fake_server_config("alpha", {"--exit-immediately"}));
    ASSERT_FALSE(is_error(started));
    const auto& state = get_value(started);
    EXPECT_EQ(state.status, ServerStatus::Error);
    ASSERT_TRUE(state.last_error.has_value());
    EXPECT_NE(state.last_error->find("process_exited"), std::string::npos);
}

TEST(ProcessSupervisorTest, MissingExecutableIsSpawnFailure) {
    ProcessSupervisor supervisor(fast_options());
    auto config = fake_server_config("alpha");
    config.command = "/nonexistent/tool-server";
    auto started = supervisor.start(config);
    ASSERT_TRUE(is_error(started));
    EXPECT_EQ(get_error(started).category, ErrorCategory::Startup);
    EXPECT_EQ(get_error(started).code, "spawn_failed");
    EXPECT_EQ(supervisor.state("alpha").status, ServerStatus::Error);
}

TEST(ProcessSupervisorTest, RestartRecoversFromError) {
    ProcessSupervisor supervisor(fast_options());
    auto config = fake_server_config("alpha", {}, 1);
    ASSERT_FALSE(is_error(supervisor.start(config)));
    const int first_pid = supervisor.state("alpha").process_id.value();

    kill(first_pid, SIGKILL);
    ASSERT_TRUE(wait_until([&]() { return supervisor.state("alpha").status == ServerStatus::Error; }, 5s));
    EXPECT_FALSE(supervisor.state("alpha").process_id.has_value());

    auto restarted = supervisor.restart(config);
    ASSERT_FALSE(is_error(restarted));
    EXPECT_EQ(get_value(restarted).status, ServerStatus::Running);
    EXPECT_NE(get_value(restarted).process_id.value(), first_pid);
}

TEST(ProcessSupervisorTest, StaysRunningAcrossHealthChecks) {
    ProcessSupervisor supervisor(fast_options());
    ASSERT_FALSE(is_error(supervisor.start(fake_server_config("alpha", {}, 1))));
    const auto first_check = supervisor.state("alpha").last_health_check_at_ms.value();

    // Three one-second cycles with no induced fault.
    for (int i = 0; i < 14; ++i) {
        std::this_thread::sleep_for(250ms);
        ASSERT_EQ(supervisor.state("alpha").status, ServerStatus::Running);
    }
    EXPECT_GT(supervisor.state("alpha").last_health_check_at_ms.value(), first_check);
}

TEST(ProcessSupervisorTest, ConcurrentOperationsEndConsistent) {
    ProcessSupervisor supervisor(fast_options());
    const auto config = fake_server_config("alpha");

    std::vector<std::future<void>> ops;
    for (int i = 0; i < 12; ++i) {
        ops.push_back(std::async(std::launch::async, [&supervisor, &config, i]() {
            switch (i % 3) {
                case 0:
                    static_cast<void>(supervisor.start(config));
                    break;
                case 1:
                    static_cast<void>(supervisor.stop(config.id));
                    break;
                default:
                    static_cast<void>(supervisor.restart(config));
                    break;
            }
        }));
    }
    for (auto& op : ops) {
        op.get();
    }

    // Whatever ran last, the state agrees with the process table.
    const auto state = supervisor.state("alpha");
    if (state.status == ServerStatus::Running) {
        EXPECT_TRUE(state.process_id.has_value());
        EXPECT_NE(supervisor.channel("alpha"), nullptr);
    } else {
        EXPECT_EQ(state.status, ServerStatus::Stopped);
        EXPECT_FALSE(state.process_id.has_value());
        EXPECT_EQ(supervisor.channel("alpha"), nullptr);
    }

    // A final stop always wins.
    EXPECT_EQ(supervisor.stop("alpha").status, ServerStatus::Stopped);
}

TEST(ProcessSupervisorTest, DifferentServersStartInParallel) {
    auto options = fast_options();
    options.handshake_timeout = 800ms;
    ProcessSupervisor supervisor(options);

    const auto began = std::chrono::steady_clock::now();
    auto slow = std::async(std::launch::async, [&]() {
        return supervisor.start(fake_server_config("hung", {"--no-handshake"}));
    });
    std::this_thread::sleep_for(50ms);
    auto fast = supervisor.start(fake_server_config("quick"));
    const auto fast_done = std::chrono::steady_clock::now() - began;

    ASSERT_FALSE(is_error(fast));
    EXPECT_EQ(get_value(fast).status, ServerStatus::Running);
    EXPECT_LT(fast_done, 700ms);
    EXPECT_EQ(get_value(slow.get()).status, ServerStatus::Error);
}

}  // namespace
