#include "termination_controller.hpp"
#include "fakes.hpp"

#include <gtest/gtest.h>
#include <sstream>

using namespace stackstop;
using namespace stackstop::fakes;
using namespace std::chrono_literals;

namespace {

class TerminationControllerTest : public ::testing::Test {
protected:
    TerminationControllerTest()
        : system(&clock), reporter(output), controller(&system, &clock, &reporter) {}

    FakeClock clock;
    FakeSystem system;
    std::ostringstream output;
    Reporter reporter;
    TerminationController controller;
};

} // namespace

TEST_F(TerminationControllerTest, dead_pid_is_not_running_and_never_signaled) {
    const auto report = controller.terminate(321, "Redis (cache)", 5s);

    EXPECT_EQ(report.outcome, Outcome::not_running);
    EXPECT_FALSE(report.failed());
    EXPECT_TRUE(system.signals.empty());
    EXPECT_NE(output.str().find("Redis (cache): Process not running (PID: 321)"), std::string::npos);
}

TEST_F(TerminationControllerTest, zero_pid_is_never_a_target) {
    const auto report = controller.terminate(0, "Bench Worker", 10s);

    EXPECT_EQ(report.outcome, Outcome::not_running);
    EXPECT_TRUE(system.signals.empty());
    EXPECT_EQ(system.probes, 0);
}

TEST_F(TerminationControllerTest, exits_within_two_seconds) {
    system.spawn(321).exits_after_term = 2s;

    const auto report = controller.terminate(321, "Redis (cache)", 5s);

    EXPECT_EQ(report.outcome, Outcome::stopped_gracefully);
    EXPECT_EQ(report.polls, 2);
    EXPECT_FALSE(report.forced);
    EXPECT_EQ(system.count_signals(false), 1);
    EXPECT_EQ(system.count_signals(true), 0);
    EXPECT_EQ(clock.now, 2s);
    EXPECT_NE(output.str().find("Redis (cache): Stopped successfully"), std::string::npos);
}

TEST_F(TerminationControllerTest, immediate_exit_needs_no_polling) {
    system.spawn(10).exits_after_term = 0ms;

    const auto report = controller.terminate(10, "Bench Worker", 10s);

    EXPECT_EQ(report.outcome, Outcome::stopped_gracefully);
    EXPECT_EQ(report.polls, 0);
    EXPECT_TRUE(clock.sleeps.empty());
}

TEST_F(TerminationControllerTest, polls_once_per_second_up_to_timeout) {
    auto& process = system.spawn(10);
    process.exits_after_term = std::nullopt;

    const auto report = controller.terminate(10, "Bench Worker", 10s);

    EXPECT_EQ(report.polls, 10);
    // ten polls plus the grace period after SIGKILL
    ASSERT_EQ(clock.sleeps.size(), 11u);
    for (const auto sleep : clock.sleeps) {
        EXPECT_EQ(sleep, 1000ms);
    }
    EXPECT_NE(output.str().find("(PID: 10)...\n..........\n[WARN]"), std::string::npos);
}

TEST_F(TerminationControllerTest, ignored_sigterm_is_force_killed_once) {
    system.spawn(55).exits_after_term = std::nullopt;

    const auto report = controller.terminate(55, "Bench Serve", 10s);

    EXPECT_EQ(report.outcome, Outcome::force_killed);
    EXPECT_TRUE(report.forced);
    EXPECT_FALSE(report.failed());
    EXPECT_EQ(system.count_signals(false), 1);
    EXPECT_EQ(system.count_signals(true), 1);
    EXPECT_NE(output.str().find("Bench Serve: Still running after 10s, forcing shutdown..."), std::string::npos);
    EXPECT_NE(output.str().find("Bench Serve: Force killed"), std::string::npos);
}

TEST_F(TerminationControllerTest, process_surviving_sigkill_fails) {
    auto& process = system.spawn(66);
    process.exits_after_term = std::nullopt;
    process.dies_on_kill = false;

    const auto report = controller.terminate(66, "Socket.io", 5s);

    EXPECT_EQ(report.outcome, Outcome::kill_failed);
    EXPECT_TRUE(report.failed());
    EXPECT_EQ(report.error, ErrorKind::escalation_exhausted);
    EXPECT_EQ(system.count_signals(true), 1);
    EXPECT_EQ(clock.now, 6s);
    EXPECT_NE(output.str().find("[ERROR] Socket.io: Failed to kill process (PID: 66)"), std::string::npos);
}

TEST_F(TerminationControllerTest, zero_timeout_escalates_without_polling) {
    system.spawn(7).exits_after_term = std::nullopt;

    const auto report = controller.terminate(7, "Yarn Watch", 0s);

    EXPECT_EQ(report.outcome, Outcome::force_killed);
    EXPECT_EQ(report.polls, 0);
    EXPECT_EQ(clock.sleeps.size(), 1u);
}

TEST_F(TerminationControllerTest, permission_denied_on_sigterm) {
    system.spawn(1).term_status = SignalStatus::permission_denied;

    const auto report = controller.terminate(1, "Redis (queue)", 5s);

    EXPECT_EQ(report.outcome, Outcome::kill_failed);
    EXPECT_EQ(report.error, ErrorKind::signal_permission_denied);
    EXPECT_EQ(system.count_signals(true), 0);
    EXPECT_TRUE(clock.sleeps.empty());
}

TEST_F(TerminationControllerTest, vanished_before_sigterm_is_already_stopped) {
    system.spawn(8).term_status = SignalStatus::target_vanished;

    const auto report = controller.terminate(8, "Redis (socketio)", 5s);

    EXPECT_EQ(report.outcome, Outcome::not_running);
    EXPECT_EQ(report.error, ErrorKind::signal_target_vanished);
    EXPECT_FALSE(report.failed());
}

TEST_F(TerminationControllerTest, permission_denied_on_sigkill) {
    auto& process = system.spawn(9);
    process.exits_after_term = std::nullopt;
    process.kill_status = SignalStatus::permission_denied;

    const auto report = controller.terminate(9, "Bench Watch", 3s);

    EXPECT_EQ(report.outcome, Outcome::kill_failed);
    EXPECT_EQ(report.error, ErrorKind::signal_permission_denied);
    EXPECT_EQ(system.count_signals(true), 1);
}
