#include <gtest/gtest.h>

#include "system/process_runner.hpp"
#include "system/signals.hpp"

#include <chrono>
#include <csignal>

namespace repack {
namespace {

TEST(ProcessRunnerTest, ReportsZeroExit) {
    ProcessRunner runner;
    CommandOutcome out;
    auto res = runner.Run({.argv = {"/bin/sh", "-c", "exit 0"}}, out);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_TRUE(out.Succeeded());
    EXPECT_EQ(out.exit_code, 0);
}

TEST(ProcessRunnerTest, ReportsNonZeroExit) {
    ProcessRunner runner;
    CommandOutcome out;
    auto res = runner.Run({.argv = {"/bin/sh", "-c", "exit 3"}}, out);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_FALSE(out.Succeeded());
    EXPECT_EQ(out.exit_code, 3);
    EXPECT_EQ(out.StatusCode(), 3);
    EXPECT_EQ(out.Describe(), "exit code 3");
}

TEST(ProcessRunnerTest, ReportsTerminatingSignal) {
    ProcessRunner runner;
    CommandOutcome out;
    auto res = runner.Run({.argv = {"/bin/sh", "-c", "kill -KILL $$"}}, out);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_FALSE(out.Succeeded());
    EXPECT_EQ(out.term_signal, SIGKILL);
    EXPECT_EQ(out.StatusCode(), 128 + SIGKILL);
}

TEST(ProcessRunnerTest, MissingExecutableFailsToLaunch) {
    ProcessRunner runner;
    CommandOutcome out;
    auto res = runner.Run({.argv = {"/nonexistent/definitely-not-here"}}, out);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.err, 127);
    EXPECT_NE(res.msg.find("cannot execute"), std::string::npos);
}

TEST(ProcessRunnerTest, EmptyCommandIsRejected) {
    ProcessRunner runner;
    CommandOutcome out;
    EXPECT_FALSE(runner.Run({}, out).is_ok());
}

TEST(ProcessRunnerTest, TimeoutTerminatesChild) {
    ProcessRunner runner;
    CommandOutcome out;
    const auto start = std::chrono::steady_clock::now();
    auto res = runner.Run({.argv = {"/bin/sh", "-c", "sleep 30"}, .timeout = std::chrono::seconds{1}}, out);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_TRUE(out.timed_out);
    EXPECT_FALSE(out.Succeeded());
    EXPECT_LT(elapsed, std::chrono::seconds{10});
}

TEST(ProcessRunnerTest, VeryLongTimeoutDoesNotFireEarly) {
    ProcessRunner runner;
    for (const auto timeout : {kMaxStepTimeout, std::chrono::seconds(10000000000LL)}) {
        CommandOutcome out;
        auto res = runner.Run({.argv = {"/bin/sh", "-c", "sleep 1"}, .timeout = timeout}, out);
        ASSERT_TRUE(res.is_ok()) << res.msg;
        EXPECT_FALSE(out.timed_out) << timeout.count();
        EXPECT_TRUE(out.Succeeded()) << out.Describe();
    }
}

TEST(ProcessRunnerTest, PendingSignalInterruptsChild) {
    ClearPendingSignal();
    g_pending_signal.store(SIGTERM);

    ProcessRunner runner;
    CommandOutcome out;
    auto res = runner.Run({.argv = {"/bin/sh", "-c", "sleep 30"}}, out);
    ClearPendingSignal();

    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_TRUE(out.interrupted);
    EXPECT_FALSE(out.Succeeded());
}

TEST(SignalsTest, HandlerRecordsSignalAndKeepsRunning) {
    ClearPendingSignal();
    InstallSignalHandlers();

    ASSERT_EQ(std::raise(SIGHUP), 0);
    EXPECT_TRUE(CancelRequested());
    EXPECT_EQ(PendingSignal(), SIGHUP);

    ClearPendingSignal();
    EXPECT_FALSE(CancelRequested());
}

TEST(ProcessRunnerTest, FormatCommandQuotesArgumentsWithSpaces) {
    EXPECT_EQ(FormatCommand({"tool", "a b", "c"}), "tool 'a b' c");
}

} // namespace
} // namespace repack
