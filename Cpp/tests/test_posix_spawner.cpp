#include <gtest/gtest.h>
#include "droidbridge/errors.hpp"
#include "droidbridge/posix_spawner.hpp"
#include "droidbridge/process_runner.hpp"

#include <chrono>
#include <limits>

using namespace droidbridge;

// These tests spawn real children through /bin/sh.

TEST(FindInPathTest, FindsShell) {
    auto sh = find_in_path("sh");
    ASSERT_TRUE(sh.has_value());
    EXPECT_EQ(sh->front(), '/');
}

TEST(FindInPathTest, MissingNameIsNullopt) {
    EXPECT_FALSE(find_in_path("droidbridge-no-such-binary").has_value());
    EXPECT_FALSE(find_in_path("").has_value());
}

TEST(FindInPathTest, PathWithSlashIsCheckedDirectly) {
    EXPECT_EQ(find_in_path("/bin/sh").value_or(""), "/bin/sh");
    EXPECT_FALSE(find_in_path("/nonexistent/dir/sh").has_value());
}

TEST(DecodeWaitStatusTest, ExitCodeAndSignal) {
    EXPECT_EQ(decode_wait_status(0), 0);
    EXPECT_EQ(decode_wait_status(3 << 8), 3);
    EXPECT_EQ(decode_wait_status(9), -9);
}

TEST(ClampPollTimeoutTest, StaysWithinIntRange) {
    EXPECT_EQ(clamp_poll_timeout(-5), 0);
    EXPECT_EQ(clamp_poll_timeout(0), 0);
    EXPECT_EQ(clamp_poll_timeout(1500), 1500);
    EXPECT_EQ(clamp_poll_timeout(1LL << 32), std::numeric_limits<int>::max());
    EXPECT_EQ(clamp_poll_timeout(30LL * 24 * 3600 * 1000), std::numeric_limits<int>::max());
}

class PosixRunnerTest : public ::testing::Test {
protected:
    ProcessRunner runner{"sh -c"};
};

TEST_F(PosixRunnerTest, CapturesStdout) {
    auto result = runner.execute(CommandLine{"echo hello; echo world"});
    EXPECT_EQ(result.exit_status, 0);
    EXPECT_EQ(result.output, "hello\nworld");
    EXPECT_FALSE(result.timed_out);
}

TEST_F(PosixRunnerTest, ReportsExitCode) {
    EXPECT_EQ(runner.execute(CommandLine{"exit 7"}).exit_status, 7);
}

TEST_F(PosixRunnerTest, MergesStderrFirst) {
    auto result = runner.execute(CommandLine{"echo out; echo err >&2"});
    EXPECT_EQ(result.output, "err\nout");
}

TEST_F(PosixRunnerTest, StdinIsClosed) {
    auto result = runner.execute(CommandLine{"cat; echo done"});
    EXPECT_EQ(result.output, "done");
}

TEST_F(PosixRunnerTest, LargeOutputDoesNotDeadlock) {
    auto result = runner.execute(CommandLine{"i=0; while [ $i -lt 20000 ]; do echo line$i; echo err$i >&2; i=$((i+1)); done"});
    EXPECT_EQ(result.exit_status, 0);
    EXPECT_NE(result.output.find("line19999"), std::string::npos);
    EXPECT_NE(result.output.find("err19999"), std::string::npos);
}

TEST_F(PosixRunnerTest, TimeoutKillsLongRunningChild) {
    ExecOptions options;
    options.timeout = std::chrono::milliseconds(200);

    auto start = std::chrono::steady_clock::now();
    auto result = runner.execute(CommandLine{"sleep 5"}, options);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(result.timed_out);
    EXPECT_EQ(result.exit_status, -9);
    EXPECT_NE(result.output.find("timed out after 0.2 seconds"), std::string::npos);
    EXPECT_LT(elapsed, std::chrono::seconds(3));
    EXPECT_EQ(runner.active_processes(), 0u);
}

TEST_F(PosixRunnerTest, TimeoutOfMonthsBehavesLikeNone) {
    ExecOptions options;
    options.timeout = std::chrono::hours(24 * 30);
    auto result = runner.execute(CommandLine{"echo done"}, options);
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.output, "done");

    options.timeout = std::chrono::milliseconds::max();
    EXPECT_EQ(runner.execute(CommandLine{"echo done"}, options).output, "done");
}

TEST_F(PosixRunnerTest, ChildKilledBySignalHasNegativeStatus) {
    EXPECT_EQ(runner.execute(CommandLine{"kill -TERM $$"}).exit_status, -15);
}

TEST(PosixSpawnerTest, ExecFailureExits127) {
    PosixSpawner spawner;
    auto child = spawner.spawn({"/nonexistent/droidbridge-binary"});
    auto captured = child->communicate(std::nullopt);
    ASSERT_TRUE(captured.has_value());
    EXPECT_EQ(captured->exit_status, 127);
}

TEST(PosixSpawnerTest, EmptyArgvThrows) {
    PosixSpawner spawner;
    EXPECT_THROW(spawner.spawn({}), InvalidArgumentError);
}

TEST(PosixSpawnerTest, KillAfterReapIsRefused) {
    PosixSpawner spawner;
    auto child = spawner.spawn({"/bin/sh", "-c", "exit 0"});
    EXPECT_EQ(child->wait(), 0);
    EXPECT_FALSE(child->kill());
}

TEST(PosixSpawnerTest, KillRunningChild) {
    PosixSpawner spawner;
    auto child = spawner.spawn({"/bin/sh", "-c", "sleep 5"});
    EXPECT_TRUE(child->kill());
    EXPECT_EQ(child->wait(), -9);
}
