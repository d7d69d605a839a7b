#include <gtest/gtest.h>

#include "process_runner.hpp"

#include <signal.h>

#include <chrono>
#include <future>
#include <thread>

using namespace toolbridge;

TEST(PosixProcessRunner, CapturesStdout) {
    PosixProcessRunner runner;
    CancellationToken token;

    ProcessResult result = runner.run({"/bin/sh", "-c", "echo hello"}, token);

    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_text, "hello\n");
    EXPECT_TRUE(result.stderr_text.empty());
    EXPECT_FALSE(result.cancelled);
}

TEST(PosixProcessRunner, SeparatesStderrAndExitCode) {
    PosixProcessRunner runner;
    CancellationToken token;

    ProcessResult result = runner.run({"/bin/sh", "-c", "echo out; echo err >&2; exit 3"}, token);

    EXPECT_EQ(result.exit_code, 3);
    EXPECT_EQ(result.stdout_text, "out\n");
    EXPECT_EQ(result.stderr_text, "err\n");
}

TEST(PosixProcessRunner, ArgumentsAreNotInterpretedByAShell) {
    PosixProcessRunner runner;
    CancellationToken token;

    ProcessResult result = runner.run({"/bin/echo", "$HOME; rm -rf /tmp/x"}, token);

    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_text, "$HOME; rm -rf /tmp/x\n");
}

TEST(PosixProcessRunner, MissingExecutableExitsWith127) {
    PosixProcessRunner runner;
    CancellationToken token;

    ProcessResult result = runner.run({"toolbridge-no-such-binary-xyz"}, token);

    EXPECT_EQ(result.exit_code, 127);
    EXPECT_NE(result.stderr_text.find("failed to execute"), std::string::npos);
}

TEST(PosixProcessRunner, EmptyArgvThrows) {
    PosixProcessRunner runner;
    CancellationToken token;

    EXPECT_THROW(runner.run({}, token), ProcessError);
}

TEST(PosixProcessRunner, CancellationKillsProcessGroup) {
    PosixProcessRunner runner(std::chrono::milliseconds(10));
    CancellationToken token;

    auto started = std::chrono::steady_clock::now();
    auto pending = std::async(std::launch::async, [&runner, &token]() {
        // The grandchild sleep holds the pipes open too; only a group kill ends both.
        return runner.run({"/bin/sh", "-c", "sleep 30 & sleep 30; wait"}, token);
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    token.cancel();

    ASSERT_EQ(pending.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    ProcessResult result = pending.get();
    EXPECT_TRUE(result.cancelled);
    EXPECT_NE(result.exit_code, 0);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));
}

TEST(PosixProcessRunner, CancellationReachesChildThatClosedItsPipes) {
    PosixProcessRunner runner(std::chrono::milliseconds(10));
    CancellationToken token;

    auto pending = std::async(std::launch::async, [&runner, &token]() {
        return runner.run({"/bin/sh", "-c", "exec >&- 2>&-; sleep 30"}, token);
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    auto cancelled_at = std::chrono::steady_clock::now();
    token.cancel();

    ASSERT_EQ(pending.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    ProcessResult result = pending.get();
    EXPECT_TRUE(result.cancelled);
    EXPECT_EQ(result.exit_code, 128 + SIGKILL);
    EXPECT_LT(std::chrono::steady_clock::now() - cancelled_at, std::chrono::seconds(2));
}
