#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <sys/wait.h>
#include <unistd.h>

#include "lxcri/errors.h"
#include "lxcri/process.h"

TEST(SystemCommandRunnerTest, CapturesStdout) {
    SystemCommandRunner runner;
    CommandOutput output = runner.execute({"echo", "hello", "world"}, 10);
    EXPECT_TRUE(output.succeeded());
    EXPECT_EQ(output.exit_code, 0);
    EXPECT_EQ(output.stdout_output, "hello world\n");
    EXPECT_TRUE(output.stderr_output.empty());
}

TEST(SystemCommandRunnerTest, CapturesStderrAndExitCode) {
    SystemCommandRunner runner;
    CommandOutput output = runner.execute({"sh", "-c", "echo oops >&2; exit 3"}, 10);
    EXPECT_FALSE(output.succeeded());
    EXPECT_EQ(output.exit_code, 3);
    EXPECT_EQ(output.stderr_output, "oops\n");
    EXPECT_EQ(command_diagnostic(output), "oops");
}

TEST(SystemCommandRunnerTest, LargeOutputDoesNotBlock) {
    SystemCommandRunner runner;
    CommandOutput output = runner.execute({"sh", "-c", "head -c 200000 /dev/zero | tr '\\0' a"}, 10);
    EXPECT_TRUE(output.succeeded());
    EXPECT_EQ(output.stdout_output.size(), 200000u);
}

TEST(SystemCommandRunnerTest, KillsCommandAtDeadline) {
    SystemCommandRunner runner;
    auto started = std::chrono::steady_clock::now();
    CommandOutput output = runner.execute({"sleep", "10"}, 1);
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_TRUE(output.timed_out);
    EXPECT_FALSE(output.succeeded());
    EXPECT_LT(std::chrono::duration_cast<std::chrono::seconds>(elapsed).count(), 5);
    EXPECT_EQ(command_diagnostic(output), "command timed out");
}

TEST(SystemCommandRunnerTest, MissingBinaryExitsWith127) {
    SystemCommandRunner runner;
    CommandOutput output = runner.execute({"/nonexistent/lxcri-tool"}, 10);
    EXPECT_EQ(output.exit_code, 127);
    EXPECT_FALSE(output.timed_out);
}

TEST(SystemCommandRunnerTest, EmptyArgvIsRejected) {
    SystemCommandRunner runner;
    try {
        runner.execute({}, 10);
        FAIL() << "expected InvalidArgument";
    } catch (const RuntimeError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidArgument);
    }
}

TEST(CommandDiagnosticTest, PrefersStderrThenStdoutThenExitCode) {
    CommandOutput output;
    output.exit_code = 2;
    output.stdout_output = "  from stdout \n";
    EXPECT_EQ(command_diagnostic(output), "from stdout");
    output.stderr_output = "from stderr\n";
    EXPECT_EQ(command_diagnostic(output), "from stderr");
    output.stdout_output.clear();
    output.stderr_output.clear();
    EXPECT_EQ(command_diagnostic(output), "exit code 2");
}

TEST(CommandDiagnosticTest, DescribesCommandLine) {
    EXPECT_EQ(describe_command({"pct", "start", "100"}), "pct start 100");
}

TEST(WaitForProcessTest, ReportsExitStatus) {
    pid_t pid = fork();
    ASSERT_GE(pid, 0);
    if (pid == 0) {
        _exit(5);
    }
    int status = 0;
    ASSERT_TRUE(wait_for_process(pid, 5, status));
    ASSERT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 5);
}
