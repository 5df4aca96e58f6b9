#include <cerrno>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <signal.h>
#include <unistd.h>
#include <string>
#include <utility>
#include <vector>
#include <gtest/gtest.h>
#include "exec/command_executor.hpp"

namespace {

using shellpilot::exec::CommandExecutor;
using shellpilot::exec::ExecOptions;
using shellpilot::exec::ExecStatus;
using shellpilot::exec::StreamKind;

ExecOptions QuickOptions(int timeout_s) {
    ExecOptions options{};
    options.shell = "/bin/sh";
    options.working_dir = "/tmp";
    options.timeout = std::chrono::seconds(timeout_s);
    return options;
}

TEST(CommandExecutor, CapturesStdoutAndExitCode) {
    CommandExecutor executor(QuickOptions(10));
    const auto result = executor.Run("echo hello; echo world");
    EXPECT_EQ(result.status, ExecStatus::kExited);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_TRUE(result.Succeeded());
    EXPECT_EQ(result.output, "hello\nworld");
    EXPECT_EQ(result.ExitLabel(), "0");
}

TEST(CommandExecutor, ReportsNonZeroExitAndStderr) {
    CommandExecutor executor(QuickOptions(10));
    const auto result = executor.Run("echo broken >&2; exit 3");
    EXPECT_EQ(result.status, ExecStatus::kExited);
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_FALSE(result.Succeeded());
    EXPECT_EQ(result.error, "broken");
}

TEST(CommandExecutor, RunsInWorkingDirectory) {
    CommandExecutor executor(QuickOptions(10));
    const auto result = executor.Run("pwd");
    EXPECT_EQ(result.output, "/tmp");
}

TEST(CommandExecutor, StdinIsNotInherited) {
    CommandExecutor executor(QuickOptions(10));
    const auto result = executor.Run("cat; echo after");
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.output, "after");
}

TEST(CommandExecutor, StreamsLinesToHandler) {
    CommandExecutor executor(QuickOptions(10));
    std::vector<std::pair<StreamKind, std::string>> lines;
    const auto result = executor.Run("echo out; echo err >&2", [&](StreamKind kind, const std::string& line) {
        lines.emplace_back(kind, line);
    });
    EXPECT_TRUE(result.Succeeded());
    ASSERT_EQ(lines.size(), 2u);
    bool saw_out = false;
    bool saw_err = false;
    for (const auto& [kind, line] : lines) {
        saw_out = saw_out || (kind == StreamKind::kStdout && line == "out");
        saw_err = saw_err || (kind == StreamKind::kStderr && line == "err");
    }
    EXPECT_TRUE(saw_out);
    EXPECT_TRUE(saw_err);
}

TEST(CommandExecutor, KeepsOnlyTheTailOfLongOutput) {
    auto options = QuickOptions(10);
    options.stdout_tail = 10;
    CommandExecutor executor(options);
    const auto result = executor.Run("seq 1 1000");
    EXPECT_EQ(result.output.size(), 10u);
    EXPECT_EQ(result.output.substr(result.output.size() - 4), "1000");
}

TEST(CommandExecutor, TimeoutKillsTheCommand) {
    CommandExecutor executor(QuickOptions(1));
    const auto started = std::chrono::steady_clock::now();
    const auto result = executor.Run("sleep 30; echo never");
    const auto elapsed = std::chrono::steady_clock::now() - started;
    EXPECT_EQ(result.status, ExecStatus::kTimeout);
    EXPECT_EQ(result.ExitLabel(), "TIMEOUT");
    EXPECT_EQ(result.output.find("never"), std::string::npos);
    EXPECT_NE(result.error.find("Timed out after 1 s."), std::string::npos);
    EXPECT_LT(elapsed, std::chrono::seconds(10));
}

TEST(CommandExecutor, MissingShellIsSpawnError) {
    auto options = QuickOptions(5);
    options.shell = "/nonexistent/shellpilot-shell";
    CommandExecutor executor(options);
    const auto result = executor.Run("echo hi");
    EXPECT_EQ(result.status, ExecStatus::kSpawnError);
    EXPECT_EQ(result.ExitLabel(), "SPAWN_ERROR");
    EXPECT_FALSE(result.Succeeded());
    EXPECT_FALSE(result.error.empty());
}

TEST(CommandExecutor, TimeoutLeavesNoProcessBehind) {
    const auto pid_file = std::filesystem::temp_directory_path() /
        ("shellpilot_exec_pid_" + std::to_string(::getpid()));
    CommandExecutor executor(QuickOptions(1));
    const auto result = executor.Run("echo $$ > " + pid_file.string() + "; sleep 30");
    EXPECT_EQ(result.status, ExecStatus::kTimeout);

    pid_t shell_pid = 0;
    {
        std::ifstream in(pid_file);
        in >> shell_pid;
    }
    std::error_code ec;
    std::filesystem::remove(pid_file, ec);
    ASSERT_GT(shell_pid, 0);
    errno = 0;
    EXPECT_EQ(::kill(shell_pid, 0), -1);
    EXPECT_EQ(errno, ESRCH);
}

TEST(CommandExecutor, BackgroundChildCannotOutliveTimeout) {
    CommandExecutor executor(QuickOptions(1));
    const auto started = std::chrono::steady_clock::now();
    const auto result = executor.Run("sleep 30 & echo started");
    const auto elapsed = std::chrono::steady_clock::now() - started;
    EXPECT_LT(elapsed, std::chrono::seconds(4));
    EXPECT_EQ(result.status, ExecStatus::kExited);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.output, "started");
    EXPECT_NE(result.error.find("were stopped"), std::string::npos);
}

TEST(CommandExecutor, DetachedOutputDoesNotDelayReturn) {
    CommandExecutor executor(QuickOptions(10));
    const auto started = std::chrono::steady_clock::now();
    const auto result = executor.Run("sleep 30 >/dev/null 2>&1 & echo started");
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));
    EXPECT_EQ(result.output, "started");
    EXPECT_TRUE(result.error.empty());
}

TEST(CommandExecutor, DrainsBothStreamsPastPipeCapacity) {
    CommandExecutor executor(QuickOptions(30));
    const auto result = executor.Run(
        "head -c 200000 /dev/zero | tr '\\0' e >&2 & seq 1 50000; wait");
    EXPECT_EQ(result.status, ExecStatus::kExited);
    EXPECT_EQ(result.exit_code, 0);
    ASSERT_GE(result.output.size(), 5u);
    EXPECT_EQ(result.output.substr(result.output.size() - 5), "50000");
    EXPECT_EQ(result.error, std::string(800, 'e'));
}

TEST(CommandExecutor, TailKeepsMultibyteCharactersWhole) {
    auto options = QuickOptions(10);
    options.stdout_tail = 2000;
    CommandExecutor executor(options);
    const auto result = executor.Run(
        "i=0; while [ $i -lt 1000 ]; do printf '\\303\\251'; i=$((i+1)); done; echo x");
    ASSERT_FALSE(result.output.empty());
    EXPECT_NE(static_cast<unsigned char>(result.output.front()) & 0xC0, 0x80);
    EXPECT_EQ(result.output.back(), 'x');
    EXPECT_LE(result.output.size(), 2000u);
}

}  // namespace
