#include <gtest/gtest.h>

#include <csignal>
#include <cstdint>
#include <string>

#include <fcntl.h>
#include <unistd.h>

#include "sandbox/process_runner.hpp"
#include "test_support.hpp"

using runbox::sandbox::ExecResult;
using runbox::sandbox::ExecSpec;
using runbox::sandbox::kSentinelExitCode;
using runbox::sandbox::ProcessRunner;
using runbox::testing::TempDir;

namespace {

ExecSpec Shell(const TempDir& dir, const std::string& script) {
    ExecSpec spec{};
    spec.command = {"/bin/sh", "-c", script};
    spec.working_dir = dir.Path();
    spec.timeout = std::chrono::seconds(5);
    return spec;
}

}  // namespace

TEST(ProcessRunner, CapturesStreamsSeparately) {
    TempDir dir;
    const auto result = ProcessRunner::Run(Shell(dir, "echo out; echo err 1>&2"));
    EXPECT_FALSE(result.spawn_failed);
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.output, "out\n");
    EXPECT_EQ(result.error, "err\n");
    EXPECT_FALSE(result.output_truncated);
    EXPECT_FALSE(result.error_truncated);
}

TEST(ProcessRunner, ReportsRealExitCode) {
    TempDir dir;
    const auto result = ProcessRunner::Run(Shell(dir, "exit 7"));
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.exit_code, 7);
    EXPECT_EQ(result.term_signal, 0);
}

TEST(ProcessRunner, ReportsSignalDeath) {
    TempDir dir;
    const auto result = ProcessRunner::Run(Shell(dir, "kill -9 $$"));
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.term_signal, SIGKILL);
    EXPECT_EQ(result.exit_code, 128 + SIGKILL);
}

TEST(ProcessRunner, FeedsStdinThenCloses) {
    TempDir dir;
    ExecSpec spec{};
    spec.command = {"cat"};
    spec.working_dir = dir.Path();
    spec.stdin_text = "hello\nworld";
    const auto result = ProcessRunner::Run(spec);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.output, "hello\nworld");
}

TEST(ProcessRunner, EmptyStdinSignalsEndOfInput) {
    TempDir dir;
    ExecSpec spec{};
    spec.command = {"cat"};
    spec.working_dir = dir.Path();
    spec.timeout = std::chrono::seconds(3);
    const auto result = ProcessRunner::Run(spec);
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_TRUE(result.output.empty());
}

TEST(ProcessRunner, ChildMayIgnoreItsInput) {
    TempDir dir;
    auto spec = Shell(dir, "exit 3");
    spec.stdin_text.assign(1 << 20, 'x');
    const auto result = ProcessRunner::Run(spec);
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.exit_code, 3);
}

TEST(ProcessRunner, ArgumentsAreNotInterpretedByAShell) {
    TempDir dir;
    ExecSpec spec{};
    spec.command = {"echo", "$(touch pwned)", ";", "rm", "-rf", "*"};
    spec.working_dir = dir.Path();
    const auto result = ProcessRunner::Run(spec);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.output, "$(touch pwned) ; rm -rf *\n");
    EXPECT_FALSE(std::filesystem::exists(dir.Path() / "pwned"));
}

TEST(ProcessRunner, RunsInsideWorkingDirectory) {
    TempDir dir;
    const auto result = ProcessRunner::Run(Shell(dir, "pwd -P"));
    EXPECT_EQ(result.output, std::filesystem::canonical(dir.Path()).string() + "\n");
}

TEST(ProcessRunner, TimeoutKillsProcessAndDescendants) {
    TempDir dir;
    auto spec = Shell(dir, "sleep 30 & echo $!; wait");
    spec.timeout = std::chrono::seconds(1);
    const auto started = std::chrono::steady_clock::now();
    const auto result = ProcessRunner::Run(spec);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_TRUE(result.timed_out);
    EXPECT_EQ(result.exit_code, kSentinelExitCode);
    EXPECT_GE(elapsed, std::chrono::milliseconds(900));
    EXPECT_LT(elapsed, std::chrono::seconds(4));

    ASSERT_FALSE(result.output.empty());
    const auto background_pid = static_cast<pid_t>(std::stol(result.output));
    EXPECT_TRUE(runbox::testing::WaitUntilGone(background_pid, std::chrono::seconds(2)));
}

TEST(ProcessRunner, TimeoutAppliesAfterStreamsAreClosed) {
    TempDir dir;
    auto spec = Shell(dir, "exec >&- 2>&-; sleep 30");
    spec.timeout = std::chrono::seconds(1);
    const auto started = std::chrono::steady_clock::now();
    const auto result = ProcessRunner::Run(spec);
    EXPECT_TRUE(result.timed_out);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(4));
}

TEST(ProcessRunner, LeftoverBackgroundWorkIsReclaimed) {
    TempDir dir;
    // The root exits at once while a grandchild keeps the pipes open.
    auto spec = Shell(dir, "sleep 30 & echo $!");
    spec.timeout = std::chrono::seconds(1);
    const auto result = ProcessRunner::Run(spec);
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.exit_code, 0);
    ASSERT_FALSE(result.output.empty());
    const auto background_pid = static_cast<pid_t>(std::stol(result.output));
    EXPECT_TRUE(runbox::testing::WaitUntilGone(background_pid, std::chrono::seconds(2)));
}

TEST(ProcessRunner, TruncatesAtCapButKeepsDraining) {
    TempDir dir;
    auto spec = Shell(dir, "head -c 1000000 /dev/zero | tr '\\000' a");
    spec.max_output_chars = 50000;
    const auto result = ProcessRunner::Run(spec);
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.output.size(), 50000u);
    EXPECT_EQ(result.output, std::string(50000, 'a'));
    EXPECT_TRUE(result.output_truncated);
    EXPECT_FALSE(result.error_truncated);
}

TEST(ProcessRunner, LargeOutputOnBothStreamsDoesNotDeadlock) {
    TempDir dir;
    auto spec = Shell(dir, "head -c 300000 /dev/zero >&2; head -c 300000 /dev/zero");
    spec.max_output_chars = 1 << 20;
    spec.stdin_text.assign(300000, 'i');
    const auto result = ProcessRunner::Run(spec);
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.output.size(), 300000u);
    EXPECT_EQ(result.error.size(), 300000u);
}

TEST(ProcessRunner, MissingProgramIsASpawnFailure) {
    TempDir dir;
    ExecSpec spec{};
    spec.command = {"runbox-no-such-program"};
    spec.working_dir = dir.Path();
    const auto result = ProcessRunner::Run(spec);
    EXPECT_TRUE(result.spawn_failed);
    EXPECT_EQ(result.exit_code, kSentinelExitCode);

    spec.command = {"/nonexistent/runbox/program"};
    EXPECT_TRUE(ProcessRunner::Run(spec).spawn_failed);

    spec.command.clear();
    EXPECT_TRUE(ProcessRunner::Run(spec).spawn_failed);
}

TEST(ProcessRunner, CpuLimitStopsBusyLoop) {
    TempDir dir;
    auto spec = Shell(dir, "while :; do :; done");
    spec.timeout = std::chrono::seconds(10);
    spec.limits.cpu_seconds = 1;
    const auto result = ProcessRunner::Run(spec);
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.term_signal, SIGXCPU);
}

TEST(ProcessRunner, DescendantOutsideTheGroupCannotOutliveDeadline) {
    if (!runbox::testing::HasProgram("setsid")) {
        GTEST_SKIP() << "setsid not installed";
    }
    TempDir dir;
    auto spec = Shell(dir, "setsid sleep 30 & echo $!");
    spec.timeout = std::chrono::seconds(2);
    const auto started = std::chrono::steady_clock::now();
    const auto result = ProcessRunner::Run(spec);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_FALSE(result.output.empty());
    const auto escaped_pid = static_cast<pid_t>(std::stol(result.output));
    ::kill(escaped_pid, SIGKILL);

    EXPECT_LT(elapsed, std::chrono::seconds(3));
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.exit_code, 0);
}

TEST(ProcessRunner, TruncatesOnCodePointBoundary) {
    TempDir dir;
    // four two-byte characters
    auto spec = Shell(dir, "printf '\\303\\251\\303\\251\\303\\251\\303\\251'");
    spec.max_output_chars = 3;
    const auto result = ProcessRunner::Run(spec);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.output, "\xC3\xA9\xC3\xA9\xC3\xA9");
    EXPECT_TRUE(result.output_truncated);
}

TEST(ProcessRunner, ChildStartsWithDefaultSigpipe) {
    TempDir dir;
    ExecSpec spec{};
    spec.command = {"grep", "SigIgn", "/proc/self/status"};
    spec.working_dir = dir.Path();
    const auto result = ProcessRunner::Run(spec);
    ASSERT_EQ(result.exit_code, 0);
    const auto tab = result.output.find('\t');
    ASSERT_NE(tab, std::string::npos);
    const auto ignored = std::stoull(result.output.substr(tab + 1), nullptr, 16);
    EXPECT_EQ(ignored & (std::uint64_t{1} << (SIGPIPE - 1)), 0u);
}

TEST(ProcessRunner, UnrelatedDescriptorsAreNotInherited) {
    TempDir dir;
    const int leaked = ::open("/dev/null", O_RDONLY);
    ASSERT_GE(leaked, 3);
    const auto fd = std::to_string(leaked);
    const auto result = ProcessRunner::Run(Shell(dir, "if [ -e /proc/self/fd/" + fd + " ]; then echo open; else echo closed; fi"));
    ::close(leaked);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.output, "closed\n");
}
