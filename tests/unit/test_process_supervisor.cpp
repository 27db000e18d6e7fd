/**
 * @file test_process_supervisor.cpp
 * @brief Unit tests for PosixSupervisor: resolution, pipes, signals, groups.
 */

#include "executor/process_supervisor.hpp"

#include "sandbox/sandbox_builder.hpp"
#include "support/fixtures.hpp"

#include <gtest/gtest.h>
#include <chrono>
#include <csignal>
#include <thread>

using namespace proc_sandbox;
using proc_sandbox::testing::ScratchDirTest;

namespace fs = std::filesystem;

namespace {

const std::map<std::string, std::string> kSystemPath{{"PATH", "/usr/bin:/bin"}};

ProcessOutcome run(const PosixSupervisor& supervisor, SpawnRequest request) {
    auto handle = supervisor.spawn(request);
    EXPECT_TRUE(handle.has_value()) << (handle ? "" : handle.error().message);
    if (!handle) return {};
    return supervisor.wait(**handle, std::stop_token{});
}

}  // anonymous namespace

class PosixSupervisorTest : public ScratchDirTest {
protected:
    PosixSupervisor supervisor_{std::chrono::milliseconds{200}};

    SpawnRequest shell(const std::string& script) const {
        return SpawnRequest{.argv = {"/bin/sh", "-c", script}, .env = {}, .cwd = temp_dir_};
    }
};

TEST_F(PosixSupervisorTest, ResolvesAbsolutePath) {
    auto resolved = PosixSupervisor::resolve_executable("/bin/sh", {}, temp_dir_);
    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(*resolved, fs::path("/bin/sh"));
}

TEST_F(PosixSupervisorTest, ResolvesThroughDeclaredPath) {
    auto resolved = PosixSupervisor::resolve_executable("sh", kSystemPath, temp_dir_);
    ASSERT_TRUE(resolved.has_value()) << resolved.error().message;
    EXPECT_EQ(resolved->filename(), "sh");
}

TEST_F(PosixSupervisorTest, NoDeclaredPathSearchesSystemDefault) {
    auto default_path = PosixSupervisor::default_search_path();
    EXPECT_NE(default_path.find("/bin"), std::string::npos);

    auto resolved = PosixSupervisor::resolve_executable("sh", {}, temp_dir_);
    ASSERT_TRUE(resolved.has_value()) << resolved.error().message;
    EXPECT_EQ(resolved->filename(), "sh");
    EXPECT_TRUE(resolved->is_absolute());
}

TEST_F(PosixSupervisorTest, UnknownNameIsNotFound) {
    auto resolved = PosixSupervisor::resolve_executable("ps-no-such-tool", {}, temp_dir_);
    ASSERT_FALSE(resolved.has_value());
    EXPECT_EQ(resolved.error().kind, ErrorKind::ExecutableNotFound);
    EXPECT_NE(resolved.error().message.find("Failed to execute"), std::string::npos);
    EXPECT_NE(resolved.error().message.find("'ps-no-such-tool'"), std::string::npos);
}

TEST_F(PosixSupervisorTest, DeclaredPathReplacesSystemDefault) {
    auto resolved = PosixSupervisor::resolve_executable("sh", {{"PATH", temp_dir_.string()}},
                                                        temp_dir_);
    ASSERT_FALSE(resolved.has_value());
    EXPECT_EQ(resolved.error().kind, ErrorKind::ExecutableNotFound);
}

TEST_F(PosixSupervisorTest, RelativeNameResolvesAgainstWorkingDirectory) {
    auto tool = temp_dir_ / "tool";
    ASSERT_TRUE(write_file(tool, "#!/bin/sh\necho tool\n", true));

    auto resolved = PosixSupervisor::resolve_executable("./tool", {}, temp_dir_);
    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(*resolved, temp_dir_ / "./tool");
}

TEST_F(PosixSupervisorTest, SpawnUnknownProgramFailsBeforeForking) {
    SpawnRequest request{.argv = {"echo-but-with-a-typo"}, .env = kSystemPath, .cwd = temp_dir_};
    auto handle = supervisor_.spawn(request);
    ASSERT_FALSE(handle.has_value());
    EXPECT_EQ(handle.error().kind, ErrorKind::ExecutableNotFound);
    EXPECT_NE(handle.error().message.find("echo-but-with-a-typo"), std::string::npos);
}

TEST_F(PosixSupervisorTest, CapturesStdoutStderrAndExitCode) {
    auto outcome = run(supervisor_, shell("echo -n foo; echo -n bar >&2; exit 1"));
    EXPECT_EQ(outcome.stdout_bytes, "foo");
    EXPECT_EQ(outcome.stderr_bytes, "bar");
    EXPECT_EQ(outcome.exit_code, 1);
    EXPECT_FALSE(outcome.group_terminated);
}

TEST_F(PosixSupervisorTest, RunsInRequestedDirectory) {
    auto outcome = run(supervisor_, shell("pwd"));
    EXPECT_EQ(outcome.stdout_bytes, fs::canonical(temp_dir_).string() + "\n");
}

TEST_F(PosixSupervisorTest, EnvironmentIsExactlyDeclared) {
    SpawnRequest request{.argv = {"/usr/bin/env"}, .env = {{"FOO", "foo"}, {"BAR", "not foo"}},
                         .cwd = temp_dir_};
    auto outcome = run(supervisor_, request);
    EXPECT_EQ(outcome.stdout_bytes, "BAR=not foo\nFOO=foo\n");
}

TEST_F(PosixSupervisorTest, StdinIsDevNull) {
    auto outcome = run(supervisor_, shell("/bin/cat"));
    EXPECT_EQ(outcome.exit_code, 0);
    EXPECT_TRUE(outcome.stdout_bytes.empty());
}

TEST_F(PosixSupervisorTest, SignalDeathIsNegativeExitCode) {
    auto outcome = run(supervisor_, shell("kill $$"));
    EXPECT_EQ(outcome.exit_code, -15);
    EXPECT_TRUE(outcome.stdout_bytes.empty());
    EXPECT_TRUE(outcome.stderr_bytes.empty());
}

TEST_F(PosixSupervisorTest, LargeOutputIsCapturedInFull) {
    auto outcome = run(supervisor_, shell("/usr/bin/head -c 1000000 /dev/zero"));
    EXPECT_EQ(outcome.exit_code, 0);
    EXPECT_EQ(outcome.stdout_bytes.size(), 1000000u);
}

TEST_F(PosixSupervisorTest, TerminateGroupSignalsOnce) {
    auto handle = supervisor_.spawn(shell("/bin/sleep 10 & wait"));
    ASSERT_TRUE(handle.has_value());

    EXPECT_TRUE(supervisor_.terminate_group(**handle));
    EXPECT_FALSE(supervisor_.terminate_group(**handle));

    auto start = std::chrono::steady_clock::now();
    auto outcome = supervisor_.wait(**handle, std::stop_token{});
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds{5});
    EXPECT_EQ(outcome.exit_code, -15);
    EXPECT_TRUE(outcome.group_terminated);
    EXPECT_TRUE((*handle)->finished());
    EXPECT_FALSE(supervisor_.terminate_group(**handle));
}

TEST_F(PosixSupervisorTest, StopTokenTerminatesGroup) {
    auto handle = supervisor_.spawn(shell("/bin/sleep 10"));
    ASSERT_TRUE(handle.has_value());

    std::stop_source stop;
    std::jthread canceller([&stop] {
        std::this_thread::sleep_for(std::chrono::milliseconds{100});
        stop.request_stop();
    });

    auto outcome = supervisor_.wait(**handle, stop.get_token());
    EXPECT_TRUE(outcome.group_terminated);
    EXPECT_EQ(outcome.exit_code, -15);
}

TEST_F(PosixSupervisorTest, IgnoredTermEscalatesToKill) {
    auto handle = supervisor_.spawn(shell("trap '' TERM; /bin/sleep 10"));
    ASSERT_TRUE(handle.has_value());

    // Give the shell time to install its trap before signalling.
    std::stop_source stop;
    std::jthread canceller([&stop] {
        std::this_thread::sleep_for(std::chrono::milliseconds{300});
        stop.request_stop();
    });

    auto start = std::chrono::steady_clock::now();
    auto outcome = supervisor_.wait(**handle, stop.get_token());
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds{5});
    EXPECT_EQ(outcome.exit_code, -9);
}

TEST_F(PosixSupervisorTest, DroppedHandleKillsProcess) {
    pid_t pid = 0;
    {
        auto handle = supervisor_.spawn(shell("/bin/sleep 10"));
        ASSERT_TRUE(handle.has_value());
        pid = (*handle)->pid();
    }
    EXPECT_NE(::kill(pid, 0), 0);
}
