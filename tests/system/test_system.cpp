#include "gtest/gtest.h"
#include "system/system.hpp"
#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <random>
#include <sys/stat.h>

using namespace leakscan;
using namespace leakscan::system;
namespace fs = std::filesystem;

TEST(ProcessExecution, CapturesStdout) {
    ProcessResult res = runProcess({"echo", "hello leakscan"});
    ASSERT_TRUE(res.launched);
    ASSERT_FALSE(res.timedOut);
    ASSERT_EQ(res.exitCode, 0);
    ASSERT_EQ(res.output, "hello leakscan\n");
}

TEST(ProcessExecution, ReportsExitCode) {
    ProcessResult res = runProcess({"sh", "-c", "echo partial; exit 3"});
    ASSERT_TRUE(res.launched);
    ASSERT_EQ(res.exitCode, 3);
    ASSERT_EQ(res.output, "partial\n");
}

TEST(ProcessExecution, StderrIsDiscardedUnlessMerged) {
    ProcessResult quiet = runProcess({"sh", "-c", "echo oops 1>&2"});
    ASSERT_EQ(quiet.output, "");

    ProcessResult merged = runProcess({"sh", "-c", "echo oops 1>&2"}, 0, true);
    ASSERT_EQ(merged.output, "oops\n");
}

TEST(ProcessExecution, MissingBinaryExits127) {
    ProcessResult res = runProcess({"leakscan-no-such-binary-4711"});
    ASSERT_EQ(res.exitCode, 127);
    ASSERT_TRUE(res.output.empty());
}

TEST(ProcessExecution, EmptyArgvIsNotLaunched) {
    ProcessResult res = runProcess({});
    ASSERT_FALSE(res.launched);
}

TEST(ProcessExecution, TimeoutKillsTheChild) {
    auto start = std::chrono::steady_clock::now();
    ProcessResult res = runProcess({"sleep", "10"}, 1);
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(res.timedOut);
    ASSERT_EQ(res.exitCode, -1);
    ASSERT_LT(elapsed, std::chrono::seconds(5));
}

TEST(SecureFiles, CreatesOwnerOnlyFile) {
    std::random_device rd;
    fs::path path = fs::temp_directory_path() / ("leakscan_secure_" + std::to_string(rd()));

    ensureSecureFile(path);
    ASSERT_TRUE(fs::exists(path));
    struct stat st;
    ASSERT_EQ(::stat(path.c_str(), &st), 0);
    ASSERT_EQ(st.st_mode & 0777, 0600u);
    fs::remove(path);
}

TEST(EnvironmentReading, ReturnsVariableValues) {
    ::setenv("LEAKSCAN_TEST_VARIABLE", "value-from-test-4711", 1);
    auto values = environmentValues();
    ASSERT_NE(std::find(values.begin(), values.end(), "value-from-test-4711"), values.end());
    ASSERT_EQ(std::find(values.begin(), values.end(), "LEAKSCAN_TEST_VARIABLE"), values.end());
    ::unsetenv("LEAKSCAN_TEST_VARIABLE");
}

TEST(GithubTokens, PrefixCheck) {
    ASSERT_TRUE(isGithubToken("gho_abcdef"));
    ASSERT_TRUE(isGithubToken("ghp_abcdef"));
    ASSERT_FALSE(isGithubToken("ghs_abcdef"));
    ASSERT_FALSE(isGithubToken("github_pat_abc"));
    ASSERT_FALSE(isGithubToken(""));
}

TEST(GithubTokens, MissingCliYieldsNothing) {
    core::Config cfg;
    cfg.githubCommand = "leakscan-no-such-gh-4711";
    ASSERT_FALSE(githubToken(cfg).has_value());
}

TEST(TargetUserLookup, HasHomeDirectory) {
    ASSERT_FALSE(targetHomeDirectory().empty());
}

TEST(InterruptFlag, SetByHandlerAndCleared) {
    clearInterrupt();
    installInterruptHandler();
    ASSERT_FALSE(interruptRequested());

    ::raise(SIGINT);
    ASSERT_TRUE(interruptRequested());

    clearInterrupt();
    ASSERT_FALSE(interruptRequested());
}
