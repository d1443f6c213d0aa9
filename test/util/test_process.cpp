#include <gtest/gtest.h>

#include <string>

#include "test_utils.hpp"
#include "util/Process.hpp"

namespace fs = std::filesystem;

using namespace mergereport;
using namespace mergereport::test::utils;

// Test: stdout, stderr and exit code are captured separately
TEST(ProcessTest, CapturesStreamsAndExitCode) {
    auto res = Process::run({"sh", "-c", "echo out; echo err 1>&2; exit 3"});
    ASSERT_TRUE(res.has_value()) << res.error().message;
    EXPECT_EQ(res.value().exitCode, 3);
    EXPECT_FALSE(res.value().succeeded());
    EXPECT_EQ(res.value().stdoutText, "out\n");
    EXPECT_EQ(res.value().stderrText, "err\n");
}

// Test: Arguments are passed verbatim, no shell expansion
TEST(ProcessTest, ArgumentsAreNotShellExpanded) {
    auto res = Process::run({"printf", "%s|", "a b", "$HOME", "*"});
    ASSERT_TRUE(res.has_value()) << res.error().message;
    EXPECT_TRUE(res.value().succeeded());
    EXPECT_EQ(res.value().stdoutText, "a b|$HOME|*|");
}

// Test: Extra environment variables reach the child
TEST(ProcessTest, EnvironmentOverrides) {
    ProcessOptions opts;
    opts.env = {{"MERGE_REPORT_TEST_VAR", "hello"}};
    auto res = Process::run({"sh", "-c", "printf %s \"$MERGE_REPORT_TEST_VAR\""}, opts);
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res.value().stdoutText, "hello");
}

// Test: Child runs in the requested working directory
TEST(ProcessTest, WorkingDirectory) {
    fs::path dir = createTempDir();
    createFile(dir, "marker.txt", "x");
    ProcessOptions opts;
    opts.workingDir = dir;
    auto res = Process::run({"ls"}, opts);
    removeDir(dir);
    ASSERT_TRUE(res.has_value());
    EXPECT_NE(res.value().stdoutText.find("marker.txt"), std::string::npos);
}

// Test: Large output on both pipes does not deadlock
TEST(ProcessTest, LargeOutputOnBothStreams) {
    auto res = Process::run({"sh", "-c",
        "i=0; while [ $i -lt 20000 ]; do echo line-$i; echo err-$i 1>&2; i=$((i+1)); done"});
    ASSERT_TRUE(res.has_value());
    EXPECT_TRUE(res.value().succeeded());
    EXPECT_NE(res.value().stdoutText.find("line-19999\n"), std::string::npos);
    EXPECT_NE(res.value().stderrText.find("err-19999\n"), std::string::npos);
}

// Test: Missing executable is an error, not a crash
TEST(ProcessTest, MissingExecutable) {
    auto res = Process::run({"merge-report-no-such-binary-xyz"});
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::ProcessError);
    EXPECT_NE(res.error().message.find("merge-report-no-such-binary-xyz"), std::string::npos);
}

// Test: Nonexistent working directory is an error
TEST(ProcessTest, MissingWorkingDirectory) {
    ProcessOptions opts;
    opts.workingDir = "/nonexistent/merge-report/dir";
    auto res = Process::run({"true"}, opts);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::ProcessError);
}

// Test: Empty command line is rejected
TEST(ProcessTest, EmptyArgv) {
    auto res = Process::run({});
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::InvalidArgs);
}
