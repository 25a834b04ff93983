#include <gtest/gtest.h>

#include <tvscan/process.hpp>

TEST(ProcessTest, CapturesOutputAndExitCode) {
    auto result = run_command("echo hello");
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.output, "hello\n");
}

TEST(ProcessTest, ReportsNonZeroExit) {
    auto result = run_command("exit 3");
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_TRUE(result.output.empty());
}

TEST(ProcessTest, EscapesSingleQuotes) {
    EXPECT_EQ(escape_shell_arg("eth0"), "'eth0'");
    EXPECT_EQ(escape_shell_arg("it's"), "'it'\\''s'");
    EXPECT_EQ(run_command("echo " + escape_shell_arg("a b; echo c")).output, "a b; echo c\n");
}

TEST(ProcessTest, FindsCommandsOnPath) {
    EXPECT_TRUE(is_command_available("sh"));
    EXPECT_TRUE(is_command_available("/bin/sh"));
    EXPECT_FALSE(is_command_available("tvscan-no-such-command"));
    EXPECT_FALSE(is_command_available("/nonexistent/nc"));
    EXPECT_FALSE(is_command_available(""));
}

TEST(ProcessTest, ChecksOnlyTheFirstWord) {
    EXPECT_EQ(command_name("  sudo arp-scan -q"), "sudo");
    EXPECT_EQ(command_name("nc"), "nc");
    EXPECT_TRUE(is_command_available("env sh"));
    EXPECT_TRUE(is_command_available("/bin/sh -c true"));
    EXPECT_FALSE(is_command_available("tvscan-no-such-command --flag"));
    EXPECT_FALSE(is_command_available("   "));
}
