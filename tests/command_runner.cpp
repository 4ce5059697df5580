#include <gtest/gtest.h>

#include "lib/command_runner.hpp"
#include "lib/errors.hpp"

/***********************************************************************************************************************
 * Tests
 **********************************************************************************************************************/

TEST(CommandRunnerTest, QuoteSurvivesEmbeddedQuotes) {
    EXPECT_EQ(CommandRunner::quote("/dev/sdb"), "'/dev/sdb'");
    EXPECT_EQ(CommandRunner::quote("it's"), "'it'\\''s'");
    EXPECT_EQ(CommandRunner::quote(""), "''");
}

TEST(CommandRunnerTest, JoinSeparatesWithSpaces) {
    EXPECT_EQ(CommandRunner::join({"curl", "wget", "git"}), "curl wget git");
    EXPECT_EQ(CommandRunner::join({}), "");
}

TEST(CommandRunnerTest, SystemRunnerCapturesOutputAndStatus) {
    SystemCommandRunner runner;

    CommandResult ok = runner.run("echo hi");
    EXPECT_TRUE(ok.ok());
    EXPECT_EQ(ok.output, "hi\n");

    CommandResult failed = runner.run("echo oops >&2; exit 3");
    EXPECT_EQ(failed.exitCode, 3);
    EXPECT_EQ(failed.output, "oops\n");

    EXPECT_EQ(runner.run("echo " + CommandRunner::quote("it's")).output, "it's\n");
}

TEST(CommandRunnerTest, RunCheckedThrowsWithExitCode) {
    SystemCommandRunner runner;

    EXPECT_EQ(runner.runChecked("printf ready"), "ready");

    try {
        runner.runChecked("echo broken; exit 7");
        FAIL() << "runChecked should have thrown";
    } catch (const CommandError& e) {
        EXPECT_EQ(e.exitCode(), 7);
        EXPECT_EQ(e.output(), "broken\n");
    }
}

TEST(CommandRunnerTest, ExistsResolvesPath) {
    SystemCommandRunner runner;

    EXPECT_TRUE(runner.exists("sh"));
    EXPECT_FALSE(runner.exists("pvestrap-no-such-binary"));
}
