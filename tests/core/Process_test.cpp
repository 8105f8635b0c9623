#include <gtest/gtest.h>
#include "core/Process.hpp"
#include "core/SymfonyConsole.hpp"
#include "support/TempProject.hpp"

using namespace sf_boost;

TEST(ProcessTest, CapturesOutputAndExitCode) {
    auto result = run_process({"/bin/sh", "-c", "echo out; echo err 1>&2; exit 3"});
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_NE(result.output.find("out\n"), std::string::npos);
    EXPECT_NE(result.output.find("err\n"), std::string::npos);
}

TEST(ProcessTest, LooksUpProgramInPath) {
    auto result = run_process({"echo", "hello", "world"});
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.output, "hello world\n");
}

TEST(ProcessTest, StdinIsClosed) {
    // cat would block forever on an inherited terminal or pipe
    auto result = run_process({"/bin/cat"});
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.output, "");
}

TEST(ProcessTest, RunsInWorkingDirectory) {
    test_support::TempProject project;
    auto result = run_process({"/bin/pwd"}, project.root());
    EXPECT_EQ(result.output, project.root().string() + "\n");
}

TEST(ProcessTest, MissingProgram) {
    EXPECT_EQ(run_process({"/nonexistent/program"}).exit_code, 127);
    EXPECT_THROW(run_process({}), ProcessError);
}

TEST(ProcessTest, ShellQuote) {
    EXPECT_EQ(shell_quote("php"), "'php'");
    EXPECT_EQ(shell_quote("it's"), "'it'\\''s'");
    auto result = run_process({"/bin/sh", "-c", "printf %s " + shell_quote("a b'c;$x")});
    EXPECT_EQ(result.output, "a b'c;$x");
}

class SymfonyConsoleTest : public ::testing::Test {
protected:
    test_support::TempProject project_;
};

TEST_F(SymfonyConsoleTest, RunPassesArgumentsLiterally) {
    SymfonyConsole console(project_.root(), "echo");
    EXPECT_EQ(console.run({"debug:config", "framework; rm -rf x"}),
              "bin/console debug:config framework; rm -rf x\n");
}

TEST_F(SymfonyConsoleTest, CommandLineGoesThroughShell) {
    SymfonyConsole console(project_.root(), "echo");
    EXPECT_EQ(console.run_command_line("cache:clear   --env=prod"),
              "bin/console cache:clear --env=prod\n");
}

TEST_F(SymfonyConsoleTest, CommandLineMergesStderr) {
    SymfonyConsole console(project_.root(), "/bin/sh");
    project_.write("bin/console", "echo to-stderr 1>&2\n");
    EXPECT_EQ(console.run_command_line(""), "to-stderr\n");
}

TEST_F(SymfonyConsoleTest, PhpVersion) {
    SymfonyConsole missing(project_.root(), "/nonexistent/php");
    EXPECT_EQ(missing.php_version(), "unknown");

    SymfonyConsole fake(project_.root(), "echo");
    EXPECT_EQ(fake.php_version(), "-r echo PHP_VERSION;");
}
