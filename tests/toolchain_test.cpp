#include <gtest/gtest.h>
#include "toolchain.hpp"
#include "diags.hpp"
#include "test_helpers.hpp"

#include <atomic>

namespace {

using namespace pc;
using namespace pc::test_support;

class ToolchainTest : public testing::Test {
 protected:
  diagnostic_collector diags;
  toolchain_options options;

  std::string harvest(fake_runner& runner) {
    go_toolchain toolchain(options, runner, diags);
    return toolchain.harvest("./output/conversions.go");
  }
};

TEST_F(ToolchainTest, BuildCommand) {
  fake_runner runner(exited(1));
  go_toolchain toolchain(options, runner, diags);

  auto cmd = toolchain.build_command("./output/conversions.go");
  EXPECT_EQ("go", cmd.program);
  EXPECT_EQ((std::vector<std::string> { "build", "-gcflags=-e", "-o", "/dev/null", "./output/conversions.go" }), cmd.args);
  EXPECT_EQ("go build -gcflags=-e -o /dev/null ./output/conversions.go", cmd.str());
}

TEST_F(ToolchainTest, ExpectedStatusReturnsDiagnostics) {
  fake_runner runner(exited(1, "# command-line-arguments\nerror text\n"));

  EXPECT_EQ("# command-line-arguments\nerror text\n", harvest(runner));
  ASSERT_EQ(1u, runner.commands.size());
  EXPECT_EQ(120u, runner.timeouts[0]);
  EXPECT_FALSE(diags.has_errors());
}

TEST_F(ToolchainTest, CustomSettings) {
  options.program = "/opt/go/bin/go";
  options.expected_status = 2;
  options.timeout_seconds = 5;
  fake_runner runner(exited(2, "conversions.go:12:6: undefined: p\n"));

  EXPECT_EQ("conversions.go:12:6: undefined: p\n", harvest(runner));
  EXPECT_EQ("/opt/go/bin/go", runner.commands[0].program);
  EXPECT_EQ(5u, runner.timeouts[0]);
}

TEST_F(ToolchainTest, SuccessfulBuildIsFatal) {
  fake_runner runner(exited(0));
  EXPECT_THROW(harvest(runner), pipeline_error);
  EXPECT_TRUE(has_diagnostic<diags::compilation_succeeded>(diags));
}

TEST_F(ToolchainTest, OtherStatusIsFatal) {
  fake_runner runner(exited(2, "# command-line-arguments\nerror text\n"));
  EXPECT_THROW(harvest(runner), pipeline_error);
  EXPECT_TRUE(has_diagnostic<diags::unexpected_exit_status>(diags));
}

TEST_F(ToolchainTest, ExpectedStatusWithoutCompilerErrorsIsFatal) {
  fake_runner runner(exited(1, "go: go.mod file not found in current directory or any parent directory; see 'go help modules'\n"));
  EXPECT_THROW(harvest(runner), pipeline_error);
  EXPECT_TRUE(has_diagnostic<diags::unexpected_exit_status>(diags));

  fake_runner silent(exited(1));
  EXPECT_THROW(harvest(silent), pipeline_error);
  EXPECT_EQ(2u, diags.count(diagnostic::ERROR));
}

TEST(GoToolchainTest, RecognizesCompilerErrors) {
  EXPECT_TRUE(go_toolchain::reports_compile_errors("# command-line-arguments\n"));
  EXPECT_TRUE(go_toolchain::reports_compile_errors("output/conversions.go:11:6: cannot convert p.bool (variable of type bool) to type uint8\n"));
  EXPECT_FALSE(go_toolchain::reports_compile_errors(""));
  EXPECT_FALSE(go_toolchain::reports_compile_errors("go: go.mod file not found in current directory or any parent directory; see 'go help modules'\n"));
  EXPECT_FALSE(go_toolchain::reports_compile_errors("go: cannot find main module, but found .git/config in /src\n"));
}

TEST_F(ToolchainTest, ProcessFailuresAreFatal) {
  {
    fake_runner runner({ process_result::NOT_FOUND, -1, "", "No such file or directory" });
    EXPECT_THROW(harvest(runner), pipeline_error);
    EXPECT_TRUE(has_diagnostic<diags::compiler_not_found>(diags));
  }
  {
    fake_runner runner({ process_result::NOT_EXECUTED, -1, "", "Program could not be executed" });
    EXPECT_THROW(harvest(runner), pipeline_error);
    EXPECT_TRUE(has_diagnostic<diags::compiler_not_executed>(diags));
  }
  {
    fake_runner runner({ process_result::CRASHED, -2, "", "Segmentation fault" });
    EXPECT_THROW(harvest(runner), pipeline_error);
    EXPECT_TRUE(has_diagnostic<diags::compiler_crashed>(diags));
  }
  {
    fake_runner runner({ process_result::TIMED_OUT, -1, "", "" });
    EXPECT_THROW(harvest(runner), pipeline_error);
    EXPECT_TRUE(has_diagnostic<diags::compiler_timed_out>(diags));
  }
  {
    fake_runner runner({ process_result::CANCELLED, -1, "", "" });
    EXPECT_THROW(harvest(runner), pipeline_error);
    EXPECT_TRUE(has_diagnostic<diags::compilation_cancelled>(diags));
  }
  {
    fake_runner runner({ process_result::NOT_CAPTURED, -1, "", "Permission denied" });
    EXPECT_THROW(harvest(runner), pipeline_error);
    EXPECT_TRUE(has_diagnostic<diags::diagnostics_not_readable>(diags));
  }

  EXPECT_EQ(6u, diags.count(diagnostic::ERROR));
}

// These run /bin/sh through the real process runner.

TEST(ProcessRunnerTest, CapturesStandardErrorOnly) {
  llvm_process_runner runner;
  auto result = runner.run({ "sh", { "-c", "echo out; echo err >&2; exit 2" } }, 10);

  EXPECT_EQ(process_result::EXITED, result.outcome);
  EXPECT_EQ(2, result.status);
  EXPECT_EQ("err\n", result.diagnostics);
}

TEST(ProcessRunnerTest, ZeroStatus) {
  llvm_process_runner runner;
  auto result = runner.run({ "sh", { "-c", "true" } }, 0);

  EXPECT_EQ(process_result::EXITED, result.outcome);
  EXPECT_EQ(0, result.status);
  EXPECT_EQ("", result.diagnostics);
}

TEST(ProcessRunnerTest, MissingProgram) {
  llvm_process_runner runner;
  auto result = runner.run({ "primconv-no-such-program", { } }, 10);

  EXPECT_EQ(process_result::NOT_FOUND, result.outcome);
}

TEST(ProcessRunnerTest, KilledBySignal) {
  llvm_process_runner runner;
  auto result = runner.run({ "sh", { "-c", "kill -KILL $$" } }, 10);

  EXPECT_EQ(process_result::CRASHED, result.outcome);
}

TEST(ProcessRunnerTest, Timeout) {
  llvm_process_runner runner;
  auto result = runner.run({ "sh", { "-c", "sleep 30" } }, 1);

  EXPECT_EQ(process_result::TIMED_OUT, result.outcome);
}

TEST(ProcessRunnerTest, CancelledAfterExit) {
  std::atomic<bool> cancelled(true);
  llvm_process_runner runner(&cancelled);
  auto result = runner.run({ "sh", { "-c", "echo err >&2" } }, 10);

  EXPECT_EQ(process_result::CANCELLED, result.outcome);
}

TEST(ProcessRunnerTest, Cancelled) {
  std::atomic<bool> cancelled(true);
  llvm_process_runner runner(&cancelled);
  auto result = runner.run({ "sh", { "-c", "sleep 30" } }, 60);

  EXPECT_EQ(process_result::CANCELLED, result.outcome);
}

}
