#include "flowcore/cli/commands.hpp"
#include "flowcore/cli/formatting.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <filesystem>
#include <format>
#include <string>

using namespace flowcore;
using namespace flowcore::cli;

namespace {

constexpr std::string_view kPipeline = R"([
  {"kind": "workflow", "metadata": {"name": "count"},
   "spec": {"stages": [
     {"name": "numbers", "target": "flowcore.builtins.range"},
     {"name": "total", "target": "flowcore.builtins.sum",
      "depends_on": ["numbers"]}]}},
  {"kind": "trigger_rule", "metadata": {"name": "nightly"},
   "spec": {"type": "schedule", "rule": ["@daily"],
            "action": {"parameters": {"workflow": "count", "input": 10}}}}
])";

} // namespace

TEST(CLITest, OptionDefaults) {
  RunOptions run;
  EXPECT_EQ(run.definitions_dir, ".");
  EXPECT_EQ(run.input, "{}");
  EXPECT_FALSE(run.ns.has_value());
  EXPECT_FALSE(run.json);

  ServeOptions serve;
  EXPECT_FALSE(serve.config_file.has_value());
  EXPECT_FALSE(serve.no_triggers);
  EXPECT_FALSE(serve.shards.has_value());
}

TEST(CLITest, ColorizeRunStateWithoutTty) {
  // Test output is never a terminal.
  EXPECT_EQ(fmt::colorize_run_state("completed"), "completed");
  EXPECT_EQ(fmt::colorize_run_state("other"), "other");
}

class CLICommandTest : public ::testing::Test {
protected:
  CLICommandTest() {
    std::filesystem::create_directories(defs_dir());
    test::write_file(config_path(),
                     std::format("[storage]\nartifact_dir = \"{}\"\n"
                                 "[runtime]\nshards = 1\n",
                                 (dir_.path() / "artifacts").string()));
  }

  auto defs_dir() const -> std::filesystem::path {
    return dir_.path() / "defs";
  }
  auto config_path() const -> std::filesystem::path {
    return dir_.path() / "flowcore.toml";
  }

  test::TempDir dir_;
};

TEST_F(CLICommandTest, ValidateAcceptsGoodDefinitions) {
  test::write_file(defs_dir() / "pipeline.json", kPipeline);
  EXPECT_EQ(cmd_validate(ValidateOptions{
                .files = {(defs_dir() / "pipeline.json").string()}}),
            0);
  EXPECT_EQ(cmd_validate(ValidateOptions{
                .files = {(defs_dir() / "pipeline.json").string()},
                .json = true}),
            0);
}

TEST_F(CLICommandTest, ValidateRejectsBadDefinitions) {
  test::write_file(defs_dir() / "cycle.json", R"({
    "kind": "workflow", "metadata": {"name": "loop"},
    "spec": {"stages": [
      {"name": "a", "target": "t", "depends_on": ["b"]},
      {"name": "b", "target": "t", "depends_on": ["a"]}]}})");
  test::write_file(defs_dir() / "cron.json", R"({
    "kind": "trigger_rule", "metadata": {"name": "bad"},
    "spec": {"type": "schedule", "rule": ["61 * * * *"],
             "action": {"parameters": {"workflow": "x"}}}})");
  test::write_file(defs_dir() / "broken.json", "{");

  for (auto file : {"cycle.json", "cron.json", "broken.json"}) {
    EXPECT_EQ(cmd_validate(ValidateOptions{
                  .files = {(defs_dir() / file).string()}}),
              1)
        << file;
  }
  EXPECT_EQ(cmd_validate(ValidateOptions{}), 1);
}

TEST_F(CLICommandTest, RunCompletesAWorkflow) {
  test::write_file(defs_dir() / "pipeline.json", kPipeline);
  RunOptions opts;
  opts.config_file = config_path().string();
  opts.definitions_dir = defs_dir().string();
  opts.workflow = "count";
  opts.input = "5";
  opts.json = true;
  EXPECT_EQ(cmd_run(opts), 0);
}

TEST_F(CLICommandTest, RunReportsFailures) {
  test::write_file(defs_dir() / "pipeline.json", kPipeline);
  RunOptions opts;
  opts.config_file = config_path().string();
  opts.definitions_dir = defs_dir().string();

  opts.workflow = "absent";
  EXPECT_EQ(cmd_run(opts), 1);

  // range() rejects a string, so the run fails.
  opts.workflow = "count";
  opts.input = R"("five")";
  EXPECT_EQ(cmd_run(opts), 1);

  opts.input = "{not json";
  EXPECT_EQ(cmd_run(opts), 1);

  opts.input = "3";
  opts.config_file = (dir_.path() / "missing.toml").string();
  EXPECT_EQ(cmd_run(opts), 1);
}
