#include "flowcore/cli/commands.hpp"
#include "flowcore/util/log.hpp"

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <optional>
#include <string>

namespace {
auto default_config() -> std::optional<std::string> {
  if (const char *env = std::getenv("FLOWCORE_CONFIG"); env && *env) {
    return std::string(env);
  }
  return std::nullopt;
}
} // namespace

int main(int argc, char *argv[]) {
  // Keep non-serve CLI output clean by default.
  flowcore::log::set_output_stderr();
  flowcore::log::set_level(flowcore::log::Level::Warn);

  CLI::App app{"flowcore", "Workflow orchestration engine"};
  app.require_subcommand(1);
  app.footer("\nExamples:\n"
             "  flowcore validate defs/pipeline.json\n"
             "  flowcore run -c flowcore.toml -d defs pipeline --input "
             "'{\"n\": 3}'\n"
             "  flowcore serve -c flowcore.toml -d defs\n"
             "\nTip: Set FLOWCORE_CONFIG=flowcore.toml to skip -c.");

  flowcore::cli::ValidateOptions validate_opts;
  auto *validate = app.add_subcommand(
      "validate", "Load definition files and check every definition");
  validate
      ->add_option("files", validate_opts.files, "Definition files (*.json)")
      ->required()
      ->check(CLI::ExistingFile);
  validate->add_flag("--json", validate_opts.json, "Output JSON");
  validate->callback([&validate_opts]() {
    std::exit(flowcore::cli::cmd_validate(validate_opts));
  });

  flowcore::cli::RunOptions run_opts;
  run_opts.config_file = default_config();
  auto *run = app.add_subcommand("run", "Run one workflow to completion");
  run->add_option("-c,--config", run_opts.config_file, "System config file")
      ->check(CLI::ExistingFile);
  run->add_option("-d,--definitions", run_opts.definitions_dir,
                  "Definition directory")
      ->check(CLI::ExistingDirectory);
  run->add_option("workflow", run_opts.workflow, "Workflow name")->required();
  run->add_option("--input", run_opts.input, "Run input as JSON");
  run->add_option("--namespace", run_opts.ns, "Namespace for the run");
  run->add_option("--timeout-ms", run_opts.timeout_ms,
                  "Give up waiting after this many milliseconds")
      ->check(CLI::PositiveNumber);
  run->add_flag("--json", run_opts.json, "Output JSON");
  run->callback(
      [&run_opts]() { std::exit(flowcore::cli::cmd_run(run_opts)); });

  flowcore::cli::ServeOptions serve_opts;
  serve_opts.config_file = default_config();
  auto *serve = app.add_subcommand(
      "serve", "Run the coordinator and triggers until SIGINT/SIGTERM");
  serve->add_option("-c,--config", serve_opts.config_file, "System config file")
      ->check(CLI::ExistingFile);
  serve->add_option("-d,--definitions", serve_opts.definitions_dir,
                    "Definition directory")
      ->check(CLI::ExistingDirectory);
  serve->add_option("--log-level", serve_opts.log_level,
                    "Log level override: trace|debug|info|warn|error");
  serve->add_option("--shards", serve_opts.shards,
                    "Number of shards (default: auto-detect CPU cores)");
  serve->add_flag("--no-triggers", serve_opts.no_triggers,
                  "Do not evaluate trigger rules");
  serve->callback(
      [&serve_opts]() { std::exit(flowcore::cli::cmd_serve(serve_opts)); });

  CLI11_PARSE(app, argc, argv);
  return 0;
}
