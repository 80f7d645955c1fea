#include "flowcore/app/application.hpp"
#include "flowcore/cli/commands.hpp"
#include "flowcore/cli/formatting.hpp"
#include "flowcore/config/config.hpp"
#include "flowcore/util/json.hpp"
#include "flowcore/util/log.hpp"

#include <chrono>
#include <print>

namespace flowcore::cli {

namespace {

auto print_run(const WorkflowRun &run) -> void {
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      run.finished_at - run.started_at);
  std::println("{} {}", fmt::ansi::bold("Run:"), run.name);
  std::println("  workflow:  {}", run.workflow);
  std::println("  namespace: {}", run.ns);
  std::println("  state:     {}",
               fmt::colorize_run_state(to_string_view(run.state)));
  std::println("  duration:  {}ms", elapsed.count());
  std::println("  result:    {}", dump_json(run.result));
}

} // namespace

auto cmd_run(const RunOptions &opts) -> int {
  SystemConfig config;
  if (opts.config_file) {
    auto loaded = ConfigLoader::load_from_file(*opts.config_file);
    if (!loaded) {
      std::println(stderr, "Error: {}: {}", *opts.config_file,
                   loaded.error().message());
      return 1;
    }
    config = std::move(*loaded);
  }
  // Keep stdout for the run itself.
  if (config.logging.file.empty()) {
    log::set_output_stderr();
    config.logging.level = "warn";
  }

  auto input = parse_json(opts.input);
  if (!input) {
    std::println(stderr, "Error: --input is not valid JSON");
    return 1;
  }

  Application app(std::move(config));
  app.set_definitions_dir(opts.definitions_dir);
  if (auto r = app.start(); !r) {
    std::println(stderr, "Error: failed to start: {}", r.error().message());
    return 1;
  }

  auto run = app.run_blocking(
      opts.workflow,
      SubmitOptions{.input = std::move(*input), .ns = opts.ns},
      std::chrono::milliseconds(opts.timeout_ms));
  app.stop();

  if (!run) {
    std::println(stderr, "Error: {}: {}", opts.workflow,
                 run.error().message());
    return 1;
  }
  if (opts.json) {
    std::println("{}", dump_json(to_json(*run)));
  } else {
    print_run(*run);
  }
  return run->state == RunState::Completed ? 0 : 1;
}

} // namespace flowcore::cli
