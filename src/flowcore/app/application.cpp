#include "flowcore/app/application.hpp"

#include "flowcore/app/services/trigger_service.hpp"
#include "flowcore/config/config.hpp"
#include "flowcore/config/toml_util.hpp"
#include "flowcore/core/runtime.hpp"
#include "flowcore/definitions/definition_store.hpp"
#include "flowcore/definitions/definition_watcher.hpp"
#include "flowcore/events/event_bus.hpp"
#include "flowcore/executor/executor_session.hpp"
#include "flowcore/executor/local_executor.hpp"
#include "flowcore/executor/target_registry.hpp"
#include "flowcore/store/object_store.hpp"
#include "flowcore/util/log.hpp"
#include "flowcore/util/time.hpp"

#include <algorithm>
#include <csignal>
#include <fstream>
#include <optional>
#include <string>
#include <system_error>

namespace flowcore {

Application::Application() : Application(SystemConfig{}) {}

Application::Application(SystemConfig config) : config_(std::move(config)) {
  std::signal(SIGPIPE, SIG_IGN);
}

Application::~Application() { stop(); }

auto Application::load_config(std::string_view path) -> Result<void> {
  if (is_running()) {
    return fail(Error::InvalidState);
  }
  return ConfigLoader::load_from_file(path).transform(
      [this](SystemConfig &&cfg) { config_ = std::move(cfg); });
}

auto Application::configure_logging() -> void {
  log::set_level(config_.logging.level);
  if (!config_.logging.file.empty() &&
      !log::set_output_file(config_.logging.file)) {
    log::warn("Cannot open log file {}, logging to stdout",
              config_.logging.file);
  }
  log::start();
}

auto Application::build() -> void {
  runtime_ = std::make_unique<Runtime>(
      static_cast<unsigned>(std::max(0, config_.runtime.shards)));
  executor_ = std::make_unique<LocalExecutor>(
      config_.executor, config_.storage.cluster_memory_max_entry_bytes);
  session_ = std::make_unique<ExecutorSession>(*executor_, config_.executor);
  objects_ = std::make_unique<ObjectStore>(
      config_.compute, config_.storage,
      [executor = executor_.get()] { return executor->shared_memory(); });
  bus_ = EventBus::create();
  targets_ = std::make_unique<TargetRegistry>();
  register_builtin_targets(*targets_);
  definitions_ = std::make_unique<DirectoryDefinitionStore>(definitions_dir_);
  coordinator_ = std::make_unique<ExecutionCoordinator>(
      ExecutionCoordinator::Dependencies{.runtime = *runtime_,
                                         .session = *session_,
                                         .targets = *targets_,
                                         .store = objects_.get(),
                                         .bus = bus_,
                                         .definitions = definitions_.get()},
      config_.compute);
}

auto Application::start(LaunchOptions options) -> Result<void> {
  if (running_.exchange(true, std::memory_order_acq_rel)) {
    return ok();
  }
  configure_logging();
  build();

  if (auto r = runtime_->start(); !r) {
    running_.store(false, std::memory_order_release);
    return fail(r.error());
  }
  log::info("Runtime started with {} shard(s)", runtime_->shard_count());

  auto loaded = definitions_->load_all();
  if (!loaded) {
    log::error("Cannot load definitions from {}: {}",
               definitions_dir_.string(), loaded.error().message());
    stop();
    return fail(loaded.error());
  }

  if (options.watch_definitions) {
    if (auto r = start_watcher(); !r) {
      stop();
      return r;
    }
  }
  if (options.triggers) {
    if (auto r = start_triggers(); !r) {
      stop();
      return r;
    }
  }
  log::info("flowcore started: {} definition file(s) from {}", *loaded,
            definitions_dir_.string());
  return ok();
}

auto Application::start_watcher() -> Result<void> {
  watcher_ = std::make_unique<DefinitionWatcher>(*runtime_, definitions_dir_);
  watcher_->set_on_file_changed([this](const std::filesystem::path &path) {
    std::string diagnostic;
    if (auto r = definitions_->reload_file(path, &diagnostic); !r) {
      log::warn("Keeping previous definitions of {}: {}", path.string(),
                diagnostic.empty() ? r.error().message() : diagnostic);
    }
  });
  watcher_->set_on_file_removed([this](const std::filesystem::path &path) {
    definitions_->remove_file(path);
  });
  return watcher_->start();
}

auto Application::watermark_path() const -> std::filesystem::path {
  return std::filesystem::path(config_.storage.artifact_dir) /
         ".schedule_watermark";
}

auto Application::start_triggers() -> Result<void> {
  triggers_ = std::make_unique<TriggerService>(*runtime_, *coordinator_, bus_,
                                               config_.triggers);
  triggers_->set_watermark_callbacks(
      [path = watermark_path()]() -> std::optional<util::TimePoint> {
        auto text = toml_util::read_file(path.string());
        if (!text) {
          return std::nullopt;
        }
        auto tp = util::parse_iso8601(*text);
        if (!tp) {
          log::warn("Ignoring malformed schedule watermark in {}",
                    path.string());
          return std::nullopt;
        }
        return *tp;
      },
      [path = watermark_path()](util::TimePoint minute) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        std::ofstream out(path, std::ios::trunc);
        out << util::format_iso8601(minute);
        if (!out) {
          log::warn("Cannot persist schedule watermark to {}", path.string());
        }
      });
  triggers_->attach(*definitions_);
  return triggers_->start();
}

auto Application::run_blocking(std::string_view workflow,
                               SubmitOptions options,
                               std::chrono::milliseconds timeout)
    -> Result<WorkflowRun> {
  if (!is_running()) {
    return fail(Error::SystemNotRunning);
  }
  auto handle = coordinator_->submit(workflow, std::move(options));
  if (!handle) {
    return fail(handle.error());
  }
  auto run = handle->wait(timeout);
  if (!run) {
    log::warn("Run {} did not finish within {}ms, cancelling", handle->name(),
              timeout.count());
    (void)coordinator_->cancel(handle->id());
  }
  return run;
}

auto Application::stop() noexcept -> void {
  if (!running_.exchange(false, std::memory_order_acq_rel)) {
    return;
  }
  log::info("Stopping flowcore...");

  if (watcher_) {
    watcher_->stop();
  }
  if (triggers_) {
    triggers_->stop();
    triggers_->detach();
  }
  if (coordinator_) {
    coordinator_->cancel_all();
  }
  if (bus_) {
    bus_->close();
  }
  if (runtime_) {
    runtime_->stop();
  }
  // Stages already on the pool still hold the object store and the
  // session's memory.
  if (executor_) {
    executor_->shutdown();
  }
  if (session_) {
    session_->disconnect();
  }

  triggers_.reset();
  watcher_.reset();
  coordinator_.reset();
  definitions_.reset();
  targets_.reset();
  bus_.reset();
  session_.reset();
  executor_.reset();
  objects_.reset();
  runtime_.reset();

  log::info("flowcore stopped");
  log::stop();
}

} // namespace flowcore
