#pragma once

#include "flowcore/app/services/execution_coordinator.hpp"
#include "flowcore/config/system_config.hpp"
#include "flowcore/core/error.hpp"
#include "flowcore/run/workflow_run.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string_view>

namespace flowcore {

class DefinitionWatcher;
class DirectoryDefinitionStore;
class EventBus;
class ExecutorSession;
class LocalExecutor;
class ObjectStore;
class Runtime;
class TargetRegistry;
class TriggerService;

// Which long-lived services start() brings up beside the coordinator.
struct LaunchOptions {
  bool watch_definitions{false};
  bool triggers{false};
};

// Owns and wires every service of one flowcore process.
class Application {
public:
  Application();
  explicit Application(SystemConfig config);
  ~Application();

  Application(const Application &) = delete;
  auto operator=(const Application &) -> Application & = delete;

  [[nodiscard]] auto load_config(std::string_view path) -> Result<void>;
  [[nodiscard]] auto config() const noexcept -> const SystemConfig & {
    return config_;
  }
  auto set_definitions_dir(std::filesystem::path dir) -> void {
    definitions_dir_ = std::move(dir);
  }

  [[nodiscard]] auto start(LaunchOptions options = {}) -> Result<void>;
  auto stop() noexcept -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool {
    return running_.load(std::memory_order_acquire);
  }

  // Submits by name and blocks until the run is terminal.
  [[nodiscard]] auto run_blocking(std::string_view workflow,
                                  SubmitOptions options,
                                  std::chrono::milliseconds timeout)
      -> Result<WorkflowRun>;

  [[nodiscard]] auto runtime() -> Runtime & { return *runtime_; }
  [[nodiscard]] auto coordinator() -> ExecutionCoordinator & {
    return *coordinator_;
  }
  [[nodiscard]] auto targets() -> TargetRegistry & { return *targets_; }
  [[nodiscard]] auto definitions() -> DirectoryDefinitionStore & {
    return *definitions_;
  }
  [[nodiscard]] auto objects() -> ObjectStore & { return *objects_; }
  [[nodiscard]] auto bus() -> const std::shared_ptr<EventBus> & {
    return bus_;
  }
  [[nodiscard]] auto triggers() -> TriggerService * { return triggers_.get(); }

private:
  auto configure_logging() -> void;
  auto build() -> void;
  auto start_watcher() -> Result<void>;
  auto start_triggers() -> Result<void>;
  [[nodiscard]] auto watermark_path() const -> std::filesystem::path;

  SystemConfig config_;
  std::filesystem::path definitions_dir_{"."};
  std::atomic<bool> running_{false};

  std::unique_ptr<Runtime> runtime_;
  std::unique_ptr<LocalExecutor> executor_;
  std::unique_ptr<ExecutorSession> session_;
  std::unique_ptr<ObjectStore> objects_;
  std::shared_ptr<EventBus> bus_;
  std::unique_ptr<TargetRegistry> targets_;
  std::unique_ptr<DirectoryDefinitionStore> definitions_;
  std::unique_ptr<DefinitionWatcher> watcher_;
  std::unique_ptr<ExecutionCoordinator> coordinator_;
  std::unique_ptr<TriggerService> triggers_;
};

} // namespace flowcore
