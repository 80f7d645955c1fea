#pragma once

#include "flowcore/config/system_config.hpp"
#include "flowcore/core/coroutine.hpp"
#include "flowcore/core/error.hpp"
#include "flowcore/core/shard.hpp"
#include "flowcore/dag/compiler.hpp"
#include "flowcore/executor/executor.hpp"
#include "flowcore/run/run_context.hpp"
#include "flowcore/run/run_handle.hpp"
#include "flowcore/run/workflow_run.hpp"

#include <ankerl/unordered_dense.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace flowcore {

class EventBus;
class ExecutorSession;
class IDefinitionStore;
class ObjectStore;
class Runtime;
class TargetRegistry;

inline constexpr std::string_view kCoordinatorSource = "coordinator";

struct SubmitOptions {
  JsonValue input;
  std::optional<std::string> ns;
  RunSource source{RunSource::Api};
};

// Drives workflow runs to completion. Each run lives on the shard its id
// hashes to; everything that touches the run's stage state happens there.
class ExecutionCoordinator {
public:
  struct Dependencies {
    Runtime &runtime;
    ExecutorSession &session;
    TargetRegistry &targets;
    ObjectStore *store{nullptr};
    std::shared_ptr<EventBus> bus;
    IDefinitionStore *definitions{nullptr};
  };

  ExecutionCoordinator(Dependencies deps, ComputeConfig config);
  ~ExecutionCoordinator();

  ExecutionCoordinator(const ExecutionCoordinator &) = delete;
  auto operator=(const ExecutionCoordinator &)
      -> ExecutionCoordinator & = delete;

  // Validation and target resolution happen here, before anything runs:
  // ValidationFailed and ResolutionFailed are returned directly.
  [[nodiscard]] auto submit(std::shared_ptr<const WorkflowDefinition> workflow,
                            SubmitOptions options = {}) -> Result<RunHandle>;
  // Looks the workflow up in the definition store.
  [[nodiscard]] auto submit(std::string_view workflow,
                            SubmitOptions options = {}) -> Result<RunHandle>;

  [[nodiscard]] auto get_run(const RunId &id) -> Result<WorkflowRun>;
  [[nodiscard]] auto handle(const RunId &id) -> Result<RunHandle>;
  [[nodiscard]] auto list_runs() -> std::vector<WorkflowRun>;
  // Stops scheduling; stages already dispatched run on but are ignored.
  // Cancelling a finished run is a no-op.
  [[nodiscard]] auto cancel(const RunId &id) -> Result<void>;
  auto cancel_all() -> void;

  [[nodiscard]] auto active_runs() const noexcept -> int {
    return active_runs_.load(std::memory_order_acquire);
  }
  [[nodiscard]] auto owner_shard(const RunId &id) const noexcept -> shard_id;
  [[nodiscard]] auto config() const noexcept -> const ComputeConfig & {
    return config_;
  }

private:
  struct ActiveRun;
  struct RunControl;
  struct RunRecord {
    WorkflowRun snapshot;
    std::shared_ptr<RunCompletion> completion;
    std::shared_ptr<RunControl> control;
  };

  auto drive(std::shared_ptr<ActiveRun> run) -> spawn_task;
  auto dispatch_ready(std::shared_ptr<ActiveRun> run) -> task<void>;
  auto dispatch_stage(const std::shared_ptr<ActiveRun> &run, NodeIndex idx)
      -> void;
  auto invoke_stage(std::shared_ptr<ActiveRun> run, NodeIndex idx,
                    std::optional<std::size_t> element, std::size_t count,
                    StageArgs args) -> spawn_task;
  auto complete_stage(ActiveRun &run, NodeIndex idx, JsonValue output)
      -> void;
  auto fail_run(ActiveRun &run, std::error_code ec, std::string message,
                std::string_view stage) -> void;
  auto finish(ActiveRun &run, RunState state, JsonValue result) -> void;

  auto publish(std::string_view type, const WorkflowRun &run) -> void;
  auto record_snapshot(const WorkflowRun &run) -> void;
  auto purge_expired() -> void;

  Runtime &runtime_;
  ExecutorSession &session_;
  TargetRegistry &targets_;
  ObjectStore *store_;
  std::shared_ptr<EventBus> bus_;
  IDefinitionStore *definitions_;
  ComputeConfig config_;

  mutable std::mutex records_mu_;
  ankerl::unordered_dense::map<RunId, RunRecord> records_;
  std::atomic<int> active_runs_{0};
};

} // namespace flowcore
