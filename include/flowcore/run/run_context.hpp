#pragma once

#include "flowcore/core/error.hpp"
#include "flowcore/dag/workflow.hpp"
#include "flowcore/run/workflow_run.hpp"
#include "flowcore/util/id.hpp"
#include "flowcore/util/json.hpp"

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace flowcore {

class IExecutor;
class ObjectStore;

// Ambient state of one run, built once at submission and shared read-only
// by every stage invocation of that run.
struct RunContext {
  RunId run_id;
  std::string run_name;
  std::string workflow;
  std::string ns;
  RunSource source{RunSource::Api};
  util::TimePoint started_at{};
  JsonValue input;
  // Merged data of every config group selecting this workflow.
  JsonValue config;
  std::shared_ptr<const WorkflowDefinition> definition;
  IExecutor *executor{nullptr};
  ObjectStore *store{nullptr};
  std::shared_ptr<const std::atomic<bool>> cancelled;

  // Cooperative cancellation flag; stages that loop may poll it.
  [[nodiscard]] auto cancel_requested() const noexcept -> bool {
    return cancelled && cancelled->load(std::memory_order_acquire);
  }
};

// Per-invocation view. Each fan-out element gets its own copy carrying its
// source index; the RunContext behind it is never mutated.
struct StageContext {
  std::shared_ptr<const RunContext> run;
  std::string stage;
  std::optional<std::size_t> element_index;
  std::size_t element_count{0};

  [[nodiscard]] auto operator->() const noexcept -> const RunContext * {
    return run.get();
  }
};

using StageArgs = std::vector<JsonValue>;

// A resolved stage target. Returning an error or throwing both fail the
// invocation.
using StageFunction =
    std::function<Result<JsonValue>(const StageContext &, const StageArgs &)>;

} // namespace flowcore
