#pragma once

#include "flowcore/core/coroutine.hpp"
#include "flowcore/core/error.hpp"
#include "flowcore/run/workflow_run.hpp"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace flowcore {

// Terminal snapshot of one run, delivered once to every waiter.
class RunCompletion {
public:
  // Only the first call has any effect.
  auto complete(const WorkflowRun &run) -> void;

  [[nodiscard]] auto result() const -> std::optional<WorkflowRun>;
  [[nodiscard]] auto wait_for(std::chrono::milliseconds timeout) const
      -> std::optional<WorkflowRun>;
  // Resumes the caller on its own executor.
  [[nodiscard]] auto async_wait() -> task<WorkflowRun>;

private:
  mutable std::mutex mu_;
  mutable std::condition_variable cv_;
  std::optional<WorkflowRun> result_;
  std::vector<std::move_only_function<void(const WorkflowRun &)>> waiters_;
};

class RunHandle {
public:
  RunHandle(RunId id, std::string name,
            std::shared_ptr<RunCompletion> completion)
      : id_(std::move(id)), name_(std::move(name)),
        completion_(std::move(completion)) {}

  [[nodiscard]] auto id() const noexcept -> const RunId & { return id_; }
  [[nodiscard]] auto name() const noexcept -> const std::string & {
    return name_;
  }
  [[nodiscard]] auto done() const -> bool {
    return completion_->result().has_value();
  }

  [[nodiscard]] auto await() const -> task<WorkflowRun> {
    return completion_->async_wait();
  }
  // Blocks the calling thread; Timeout if the run is still going.
  [[nodiscard]] auto wait(std::chrono::milliseconds timeout) const
      -> Result<WorkflowRun> {
    if (auto run = completion_->wait_for(timeout)) {
      return ok(std::move(*run));
    }
    return fail(Error::Timeout);
  }

private:
  RunId id_;
  std::string name_;
  std::shared_ptr<RunCompletion> completion_;
};

} // namespace flowcore
