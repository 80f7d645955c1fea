#pragma once

#include "flowcore/config/system_config.hpp"
#include "flowcore/core/coroutine.hpp"
#include "flowcore/core/error.hpp"
#include "flowcore/executor/executor.hpp"
#include "flowcore/util/backoff.hpp"

#include <atomic>
#include <chrono>
#include <functional>

namespace flowcore {

// Owns the connection lifecycle of one executor. Transient loss
// (ExecutorUnavailable) is retried with bounded exponential backoff and shows
// up as Degraded; an exhausted budget turns the session Unhealthy. Any other
// connect error is returned as-is on the first attempt.
class ExecutorSession {
public:
  using HealthListener = std::function<void(ExecutorHealth)>;

  ExecutorSession(IExecutor &executor, const ExecutorConfig &config);

  ExecutorSession(const ExecutorSession &) = delete;
  ExecutorSession &operator=(const ExecutorSession &) = delete;

  [[nodiscard]] auto ensure_connected() -> task<Result<void>>;
  auto disconnect() -> void;

  [[nodiscard]] auto health() const noexcept -> ExecutorHealth {
    return health_.load(std::memory_order_acquire);
  }
  [[nodiscard]] auto executor() noexcept -> IExecutor & { return executor_; }
  auto on_health_change(HealthListener listener) -> void {
    listener_ = std::move(listener);
  }

private:
  auto set_health(ExecutorHealth health) -> void;

  IExecutor &executor_;
  BoundedBackoff::Config backoff_cfg_;
  std::chrono::milliseconds reconnect_timeout_;
  std::atomic<ExecutorHealth> health_{ExecutorHealth::Healthy};
  HealthListener listener_;
};

} // namespace flowcore
