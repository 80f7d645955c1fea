#include "flowcore/executor/executor_session.hpp"

#include "flowcore/core/runtime.hpp"
#include "flowcore/util/log.hpp"

#include <algorithm>

namespace flowcore {

ExecutorSession::ExecutorSession(IExecutor &executor,
                                 const ExecutorConfig &config)
    : executor_(executor),
      backoff_cfg_{
          .initial_delay =
              std::chrono::milliseconds(config.reconnect_initial_backoff_ms),
          .max_delay =
              std::chrono::milliseconds(config.reconnect_max_backoff_ms),
          .max_attempts = config.max_reconnect_attempts},
      reconnect_timeout_(config.reconnect_timeout_ms) {}

auto ExecutorSession::set_health(ExecutorHealth health) -> void {
  auto prev = health_.exchange(health, std::memory_order_acq_rel);
  if (prev == health) {
    return;
  }
  if (health == ExecutorHealth::Healthy) {
    log::info("Executor health: {} -> {}", to_string_view(prev),
              to_string_view(health));
  } else {
    log::warn("Executor health: {} -> {}", to_string_view(prev),
              to_string_view(health));
  }
  if (listener_) {
    listener_(health);
  }
}

auto ExecutorSession::ensure_connected() -> task<Result<void>> {
  if (executor_.connected()) {
    co_return ok();
  }

  BoundedBackoff backoff(backoff_cfg_);
  const auto deadline = std::chrono::steady_clock::now() + reconnect_timeout_;

  while (true) {
    auto r = executor_.connect();
    if (r) {
      set_health(ExecutorHealth::Healthy);
      co_return ok();
    }
    if (r.error() != make_error_code(Error::ExecutorUnavailable)) {
      log::error("Executor connect failed permanently: {}",
                 r.error().message());
      set_health(ExecutorHealth::Unhealthy);
      co_return fail(r.error());
    }

    if (backoff.exhausted() ||
        std::chrono::steady_clock::now() >= deadline) {
      log::error("Executor unreachable after {} attempts",
                 backoff.attempts() + 1);
      set_health(ExecutorHealth::Unhealthy);
      co_return fail(Error::ExecutorUnavailable);
    }

    set_health(ExecutorHealth::Degraded);
    auto delay = backoff.next();
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    log::debug("Executor unavailable, retry {} in {}ms", backoff.attempts(),
               std::min(delay, remaining).count());
    if (auto slept = co_await async_sleep(std::min(delay, remaining));
        !slept) {
      co_return fail(slept.error());
    }
  }
}

auto ExecutorSession::disconnect() -> void { executor_.disconnect(); }

} // namespace flowcore
