#pragma once

#include "flowcore/core/asio_awaitable.hpp"
#include "flowcore/core/coroutine.hpp"
#include "flowcore/core/error.hpp"
#include "flowcore/core/shard.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

namespace flowcore {

inline constexpr shard_id kInvalidShard = std::numeric_limits<shard_id>::max();

class Runtime {
public:
  explicit Runtime(unsigned num_shards = 0);
  ~Runtime() noexcept;

  Runtime(const Runtime &) = delete;
  Runtime &operator=(const Runtime &) = delete;

  [[nodiscard]] auto start() -> Result<void>;
  auto stop() noexcept -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool;

  /// Launch a coroutine on the given shard.
  template <typename T> auto spawn_on(shard_id target, task<T> coro) -> void {
    co_spawn(shards_[target % num_shards_]->ctx().get_executor(),
             std::move(coro), detached);
  }

  /// Launch on the calling shard, or shard 0 from a foreign thread.
  template <typename T> auto spawn(task<T> coro) -> void {
    auto sid = current_shard();
    if (sid == kInvalidShard)
      sid = 0;
    spawn_on(sid, std::move(coro));
  }

  /// Round-robin launch for callers that have no shard affinity.
  template <typename T> auto spawn_external(task<T> coro) -> void {
    auto target = static_cast<shard_id>(
        external_rr_.fetch_add(1, std::memory_order_relaxed) % num_shards_);
    spawn_on(target, std::move(coro));
  }

  template <typename F> auto post_to(shard_id target, F &&fn) -> void {
    boost::asio::post(shards_[target % num_shards_]->ctx().get_executor(),
                      std::forward<F>(fn));
  }

  [[nodiscard]] auto shard_count() const noexcept -> unsigned {
    return num_shards_;
  }
  [[nodiscard]] auto current_shard() const noexcept -> shard_id;
  [[nodiscard]] auto is_current_shard() const noexcept -> bool;
  [[nodiscard]] auto shard(shard_id id) noexcept -> Shard & {
    return *shards_[id % num_shards_];
  }
  [[nodiscard]] auto executor_for(shard_id id)
      -> boost::asio::io_context::executor_type {
    return shards_[id % num_shards_]->ctx().get_executor();
  }

private:
  auto run_shard(shard_id id) -> void;

  alignas(64) std::atomic<bool> running_{false};
  unsigned num_shards_;
  std::vector<std::unique_ptr<Shard>> shards_;
  std::vector<std::optional<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>>
      work_guards_;
  std::vector<std::jthread> threads_;
  alignas(64) std::atomic<std::uint64_t> external_rr_{0};
};

namespace detail {
inline thread_local shard_id current_shard_id = kInvalidShard;
inline thread_local const Runtime *current_runtime = nullptr;
} // namespace detail

/// Yield to the current executor's event loop once.
[[nodiscard]] inline auto async_yield() -> spawn_task {
  auto executor = co_await boost::asio::this_coro::executor;
  co_await boost::asio::post(executor, use_awaitable);
}

/// Suspend for `duration` on whatever executor the caller runs on.
/// Returns Cancelled if the wait was aborted.
template <typename Rep, typename Period>
[[nodiscard]] auto async_sleep(std::chrono::duration<Rep, Period> duration)
    -> task<Result<void>> {
  boost::asio::steady_timer timer(
      co_await boost::asio::this_coro::executor,
      std::chrono::duration_cast<boost::asio::steady_timer::duration>(
          duration));
  auto [ec] = co_await timer.async_wait(use_nothrow);
  if (ec == boost::asio::error::operation_aborted) {
    co_return fail(Error::Cancelled);
  }
  if (ec) {
    co_return fail(ec);
  }
  co_return ok();
}

} // namespace flowcore
