#pragma once

#include "flowcore/core/coroutine.hpp"
#include "flowcore/util/time.hpp"

#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

namespace flowcore {

// One wake of the clock: the minute being evaluated and the last minute that
// was evaluated before it, if any. Minutes strictly between the two were
// missed.
struct TickWindow {
  util::TimePoint current{};
  std::optional<util::TimePoint> previous;

  [[nodiscard]] auto missed_count() const -> std::int64_t;
};

// Drives schedule evaluation once per minute boundary (UTC).
class ScheduleClock {
public:
  using TickHandler = std::function<void(const TickWindow &)>;
  using NowFn = std::function<util::TimePoint()>;
  using LoadWatermark = std::function<std::optional<util::TimePoint>()>;
  using SaveWatermark = std::function<void(util::TimePoint)>;

  explicit ScheduleClock(TickHandler handler, NowFn now = {});
  ~ScheduleClock();

  ScheduleClock(const ScheduleClock &) = delete;
  auto operator=(const ScheduleClock &) -> ScheduleClock & = delete;

  auto set_load_watermark(LoadWatermark fn) -> void;
  auto set_save_watermark(SaveWatermark fn) -> void;

  // Evaluates the minute containing `now` unless it was already evaluated.
  // Returns whether the handler ran.
  auto advance_to(util::TimePoint now) -> bool;
  auto advance() -> bool;

  // Ticks until stop(). Must be spawned on a single executor.
  [[nodiscard]] auto run() -> spawn_task;
  auto stop() -> void;

  [[nodiscard]] auto watermark() const -> std::optional<util::TimePoint>;
  [[nodiscard]] auto is_running() const noexcept -> bool {
    return running_.load(std::memory_order_acquire);
  }

private:
  TickHandler handler_;
  NowFn now_;
  LoadWatermark load_watermark_;
  SaveWatermark save_watermark_;

  mutable std::mutex mu_;
  std::optional<util::TimePoint> watermark_;
  bool watermark_loaded_{false};
  std::shared_ptr<boost::asio::steady_timer> timer_;
  std::atomic<bool> running_{false};
};

} // namespace flowcore
