#include "flowcore/trigger/schedule_clock.hpp"

#include "flowcore/core/asio_awaitable.hpp"
#include "flowcore/util/log.hpp"

#include <boost/asio/post.hpp>

#include <chrono>

namespace flowcore {

auto TickWindow::missed_count() const -> std::int64_t {
  if (!previous || *previous >= current) {
    return 0;
  }
  return std::chrono::duration_cast<std::chrono::minutes>(current - *previous)
             .count() -
         1;
}

ScheduleClock::ScheduleClock(TickHandler handler, NowFn now)
    : handler_(std::move(handler)), now_(std::move(now)) {
  if (!now_) {
    now_ = [] { return std::chrono::system_clock::now(); };
  }
}

ScheduleClock::~ScheduleClock() { stop(); }

auto ScheduleClock::set_load_watermark(LoadWatermark fn) -> void {
  std::lock_guard lock(mu_);
  load_watermark_ = std::move(fn);
  watermark_loaded_ = false;
}

auto ScheduleClock::set_save_watermark(SaveWatermark fn) -> void {
  std::lock_guard lock(mu_);
  save_watermark_ = std::move(fn);
}

auto ScheduleClock::advance_to(util::TimePoint now) -> bool {
  TickWindow window{.current = util::floor_minute(now)};
  {
    std::lock_guard lock(mu_);
    if (!watermark_loaded_) {
      if (load_watermark_) {
        if (auto saved = load_watermark_()) {
          watermark_ = util::floor_minute(*saved);
        }
      }
      watermark_loaded_ = true;
    }
    if (watermark_ && *watermark_ >= window.current) {
      return false;
    }
    window.previous = watermark_;
    watermark_ = window.current;
  }

  if (window.missed_count() > 0) {
    log::info("Schedule clock resumed after {} missed minute(s)",
              window.missed_count());
  }
  if (handler_) {
    handler_(window);
  }

  SaveWatermark save;
  {
    std::lock_guard lock(mu_);
    save = save_watermark_;
  }
  if (save) {
    save(window.current);
  }
  return true;
}

auto ScheduleClock::advance() -> bool { return advance_to(now_()); }

auto ScheduleClock::run() -> spawn_task {
  if (running_.exchange(true, std::memory_order_acq_rel)) {
    co_return;
  }
  auto timer = std::make_shared<boost::asio::steady_timer>(
      co_await boost::asio::this_coro::executor);
  {
    std::lock_guard lock(mu_);
    timer_ = timer;
  }
  log::info("Schedule clock started");

  while (running_.load(std::memory_order_acquire)) {
    (void)advance();

    const auto now = now_();
    const auto next_boundary = util::floor_minute(now) + std::chrono::minutes(1);
    timer->expires_after(
        std::chrono::duration_cast<boost::asio::steady_timer::duration>(
            next_boundary - now));
    auto [ec] = co_await timer->async_wait(use_nothrow);
    if (ec == boost::asio::error::operation_aborted) {
      break;
    }
    if (ec) {
      log::warn("Schedule clock timer failed: {}", ec.message());
      break;
    }
  }

  {
    std::lock_guard lock(mu_);
    if (timer_ == timer) {
      timer_.reset();
    }
  }
  running_.store(false, std::memory_order_release);
  log::info("Schedule clock stopped");
}

auto ScheduleClock::stop() -> void {
  std::shared_ptr<boost::asio::steady_timer> timer;
  {
    std::lock_guard lock(mu_);
    timer = timer_;
  }
  if (!running_.exchange(false, std::memory_order_acq_rel) || !timer) {
    return;
  }
  boost::asio::post(timer->get_executor(), [timer] { timer->cancel(); });
}

auto ScheduleClock::watermark() const -> std::optional<util::TimePoint> {
  std::lock_guard lock(mu_);
  return watermark_;
}

} // namespace flowcore
