#pragma once

#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <format>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <unistd.h>
#include <utility>
#include <vector>

namespace flowcore::log {

enum class Level : std::uint8_t { Trace, Debug, Info, Warn, Error };

inline constexpr std::array<std::string_view, 5> level_names = {
    "trace", "debug", "info", "warn", "error"};

inline constexpr std::array<std::string_view, 5> level_colors = {
    "\o{33}[90m", "\o{33}[36m", "\o{33}[32m", "\o{33}[33m", "\o{33}[31m"};

[[nodiscard]] inline auto level_name(Level level) -> std::string_view {
  return level_names.at(std::to_underlying(level));
}

[[nodiscard]] inline auto parse_level(std::string_view name) noexcept
    -> std::optional<Level> {
  const auto *it = std::ranges::find(level_names, name);
  if (it == level_names.end()) {
    return std::nullopt;
  }
  return static_cast<Level>(std::distance(level_names.begin(), it));
}

// Lines are formatted on the calling thread and handed to a single writer
// thread through a bounded channel. Output is line-buffered per batch.
class Logger {
  static constexpr std::size_t kQueueCapacity = 8192;
  static constexpr std::size_t kBatchSize = 64;
  using LineChannel = boost::asio::experimental::concurrent_channel<
      boost::asio::io_context::executor_type,
      void(boost::system::error_code, std::string)>;

public:
  Logger() = default;
  ~Logger() {
    stop();
    close_file();
  }

  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  auto start() -> void {
    if (running_.exchange(true, std::memory_order_acq_rel))
      return;
    writer_ctx_.restart();
    auto channel =
        std::make_shared<LineChannel>(writer_ctx_.get_executor(), kQueueCapacity);
    channel_.store(channel, std::memory_order_release);
    writer_ = std::jthread([this, channel] { drain(channel); });
  }

  auto stop() -> void {
    if (!running_.exchange(false, std::memory_order_acq_rel))
      return;
    if (auto channel = channel_.exchange(nullptr, std::memory_order_acq_rel)) {
      channel->close();
    }
    writer_ctx_.stop();
    if (writer_.joinable()) {
      writer_.join();
    }
  }

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }
  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  auto set_output_stderr() -> void {
    std::lock_guard lock(out_mu_);
    close_file_locked();
    out_ = stderr;
  }

  auto set_output_file(std::string_view path) -> bool {
    std::lock_guard lock(out_mu_);
    if (path.empty()) {
      close_file_locked();
      out_ = stdout;
      return true;
    }
    FILE *f = std::fopen(std::string(path).c_str(), "a");
    if (f == nullptr) {
      return false;
    }
    std::setvbuf(f, nullptr, _IOLBF, 0);
    close_file_locked();
    file_ = f;
    out_ = f;
    return true;
  }

  [[nodiscard]] auto dropped() const noexcept -> std::uint64_t {
    return dropped_.load(std::memory_order_relaxed);
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args &&...args)
      -> void {
    if (level < level_.load(std::memory_order_acquire))
      return;

    const auto now = std::chrono::floor<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
    const auto tid =
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;
    std::string line;
    line.reserve(128);
    std::format_to(std::back_inserter(line), "[{:%Y-%m-%d %H:%M:%S}] [{}{}{}] [{}] ",
                   now, level_colors.at(std::to_underlying(level)),
                   level_name(level), "\o{33}[0m", tid);
    std::format_to(std::back_inserter(line), fmt, std::forward<Args>(args)...);
    line.push_back('\n');

    auto channel = channel_.load(std::memory_order_acquire);
    if (channel && channel->try_send(boost::system::error_code{}, line)) {
      return;
    }

    std::lock_guard lock(out_mu_);
    // Never block a runtime thread on a full queue when nobody is watching.
    if (channel && ::isatty(::fileno(out_)) == 0) {
      dropped_.fetch_add(1, std::memory_order_relaxed);
      return;
    }
    std::fwrite(line.data(), 1, line.size(), out_);
    std::fflush(out_);
  }

private:
  auto drain(std::shared_ptr<LineChannel> channel) -> void {
    std::vector<std::string> batch;
    batch.reserve(kBatchSize);

    while (running_.load(std::memory_order_acquire)) {
      bool closed = false;
      channel->async_receive(
          [&](const boost::system::error_code &ec, std::string line) {
            if (ec) {
              closed = true;
              return;
            }
            batch.push_back(std::move(line));
          });
      writer_ctx_.restart();
      (void)writer_ctx_.run_one();
      if (closed) {
        break;
      }
      while (batch.size() < kBatchSize &&
             channel->try_receive(
                 [&](const boost::system::error_code &ec, std::string line) {
                   if (!ec) {
                     batch.push_back(std::move(line));
                   }
                 })) {
      }
      flush(batch);
    }

    while (channel->try_receive(
        [&](const boost::system::error_code &ec, std::string line) {
          if (!ec) {
            batch.push_back(std::move(line));
          }
        })) {
    }
    flush(batch);
  }

  auto flush(std::vector<std::string> &batch) -> void {
    if (batch.empty()) {
      return;
    }
    std::lock_guard lock(out_mu_);
    for (const auto &line : batch) {
      std::fwrite(line.data(), 1, line.size(), out_);
    }
    std::fflush(out_);
    batch.clear();
  }

  auto close_file() -> void {
    std::lock_guard lock(out_mu_);
    close_file_locked();
  }

  auto close_file_locked() -> void {
    if (file_ != nullptr) {
      std::fclose(file_);
      file_ = nullptr;
      out_ = stdout;
    }
  }

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> dropped_{0};
  std::mutex out_mu_;
  FILE *out_{stdout};
  FILE *file_{nullptr};
  boost::asio::io_context writer_ctx_{1};
  std::atomic<std::shared_ptr<LineChannel>> channel_;
  std::jthread writer_;
};

inline auto logger() -> Logger & {
  static Logger instance;
  return instance;
}

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

inline auto set_level(std::string_view name) noexcept -> void {
  logger().set_level(parse_level(name).value_or(Level::Info));
}

inline auto set_output_file(std::string_view path) -> bool {
  return logger().set_output_file(path);
}

inline auto set_output_stderr() -> void { logger().set_output_stderr(); }

inline auto start() -> void { logger().start(); }
inline auto stop() -> void { logger().stop(); }

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

} // namespace flowcore::log
