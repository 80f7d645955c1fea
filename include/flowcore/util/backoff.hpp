#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>

namespace flowcore {

// Exponential delay schedule with a hard attempt budget. next() returns the
// delay to wait before the following attempt, doubling up to max_delay.
class BoundedBackoff {
public:
  struct Config {
    std::chrono::milliseconds initial_delay{50};
    std::chrono::milliseconds max_delay{2000};
    int max_attempts{5};
  };

  BoundedBackoff() = default;
  explicit BoundedBackoff(Config cfg) : cfg_(cfg) {}

  [[nodiscard]] auto exhausted() const noexcept -> bool {
    return attempts_ >= cfg_.max_attempts;
  }

  [[nodiscard]] auto next() noexcept -> std::chrono::milliseconds {
    const auto shift = static_cast<unsigned>(std::min(attempts_, 20));
    ++attempts_;
    auto delay = cfg_.initial_delay * (std::int64_t{1} << shift);
    return std::min(delay, cfg_.max_delay);
  }

  auto reset() noexcept -> void { attempts_ = 0; }

  [[nodiscard]] auto attempts() const noexcept -> int { return attempts_; }

private:
  Config cfg_;
  int attempts_{0};
};

} // namespace flowcore
