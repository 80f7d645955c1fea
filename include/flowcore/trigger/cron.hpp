#pragma once

#include "flowcore/core/error.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace flowcore {

// Five-field cron expression: minute hour day-of-month month day-of-week.
// Fields accept *, numbers, a-b ranges, comma lists and /step; month and
// weekday also accept three-letter names. @hourly, @daily, @weekly,
// @monthly and @yearly expand to their usual forms. Times are UTC.
class CronExpr {
public:
  // One bit per allowed value of each field.
  struct Masks {
    std::uint64_t minute{0};
    std::uint64_t hour{0};
    std::uint64_t dom{0};
    std::uint64_t month{0};
    std::uint64_t dow{0};
    bool any_dom{true};
    bool any_dow{true};
  };

  [[nodiscard]] static auto parse(std::string_view expr) -> Result<CronExpr>;

  // Whether the minute containing `tp` is a fire time.
  [[nodiscard]] auto matches(std::chrono::system_clock::time_point tp) const
      -> bool;

  [[nodiscard]] auto raw() const noexcept -> const std::string & {
    return raw_;
  }

private:
  CronExpr(std::string raw, Masks masks)
      : raw_(std::move(raw)), masks_(masks) {}

  std::string raw_;
  Masks masks_;
};

} // namespace flowcore
