#pragma once

#include "flowcore/core/error.hpp"

#include <chrono>
#include <cstdint>
#include <format>
#include <sstream>
#include <string>
#include <string_view>

namespace flowcore::util {

using TimePoint = std::chrono::system_clock::time_point;

// YYYY-MM-DDTHH:MM:SSZ; the epoch renders as an empty string.
[[nodiscard]] inline auto format_iso8601(TimePoint tp) -> std::string {
  if (tp == TimePoint{})
    return {};
  return std::format("{:%Y-%m-%dT%H:%M:%SZ}",
                     std::chrono::floor<std::chrono::seconds>(tp));
}

[[nodiscard]] inline auto parse_iso8601(std::string_view text)
    -> Result<TimePoint> {
  std::istringstream in{std::string(text)};
  std::chrono::sys_seconds tp{};
  in >> std::chrono::parse("%Y-%m-%dT%H:%M:%SZ", tp);
  if (in.fail()) {
    return fail(Error::ParseError);
  }
  return ok(TimePoint{tp});
}

[[nodiscard]] inline auto floor_minute(TimePoint tp) -> TimePoint {
  return std::chrono::floor<std::chrono::minutes>(tp);
}

[[nodiscard]] inline auto to_unix_millis(TimePoint tp) -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

} // namespace flowcore::util
