#pragma once

#include <cstdio>
#include <format>
#include <string>
#include <string_view>
#include <unistd.h>

namespace flowcore::cli::fmt {

namespace ansi {

inline auto is_tty() noexcept -> bool {
  static const bool tty = ::isatty(::fileno(stdout));
  return tty;
}

inline constexpr std::string_view kReset = "\033[0m";
inline constexpr std::string_view kBold = "\033[1m";
inline constexpr std::string_view kGreen = "\033[32m";
inline constexpr std::string_view kRed = "\033[31m";
inline constexpr std::string_view kYellow = "\033[33m";

inline auto colorize(std::string_view text, std::string_view color)
    -> std::string {
  if (!is_tty()) {
    return std::string(text);
  }
  return std::format("{}{}{}", color, text, kReset);
}

inline auto bold(std::string_view text) -> std::string {
  return colorize(text, kBold);
}

inline auto green(std::string_view text) -> std::string {
  return colorize(text, kGreen);
}

inline auto red(std::string_view text) -> std::string {
  return colorize(text, kRed);
}

inline auto yellow(std::string_view text) -> std::string {
  return colorize(text, kYellow);
}

} // namespace ansi

inline auto colorize_run_state(std::string_view state) -> std::string {
  if (state == "completed")
    return ansi::green(state);
  if (state == "failed")
    return ansi::red(state);
  if (state == "running" || state == "cancelled")
    return ansi::yellow(state);
  return std::string(state);
}

} // namespace flowcore::cli::fmt
