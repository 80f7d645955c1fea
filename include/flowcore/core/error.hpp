#pragma once

#include <array>
#include <cerrno>
#include <concepts>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace flowcore {

enum class Error : std::uint8_t {
  Success,
  FileNotFound,
  ParseError,
  InvalidArgument,
  NotFound,
  AlreadyExists,
  Timeout,
  Cancelled,
  InvalidState,
  SystemNotRunning,
  ResourceExhausted,
  ValidationFailed,
  ResolutionFailed,
  ExecutionFailed,
  StorageUnavailable,
  SerializationFailed,
  RuleEvaluationFailed,
  ExecutorUnavailable,
  Unknown,
};

class ErrorCategory : public std::error_category {
  static constexpr std::array<std::string_view, 19> messages = {
      "success",
      "file not found",
      "parse error",
      "invalid argument",
      "not found",
      "already exists",
      "timeout",
      "cancelled",
      "invalid state transition",
      "system not running",
      "resource exhausted",
      "workflow validation failed",
      "stage target could not be resolved",
      "stage execution failed",
      "storage tier unavailable",
      "value could not be serialized",
      "rule evaluation failed",
      "executor unavailable",
      "unknown error",
  };

public:
  [[nodiscard]] auto name() const noexcept -> const char * override {
    return "flowcore";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    auto idx = static_cast<std::size_t>(ev);
    if (idx >= std::size(messages)) {
      return "unrecognized flowcore error";
    }
    return std::string{messages.at(idx)};
  }
};

inline auto error_category() -> const ErrorCategory & {
  static const ErrorCategory instance;
  return instance;
}

inline auto make_error_code(Error e) -> std::error_code {
  return {std::to_underlying(e), error_category()};
}

// Short kind name used in run results and event payloads, e.g.
// "ExecutionError" for Error::ExecutionFailed.
[[nodiscard]] inline auto error_kind(const std::error_code &ec)
    -> std::string_view {
  if (ec.category() != error_category()) {
    return "SystemError";
  }
  switch (static_cast<Error>(ec.value())) {
  case Error::ValidationFailed:
    return "ValidationError";
  case Error::ResolutionFailed:
    return "ResolutionError";
  case Error::ExecutionFailed:
    return "ExecutionError";
  case Error::Timeout:
    return "TimeoutError";
  case Error::StorageUnavailable:
    return "StorageError";
  case Error::SerializationFailed:
    return "SerializationError";
  case Error::NotFound:
    return "NotFoundError";
  case Error::RuleEvaluationFailed:
    return "RuleEvaluationError";
  case Error::Cancelled:
    return "CancelledError";
  case Error::ExecutorUnavailable:
    return "ExecutorUnavailableError";
  default:
    return "Error";
  }
}

template <typename T>
concept ResultValue = std::destructible<T> || std::is_void_v<T>;

template <typename T> using Result = std::expected<T, std::error_code>;

template <typename T>
  requires ResultValue<std::decay_t<T>>
[[nodiscard]] constexpr auto ok(T &&value) -> Result<std::decay_t<T>> {
  return std::forward<T>(value);
}

[[nodiscard]] constexpr auto ok() -> Result<void> { return {}; }

[[nodiscard]] inline auto fail(Error e) -> std::unexpected<std::error_code> {
  return std::unexpected{make_error_code(e)};
}

[[nodiscard]] inline auto fail(std::error_code ec)
    -> std::unexpected<std::error_code> {
  return std::unexpected{ec};
}

template <typename T> [[nodiscard]] auto sys_check(T val) -> Result<T> {
  if (val < 0)
    return fail(std::error_code(errno, std::system_category()));
  return ok(val);
}

} // namespace flowcore

template <> struct std::is_error_code_enum<flowcore::Error> : std::true_type {};
