#pragma once

#include "flowcore/store/strategy.hpp"
#include "flowcore/util/enum.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>
#include <string>

namespace flowcore {

struct ComputeConfig {
  std::string default_namespace{"default"};
  Strategy default_os_strategy{Strategy::Fallback};
  int run_retention_seconds{86400};
  int stage_timeout_ms{0}; // 0 = none
  int run_timeout_ms{0};   // 0 = none

  auto operator==(const ComputeConfig &) const -> bool = default;
};

enum class ExecutorKind : std::uint8_t { Local };
BOOST_DESCRIBE_ENUM(ExecutorKind, Local)
FLOWCORE_DEFINE_ENUM_SERDE(ExecutorKind)

struct ExecutorConfig {
  ExecutorKind kind{ExecutorKind::Local};
  int threads{0}; // 0 = hardware_concurrency
  int reconnect_timeout_ms{10000};
  int max_reconnect_attempts{5};
  int reconnect_initial_backoff_ms{50};
  int reconnect_max_backoff_ms{2000};

  auto operator==(const ExecutorConfig &) const -> bool = default;
};

struct StorageConfig {
  std::string artifact_dir{"./artifacts"};
  std::uint64_t cluster_memory_max_entry_bytes{0}; // 0 = unlimited

  auto operator==(const StorageConfig &) const -> bool = default;
};

// What a `var` node yields when its path is absent from the event.
enum class MissingVarPolicy : std::uint8_t { Falsy, Error };
BOOST_DESCRIBE_ENUM(MissingVarPolicy, Falsy, Error)
FLOWCORE_DEFINE_ENUM_SERDE(MissingVarPolicy)

// How minute ticks that elapsed while the clock was not running are handled.
enum class MissedTickPolicy : std::uint8_t { Skip, FireOnce, FireAll };
BOOST_DESCRIBE_ENUM(MissedTickPolicy, Skip, FireOnce, FireAll)
FLOWCORE_DEFINE_ENUM_SERDE(MissedTickPolicy)

struct TriggerConfig {
  MissingVarPolicy missing_var{MissingVarPolicy::Falsy};
  MissedTickPolicy missed_ticks{MissedTickPolicy::Skip};
  int max_catchup_ticks{60};

  auto operator==(const TriggerConfig &) const -> bool = default;
};

struct LoggingConfig {
  std::string level{"info"};
  std::string file;

  auto operator==(const LoggingConfig &) const -> bool = default;
};

struct RuntimeConfig {
  int shards{0}; // 0 = auto

  auto operator==(const RuntimeConfig &) const -> bool = default;
};

struct SystemConfig {
  ComputeConfig compute;
  ExecutorConfig executor;
  StorageConfig storage;
  TriggerConfig triggers;
  LoggingConfig logging;
  RuntimeConfig runtime;

  auto operator==(const SystemConfig &) const -> bool = default;
};

} // namespace flowcore
