#include "flowcore/config/config.hpp"
#include "flowcore/config/toml_util.hpp"

#include "flowcore/core/error.hpp"
#include "flowcore/util/log.hpp"

#include <boost/lexical_cast.hpp>

#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>

namespace flowcore {
namespace detail {

struct ComputeToml {
  std::string default_namespace{"default"};
  std::string default_os_strategy{"fallback"};
  int run_retention_seconds{86400};
  int stage_timeout_ms{0};
  int run_timeout_ms{0};
};

struct ExecutorToml {
  std::string kind{"local"};
  int threads{0};
  int reconnect_timeout_ms{10000};
  int max_reconnect_attempts{5};
  int reconnect_initial_backoff_ms{50};
  int reconnect_max_backoff_ms{2000};
};

struct StorageToml {
  std::string artifact_dir{"./artifacts"};
  std::int64_t cluster_memory_max_entry_bytes{0};
};

struct TriggersToml {
  std::string missing_var{"falsy"};
  std::string missed_ticks{"skip"};
  int max_catchup_ticks{60};
};

struct LoggingToml {
  std::string level{"info"};
  std::string file;
};

struct RuntimeToml {
  int shards{0};
};

struct SystemToml {
  ComputeToml compute{};
  ExecutorToml executor{};
  StorageToml storage{};
  TriggersToml triggers{};
  LoggingToml logging{};
  RuntimeToml runtime{};
};

} // namespace detail
} // namespace flowcore

namespace glz {
template <> struct meta<flowcore::detail::ComputeToml> {
  using T = flowcore::detail::ComputeToml;
  static constexpr auto value = object(
      "default_namespace", &T::default_namespace, "default_os_strategy",
      &T::default_os_strategy, "run_retention_seconds",
      &T::run_retention_seconds, "stage_timeout_ms", &T::stage_timeout_ms,
      "run_timeout_ms", &T::run_timeout_ms);
};

template <> struct meta<flowcore::detail::ExecutorToml> {
  using T = flowcore::detail::ExecutorToml;
  static constexpr auto value =
      object("kind", &T::kind, "threads", &T::threads, "reconnect_timeout_ms",
             &T::reconnect_timeout_ms, "max_reconnect_attempts",
             &T::max_reconnect_attempts, "reconnect_initial_backoff_ms",
             &T::reconnect_initial_backoff_ms, "reconnect_max_backoff_ms",
             &T::reconnect_max_backoff_ms);
};

template <> struct meta<flowcore::detail::StorageToml> {
  using T = flowcore::detail::StorageToml;
  static constexpr auto value =
      object("artifact_dir", &T::artifact_dir,
             "cluster_memory_max_entry_bytes",
             &T::cluster_memory_max_entry_bytes);
};

template <> struct meta<flowcore::detail::TriggersToml> {
  using T = flowcore::detail::TriggersToml;
  static constexpr auto value =
      object("missing_var", &T::missing_var, "missed_ticks", &T::missed_ticks,
             "max_catchup_ticks", &T::max_catchup_ticks);
};

template <> struct meta<flowcore::detail::LoggingToml> {
  using T = flowcore::detail::LoggingToml;
  static constexpr auto value = object("level", &T::level, "file", &T::file);
};

template <> struct meta<flowcore::detail::RuntimeToml> {
  using T = flowcore::detail::RuntimeToml;
  static constexpr auto value = object("shards", &T::shards);
};

template <> struct meta<flowcore::detail::SystemToml> {
  using T = flowcore::detail::SystemToml;
  static constexpr auto value =
      object("compute", &T::compute, "executor", &T::executor, "storage",
             &T::storage, "triggers", &T::triggers, "logging", &T::logging,
             "runtime", &T::runtime);
};
} // namespace glz

namespace flowcore {
namespace {

[[nodiscard]] auto env(const char *name) -> std::optional<std::string_view> {
  if (const char *v = std::getenv(name); v != nullptr) {
    return std::string_view{v};
  }
  return std::nullopt;
}

// Enum-valued settings are strict: an unknown token is a config error rather
// than a silent fallback to the default.
template <typename E>
[[nodiscard]] auto parse_strict(std::string_view field, std::string_view text)
    -> Result<E> {
  if (auto v = util::try_parse_enum<E>(text)) {
    return ok(*v);
  }
  log::error("Invalid value '{}' for config field '{}'", text, field);
  return fail(Error::ParseError);
}

auto apply_env_overrides(detail::SystemToml &raw) -> void {
  if (auto v = env("FLOWCORE_DEFAULT_NAMESPACE")) {
    raw.compute.default_namespace = *v;
  }
  if (auto v = env("FLOWCORE_DEFAULT_OS_STRATEGY")) {
    raw.compute.default_os_strategy = *v;
  }
  if (auto v = env("FLOWCORE_RUN_RETENTION_SECONDS")) {
    raw.compute.run_retention_seconds = boost::lexical_cast<int>(*v);
  }
  if (auto v = env("FLOWCORE_STAGE_TIMEOUT_MS")) {
    raw.compute.stage_timeout_ms = boost::lexical_cast<int>(*v);
  }
  if (auto v = env("FLOWCORE_RUN_TIMEOUT_MS")) {
    raw.compute.run_timeout_ms = boost::lexical_cast<int>(*v);
  }
  if (auto v = env("FLOWCORE_EXECUTOR_THREADS")) {
    raw.executor.threads = boost::lexical_cast<int>(*v);
  }
  if (auto v = env("FLOWCORE_EXECUTOR_RECONNECT_TIMEOUT_MS")) {
    raw.executor.reconnect_timeout_ms = boost::lexical_cast<int>(*v);
  }
  if (auto v = env("FLOWCORE_EXECUTOR_MAX_RECONNECT_ATTEMPTS")) {
    raw.executor.max_reconnect_attempts = boost::lexical_cast<int>(*v);
  }
  if (auto v = env("FLOWCORE_ARTIFACT_DIR")) {
    raw.storage.artifact_dir = *v;
  }
  if (auto v = env("FLOWCORE_CLUSTER_MEMORY_MAX_ENTRY_BYTES")) {
    raw.storage.cluster_memory_max_entry_bytes =
        boost::lexical_cast<std::int64_t>(*v);
  }
  if (auto v = env("FLOWCORE_TRIGGERS_MISSING_VAR")) {
    raw.triggers.missing_var = *v;
  }
  if (auto v = env("FLOWCORE_TRIGGERS_MISSED_TICKS")) {
    raw.triggers.missed_ticks = *v;
  }
  if (auto v = env("FLOWCORE_LOG_LEVEL")) {
    raw.logging.level = *v;
  }
  if (auto v = env("FLOWCORE_LOG_FILE")) {
    raw.logging.file = *v;
  }
  if (auto v = env("FLOWCORE_RUNTIME_SHARDS")) {
    raw.runtime.shards = boost::lexical_cast<int>(*v);
  }
}

[[nodiscard]] auto convert_toml(std::string_view toml_text)
    -> Result<SystemConfig> {
  auto raw_result = toml_util::parse_toml<detail::SystemToml>(toml_text);
  if (!raw_result)
    return fail(raw_result.error());
  auto &raw = *raw_result;
  apply_env_overrides(raw);

  SystemConfig cfg{};
  cfg.compute.default_namespace = std::move(raw.compute.default_namespace);
  auto strategy = parse_strict<Strategy>("compute.default_os_strategy",
                                         raw.compute.default_os_strategy);
  if (!strategy)
    return fail(strategy.error());
  cfg.compute.default_os_strategy = *strategy;
  cfg.compute.run_retention_seconds = raw.compute.run_retention_seconds;
  cfg.compute.stage_timeout_ms = raw.compute.stage_timeout_ms;
  cfg.compute.run_timeout_ms = raw.compute.run_timeout_ms;

  auto kind = parse_strict<ExecutorKind>("executor.kind", raw.executor.kind);
  if (!kind)
    return fail(kind.error());
  cfg.executor.kind = *kind;
  cfg.executor.threads = raw.executor.threads;
  cfg.executor.reconnect_timeout_ms = raw.executor.reconnect_timeout_ms;
  cfg.executor.max_reconnect_attempts = raw.executor.max_reconnect_attempts;
  cfg.executor.reconnect_initial_backoff_ms =
      raw.executor.reconnect_initial_backoff_ms;
  cfg.executor.reconnect_max_backoff_ms = raw.executor.reconnect_max_backoff_ms;

  cfg.storage.artifact_dir = std::move(raw.storage.artifact_dir);
  if (raw.storage.cluster_memory_max_entry_bytes < 0)
    return fail(Error::ParseError);
  cfg.storage.cluster_memory_max_entry_bytes =
      static_cast<std::uint64_t>(raw.storage.cluster_memory_max_entry_bytes);

  auto missing = parse_strict<MissingVarPolicy>("triggers.missing_var",
                                                raw.triggers.missing_var);
  if (!missing)
    return fail(missing.error());
  cfg.triggers.missing_var = *missing;
  auto missed = parse_strict<MissedTickPolicy>("triggers.missed_ticks",
                                               raw.triggers.missed_ticks);
  if (!missed)
    return fail(missed.error());
  cfg.triggers.missed_ticks = *missed;
  cfg.triggers.max_catchup_ticks = raw.triggers.max_catchup_ticks;

  if (!log::parse_level(raw.logging.level)) {
    log::error("Invalid log level '{}'", raw.logging.level);
    return fail(Error::ParseError);
  }
  cfg.logging.level = std::move(raw.logging.level);
  cfg.logging.file = std::move(raw.logging.file);
  cfg.runtime.shards = raw.runtime.shards;

  if (cfg.compute.default_namespace.empty() ||
      cfg.compute.run_retention_seconds < 0 ||
      cfg.compute.stage_timeout_ms < 0 || cfg.compute.run_timeout_ms < 0 ||
      cfg.executor.threads < 0 || cfg.executor.reconnect_timeout_ms < 0 ||
      cfg.executor.max_reconnect_attempts < 1 ||
      cfg.executor.reconnect_initial_backoff_ms < 0 ||
      cfg.executor.reconnect_max_backoff_ms <
          cfg.executor.reconnect_initial_backoff_ms ||
      cfg.triggers.max_catchup_ticks < 0 || cfg.runtime.shards < 0) {
    return fail(Error::ParseError);
  }
  return ok(std::move(cfg));
}

} // namespace

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<SystemConfig> {
  auto text = toml_util::read_file(path);
  if (!text) {
    return fail(text.error());
  }
  return load_from_string(*text);
}

auto ConfigLoader::load_from_string(std::string_view toml_str)
    -> Result<SystemConfig> {
  try {
    return convert_toml(toml_str);
  } catch (const boost::bad_lexical_cast &e) {
    log::error("Invalid numeric environment override: {}", e.what());
    return fail(Error::ParseError);
  } catch (const std::exception &e) {
    log::error("Failed to parse TOML system configuration: {}", e.what());
    return fail(Error::ParseError);
  }
}

} // namespace flowcore
