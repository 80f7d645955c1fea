#include "flowcore/config/config.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <cstdlib>
#include <string>

using namespace flowcore;

namespace {

// Sets an environment variable for the lifetime of the guard.
class ScopedEnv {
public:
  ScopedEnv(const char *name, const char *value) : name_(name) {
    ::setenv(name, value, 1);
  }
  ~ScopedEnv() { ::unsetenv(name_); }
  ScopedEnv(const ScopedEnv &) = delete;
  ScopedEnv &operator=(const ScopedEnv &) = delete;

private:
  const char *name_;
};

} // namespace

TEST(ConfigTest, ComputeDefaults) {
  ComputeConfig cfg;
  EXPECT_EQ(cfg.default_namespace, "default");
  EXPECT_EQ(cfg.default_os_strategy, Strategy::Fallback);
  EXPECT_EQ(cfg.run_retention_seconds, 86400);
  EXPECT_EQ(cfg.stage_timeout_ms, 0);
  EXPECT_EQ(cfg.run_timeout_ms, 0);
}

TEST(ConfigTest, ExecutorAndTriggerDefaults) {
  ExecutorConfig executor;
  EXPECT_EQ(executor.kind, ExecutorKind::Local);
  EXPECT_EQ(executor.reconnect_timeout_ms, 10000);
  EXPECT_EQ(executor.max_reconnect_attempts, 5);

  TriggerConfig triggers;
  EXPECT_EQ(triggers.missing_var, MissingVarPolicy::Falsy);
  EXPECT_EQ(triggers.missed_ticks, MissedTickPolicy::Skip);
  EXPECT_EQ(triggers.max_catchup_ticks, 60);
}

TEST(ConfigTest, EmptyDocumentYieldsDefaults) {
  auto result = ConfigLoader::load_from_string("");
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, SystemConfig{});
}

TEST(ConfigTest, LoadFromTomlString) {
  std::string toml = R"(
[compute]
default_namespace = "analytics"
default_os_strategy = "artifact"
run_retention_seconds = 600
stage_timeout_ms = 1500

[executor]
kind = "local"
threads = 6
max_reconnect_attempts = 2

[storage]
artifact_dir = "/var/lib/flowcore"
cluster_memory_max_entry_bytes = 1048576

[triggers]
missing_var = "error"
missed_ticks = "fire_all"
max_catchup_ticks = 10

[logging]
level = "debug"

[runtime]
shards = 3
)";

  auto result = ConfigLoader::load_from_string(toml);
  ASSERT_TRUE(result.has_value()) << result.error().message();

  EXPECT_EQ(result->compute.default_namespace, "analytics");
  EXPECT_EQ(result->compute.default_os_strategy, Strategy::Artifact);
  EXPECT_EQ(result->compute.run_retention_seconds, 600);
  EXPECT_EQ(result->compute.stage_timeout_ms, 1500);
  EXPECT_EQ(result->compute.run_timeout_ms, 0);
  EXPECT_EQ(result->executor.threads, 6);
  EXPECT_EQ(result->executor.max_reconnect_attempts, 2);
  EXPECT_EQ(result->storage.artifact_dir, "/var/lib/flowcore");
  EXPECT_EQ(result->storage.cluster_memory_max_entry_bytes, 1048576u);
  EXPECT_EQ(result->triggers.missing_var, MissingVarPolicy::Error);
  EXPECT_EQ(result->triggers.missed_ticks, MissedTickPolicy::FireAll);
  EXPECT_EQ(result->triggers.max_catchup_ticks, 10);
  EXPECT_EQ(result->logging.level, "debug");
  EXPECT_EQ(result->runtime.shards, 3);
}

TEST(ConfigTest, UnknownKeysAreTolerated) {
  auto result = ConfigLoader::load_from_string(R"(
[compute]
default_namespace = "x"
future_option = true
)");
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->compute.default_namespace, "x");
}

TEST(ConfigTest, UnknownEnumTokensAreErrors) {
  EXPECT_FALSE(ConfigLoader::load_from_string(
      "[compute]\ndefault_os_strategy = \"somewhere\"\n"));
  EXPECT_FALSE(
      ConfigLoader::load_from_string("[executor]\nkind = \"remote\"\n"));
  EXPECT_FALSE(
      ConfigLoader::load_from_string("[triggers]\nmissing_var = \"maybe\"\n"));
  EXPECT_FALSE(
      ConfigLoader::load_from_string("[logging]\nlevel = \"loud\"\n"));
}

TEST(ConfigTest, OutOfRangeValuesAreErrors) {
  for (auto toml : {"[compute]\nrun_retention_seconds = -1\n",
                    "[compute]\ndefault_namespace = \"\"\n",
                    "[executor]\nmax_reconnect_attempts = 0\n",
                    "[executor]\nreconnect_initial_backoff_ms = 500\n"
                    "reconnect_max_backoff_ms = 100\n",
                    "[storage]\ncluster_memory_max_entry_bytes = -5\n",
                    "[runtime]\nshards = -2\n"}) {
    auto result = ConfigLoader::load_from_string(toml);
    ASSERT_FALSE(result.has_value()) << toml;
    EXPECT_EQ(result.error(), make_error_code(Error::ParseError)) << toml;
  }
}

TEST(ConfigTest, MalformedTomlIsParseError) {
  auto result = ConfigLoader::load_from_string("[compute\nbroken = ");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::ParseError));
}

TEST(ConfigTest, EnvironmentOverridesFile) {
  ScopedEnv ns("FLOWCORE_DEFAULT_NAMESPACE", "from_env");
  ScopedEnv timeout("FLOWCORE_STAGE_TIMEOUT_MS", "250");
  ScopedEnv missed("FLOWCORE_TRIGGERS_MISSED_TICKS", "fire_once");

  auto result = ConfigLoader::load_from_string(R"(
[compute]
default_namespace = "from_file"
stage_timeout_ms = 10
)");
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->compute.default_namespace, "from_env");
  EXPECT_EQ(result->compute.stage_timeout_ms, 250);
  EXPECT_EQ(result->triggers.missed_ticks, MissedTickPolicy::FireOnce);
}

TEST(ConfigTest, NonNumericEnvironmentOverrideIsParseError) {
  ScopedEnv bad("FLOWCORE_RUNTIME_SHARDS", "many");
  auto result = ConfigLoader::load_from_string("");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::ParseError));
}

TEST(ConfigTest, LoadFromFile) {
  test::TempDir dir;
  auto path = dir.path() / "flowcore.toml";
  test::write_file(path, "[runtime]\nshards = 2\n");

  auto result = ConfigLoader::load_from_file(path.string());
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->runtime.shards, 2);

  auto missing = ConfigLoader::load_from_file((dir.path() / "absent.toml").string());
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error(), make_error_code(Error::FileNotFound));
}
