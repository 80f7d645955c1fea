#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace flowcore::cli {

struct ValidateOptions {
  std::vector<std::string> files;
  bool json{false};
};

struct RunOptions {
  std::optional<std::string> config_file;
  std::string definitions_dir{"."};
  std::string workflow;
  std::string input{"{}"};
  std::optional<std::string> ns;
  std::int64_t timeout_ms{3600000};
  bool json{false};
};

struct ServeOptions {
  std::optional<std::string> config_file;
  std::string definitions_dir{"."};
  std::optional<std::string> log_level;
  std::optional<int> shards;
  bool no_triggers{false};
};

[[nodiscard]] auto cmd_validate(const ValidateOptions &opts) -> int;
[[nodiscard]] auto cmd_run(const RunOptions &opts) -> int;
[[nodiscard]] auto cmd_serve(const ServeOptions &opts) -> int;

} // namespace flowcore::cli
