#pragma once

#include "flowcore/core/error.hpp"
#include "flowcore/run/run_context.hpp"

#include <flat_map>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace flowcore {

// Maps a stage's textual target ("pkg.module.function") to a callable.
class TargetRegistry {
public:
  auto register_target(std::string target, StageFunction fn) -> void;
  [[nodiscard]] auto resolve(std::string_view target) const
      -> Result<StageFunction>;
  [[nodiscard]] auto contains(std::string_view target) const -> bool;
  [[nodiscard]] auto targets() const -> std::vector<std::string>;

private:
  mutable std::mutex mu_;
  std::flat_map<std::string, StageFunction, std::less<>> targets_;
};

// flowcore.builtins.{identity,range,sum,scale,put_object,get_object}
auto register_builtin_targets(TargetRegistry &registry) -> void;

} // namespace flowcore
