#pragma once

#include "flowcore/util/enum.hpp"
#include "flowcore/util/json.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>
#include <flat_map>
#include <optional>
#include <string>
#include <vector>

namespace flowcore {

using Annotations = std::flat_map<std::string, std::string>;

enum class StageKind : std::uint8_t { Simple, Parameterized };
BOOST_DESCRIBE_ENUM(StageKind, Simple, Parameterized)
FLOWCORE_DEFINE_ENUM_SERDE(StageKind)

// Scheduling hints forwarded to the executor; the local executor ignores
// them.
struct StageResources {
  double cpus{0.0};
  double gpus{0.0};
  std::int64_t memory{0};
  std::flat_map<std::string, std::string> labels;

  auto operator==(const StageResources &) const -> bool = default;
};

struct StageDefinition {
  std::string name;
  std::string target;
  StageKind kind{StageKind::Simple};
  std::vector<std::string> depends_on;
  std::string description;
  int priority{0};
  std::optional<std::string> map_on;
  StageResources resources;
  bool collect{false};

  [[nodiscard]] auto is_parameterized() const noexcept -> bool {
    return kind == StageKind::Parameterized;
  }

  auto operator==(const StageDefinition &) const -> bool = default;
};

struct WorkflowDefinition {
  std::string name;
  std::string description;
  Annotations annotations;
  std::vector<StageDefinition> stages;

  auto operator==(const WorkflowDefinition &) const -> bool = default;
};

// Named configuration data attached to every workflow its selector matches.
struct ConfigGroup {
  std::string name;
  Annotations annotations;
  std::vector<std::string> workflows;
  Annotations match_annotations;
  JsonValue data;

  // Empty selectors match nothing so a stray group is never global.
  [[nodiscard]] auto selects(const WorkflowDefinition &wf) const -> bool {
    for (const auto &w : workflows) {
      if (w == wf.name) {
        return true;
      }
    }
    if (match_annotations.empty()) {
      return false;
    }
    for (const auto &[key, value] : match_annotations) {
      auto it = wf.annotations.find(key);
      if (it == wf.annotations.end() || it->second != value) {
        return false;
      }
    }
    return true;
  }
};

} // namespace flowcore
