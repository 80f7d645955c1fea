#pragma once

#include "flowcore/dag/workflow.hpp"
#include "flowcore/trigger/trigger_rule.hpp"
#include "flowcore/util/enum.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>
#include <string>
#include <variant>

namespace flowcore {

enum class DefinitionKind : std::uint8_t { Workflow, TriggerRule, Config };
BOOST_DESCRIBE_ENUM(DefinitionKind, Workflow, TriggerRule, Config)
FLOWCORE_DEFINE_ENUM_SERDE(DefinitionKind)

// One named resource document.
struct Definition {
  std::variant<WorkflowDefinition, TriggerRuleDefinition, ConfigGroup> value;

  [[nodiscard]] auto kind() const noexcept -> DefinitionKind {
    return static_cast<DefinitionKind>(value.index());
  }
  [[nodiscard]] auto name() const -> const std::string & {
    return std::visit(
        [](const auto &v) -> const std::string & { return v.name; }, value);
  }
};

struct DefinitionChange {
  DefinitionKind kind{DefinitionKind::Workflow};
  std::string name;
  bool removed{false};
};

// Programmatic construction, mostly for tests and embedding.
class WorkflowBuilder {
public:
  explicit WorkflowBuilder(std::string name) { def_.name = std::move(name); }

  auto description(std::string d) -> WorkflowBuilder && {
    def_.description = std::move(d);
    return std::move(*this);
  }

  auto annotate(std::string key, std::string value) -> WorkflowBuilder && {
    def_.annotations.insert_or_assign(std::move(key), std::move(value));
    return std::move(*this);
  }

  auto stage(std::string name, std::string target,
             std::vector<std::string> depends_on = {}) -> WorkflowBuilder && {
    def_.stages.push_back(StageDefinition{.name = std::move(name),
                                          .target = std::move(target),
                                          .depends_on = std::move(depends_on)});
    return std::move(*this);
  }

  auto map(std::string name, std::string target,
           std::vector<std::string> depends_on = {},
           std::optional<std::string> map_on = std::nullopt)
      -> WorkflowBuilder && {
    def_.stages.push_back(StageDefinition{.name = std::move(name),
                                          .target = std::move(target),
                                          .kind = StageKind::Parameterized,
                                          .depends_on = std::move(depends_on),
                                          .map_on = std::move(map_on)});
    return std::move(*this);
  }

  // Marks the most recently added stage as the result collector.
  auto collect() -> WorkflowBuilder && {
    if (!def_.stages.empty()) {
      def_.stages.back().collect = true;
    }
    return std::move(*this);
  }

  [[nodiscard]] auto build() && -> WorkflowDefinition { return std::move(def_); }

private:
  WorkflowDefinition def_;
};

} // namespace flowcore
