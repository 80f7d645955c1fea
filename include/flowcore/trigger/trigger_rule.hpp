#pragma once

#include "flowcore/core/error.hpp"
#include "flowcore/trigger/condition.hpp"
#include "flowcore/trigger/cron.hpp"
#include "flowcore/util/enum.hpp"
#include "flowcore/util/json.hpp"
#include "flowcore/util/time.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace flowcore {

enum class RuleType : std::uint8_t { Condition, Schedule };
BOOST_DESCRIBE_ENUM(RuleType, Condition, Schedule)
FLOWCORE_DEFINE_ENUM_SERDE(RuleType)

inline constexpr std::string_view kRunWorkflowAction = "run_workflow";

struct RuleAction {
  std::string target{kRunWorkflowAction};
  JsonValue parameters;
};

// Declarative form as written by users.
struct TriggerRuleDefinition {
  std::string name;
  RuleType type{RuleType::Condition};
  // Condition: operator object. Schedule: list of cron strings.
  JsonValue rule;
  RuleAction action;
};

// Arguments of the run_workflow action.
struct RunWorkflowAction {
  std::string workflow;
  JsonValue input;
  std::optional<std::string> ns;
};

[[nodiscard]] auto parse_run_workflow(const JsonValue &parameters)
    -> Result<RunWorkflowAction>;

// A registered rule: the definition plus its compiled body and status.
struct TriggerRule {
  TriggerRuleDefinition definition;
  ExprPtr condition;
  std::vector<CronExpr> schedules;
  RunWorkflowAction action;
  bool enabled{false};
  std::string last_error;
  std::optional<util::TimePoint> last_run;
  std::uint64_t fire_count{0};

  [[nodiscard]] auto name() const noexcept -> const std::string & {
    return definition.name;
  }
  [[nodiscard]] auto type() const noexcept -> RuleType {
    return definition.type;
  }
};

// Validates and compiles a definition. On failure the error is returned and
// `diagnostic` says why.
[[nodiscard]] auto compile_rule(TriggerRuleDefinition definition,
                                std::string *diagnostic = nullptr)
    -> Result<TriggerRule>;

[[nodiscard]] auto to_json(const TriggerRule &rule) -> JsonValue;

} // namespace flowcore
