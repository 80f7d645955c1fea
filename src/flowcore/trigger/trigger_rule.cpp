#include "flowcore/trigger/trigger_rule.hpp"

#include <format>

namespace flowcore {
namespace {

auto reject(std::string *diagnostic, std::error_code ec, std::string message)
    -> std::unexpected<std::error_code> {
  if (diagnostic != nullptr) {
    *diagnostic = std::move(message);
  }
  return fail(ec);
}

} // namespace

auto parse_run_workflow(const JsonValue &parameters)
    -> Result<RunWorkflowAction> {
  const auto *workflow = json::find_path(parameters, "workflow");
  auto name = workflow ? json::as_string(*workflow) : std::nullopt;
  if (!name || name->empty()) {
    return fail(Error::InvalidArgument);
  }
  RunWorkflowAction out{.workflow = std::string(*name), .input = make_object()};
  if (const auto *input = json::find_path(parameters, "input")) {
    out.input = *input;
  }
  if (const auto *ns = json::find_path(parameters, "namespace")) {
    auto text = json::as_string(*ns);
    if (!text) {
      return fail(Error::InvalidArgument);
    }
    out.ns = std::string(*text);
  }
  return ok(std::move(out));
}

auto compile_rule(TriggerRuleDefinition definition, std::string *diagnostic)
    -> Result<TriggerRule> {
  if (definition.name.empty()) {
    return reject(diagnostic, make_error_code(Error::InvalidArgument),
                  "trigger rule has no name");
  }

  TriggerRule rule;
  if (definition.action.target != kRunWorkflowAction) {
    return reject(diagnostic, make_error_code(Error::InvalidArgument),
                  std::format("unknown action '{}'", definition.action.target));
  }
  auto action = parse_run_workflow(definition.action.parameters);
  if (!action) {
    return reject(diagnostic, action.error(),
                  "run_workflow requires a 'workflow' name parameter");
  }
  rule.action = std::move(*action);

  switch (definition.type) {
  case RuleType::Condition: {
    std::string why;
    auto expr = parse_condition(definition.rule, &why);
    if (!expr) {
      return reject(diagnostic, expr.error(), std::move(why));
    }
    rule.condition = std::move(*expr);
    break;
  }
  case RuleType::Schedule: {
    const auto *list = json::as_array(definition.rule);
    if (list == nullptr || list->empty()) {
      return reject(diagnostic, make_error_code(Error::InvalidArgument),
                    "schedule rule must be a non-empty list of cron strings");
    }
    for (const auto &entry : *list) {
      auto text = json::as_string(entry);
      Result<CronExpr> cron =
          text ? CronExpr::parse(*text) : Result<CronExpr>{fail(Error::ParseError)};
      if (!cron) {
        return reject(diagnostic, cron.error(),
                      std::format("invalid cron expression {}",
                                  dump_json(entry)));
      }
      rule.schedules.push_back(std::move(*cron));
    }
    break;
  }
  }

  rule.definition = std::move(definition);
  rule.enabled = true;
  return ok(std::move(rule));
}

auto to_json(const TriggerRule &rule) -> JsonValue {
  JsonValue out{{"name", rule.name()},
                {"type", std::string(to_string_view(rule.type()))},
                {"rule", rule.definition.rule},
                {"action",
                 JsonValue{{"target", rule.definition.action.target},
                           {"parameters", rule.definition.action.parameters}}},
                {"enabled", rule.enabled},
                {"last_error", rule.last_error},
                {"fire_count", static_cast<std::int64_t>(rule.fire_count)}};
  if (rule.last_run) {
    out.get_object()["last_run"] = util::format_iso8601(*rule.last_run);
  } else {
    out.get_object()["last_run"] = nullptr;
  }
  return out;
}

} // namespace flowcore
