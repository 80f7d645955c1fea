#include "flowcore/trigger/trigger_engine.hpp"

#include "flowcore/events/event_bus.hpp"
#include "flowcore/util/log.hpp"

#include <algorithm>
#include <chrono>
#include <format>
#include <ranges>

namespace flowcore {

TriggerEngine::TriggerEngine(TriggerConfig config, SubmitCallback submit,
                             std::shared_ptr<EventBus> bus)
    : config_(config), bus_(std::move(bus)), submit_(std::move(submit)) {}

auto TriggerEngine::register_rule(TriggerRuleDefinition definition)
    -> Result<void> {
  std::string diagnostic;
  auto compiled = compile_rule(definition, &diagnostic);

  std::lock_guard lock(mu_);
  if (!compiled) {
    TriggerRule broken{.definition = std::move(definition)};
    broken.enabled = false;
    broken.last_error = diagnostic;
    log::warn("Rule {} registered disabled: {}", broken.name(), diagnostic);
    auto name = broken.name();
    rules_.insert_or_assign(std::move(name), std::move(broken));
    return fail(compiled.error());
  }

  log::info("Rule {} registered ({})", compiled->name(),
            to_string_view(compiled->type()));
  auto name = compiled->name();
  rules_.insert_or_assign(std::move(name), std::move(*compiled));
  return ok();
}

auto TriggerEngine::unregister_rule(std::string_view name) -> Result<void> {
  std::lock_guard lock(mu_);
  auto it = rules_.find(name);
  if (it == rules_.end()) {
    return fail(Error::NotFound);
  }
  rules_.erase(it);
  log::info("Rule {} unregistered", name);
  return ok();
}

auto TriggerEngine::set_enabled(std::string_view name, bool enabled)
    -> Result<void> {
  std::lock_guard lock(mu_);
  auto it = rules_.find(name);
  if (it == rules_.end()) {
    return fail(Error::NotFound);
  }
  auto &rule = it->second;
  if (!enabled) {
    rule.enabled = false;
    return ok();
  }
  if (rule.enabled) {
    return ok();
  }
  std::string diagnostic;
  auto compiled = compile_rule(rule.definition, &diagnostic);
  if (!compiled) {
    rule.last_error = diagnostic;
    return fail(compiled.error());
  }
  compiled->last_run = rule.last_run;
  compiled->fire_count = rule.fire_count;
  rule = std::move(*compiled);
  return ok();
}

auto TriggerEngine::on_event(const Event &event) -> std::size_t {
  const auto document = to_json(event);
  const EvalOptions options{.missing_var = config_.missing_var};
  std::vector<Firing> firings;
  {
    std::lock_guard lock(mu_);
    for (auto &[name, rule] : rules_) {
      if (!rule.enabled || rule.type() != RuleType::Condition ||
          !rule.condition) {
        continue;
      }
      auto matched = matches(*rule.condition, document, options);
      // A well-formed rule that cannot evaluate this event's data simply
      // does not match it.
      if (!matched) {
        rule.last_error = std::format("evaluation failed on event {}: {}",
                                      event.type, matched.error().message());
        log::debug("Rule {} skipped event {}: {}", name, event.id.str(),
                   rule.last_error);
        continue;
      }
      if (!*matched) {
        continue;
      }
      rule.last_run = event.time;
      ++rule.fire_count;
      firings.push_back(Firing{.rule = rule,
                               .source = RunSource::Trigger,
                               .correlation_id = event.id.str()});
    }
  }
  return dispatch(std::move(firings));
}

auto TriggerEngine::schedule_due(const TriggerRule &rule,
                                 const TickWindow &window) const
    -> std::vector<util::TimePoint> {
  auto matches_any = [&](util::TimePoint minute) {
    return std::ranges::any_of(
        rule.schedules, [&](const CronExpr &c) { return c.matches(minute); });
  };

  std::vector<util::TimePoint> due;
  if (config_.missed_ticks != MissedTickPolicy::Skip && window.previous &&
      window.missed_count() > 0) {
    auto from = std::max(*window.previous + std::chrono::minutes(1),
                         window.current - std::chrono::minutes(
                                              std::max(config_.max_catchup_ticks, 0)));
    if (rule.last_run) {
      from = std::max(from, util::floor_minute(*rule.last_run) +
                                std::chrono::minutes(1));
    }
    std::vector<util::TimePoint> missed;
    for (auto minute = from; minute < window.current;
         minute += std::chrono::minutes(1)) {
      if (matches_any(minute)) {
        missed.push_back(minute);
      }
    }

    if (config_.missed_ticks == MissedTickPolicy::FireOnce) {
      if (!missed.empty()) {
        due.push_back(missed.back());
      }
    } else {
      due = std::move(missed);
    }
  }

  if (matches_any(window.current) &&
      (!rule.last_run || util::floor_minute(*rule.last_run) < window.current)) {
    due.push_back(window.current);
  }
  return due;
}

auto TriggerEngine::on_tick(const TickWindow &window) -> std::size_t {
  std::vector<Firing> firings;
  {
    std::lock_guard lock(mu_);
    for (auto &[name, rule] : rules_) {
      if (!rule.enabled || rule.type() != RuleType::Schedule) {
        continue;
      }
      for (auto minute : schedule_due(rule, window)) {
        rule.last_run = minute;
        ++rule.fire_count;
        firings.push_back(Firing{.rule = rule,
                                 .source = RunSource::Schedule,
                                 .correlation_id =
                                     util::format_iso8601(minute)});
      }
    }
  }
  return dispatch(std::move(firings));
}

auto TriggerEngine::dispatch(std::vector<Firing> firings) -> std::size_t {
  SubmitCallback submit;
  {
    std::lock_guard lock(mu_);
    submit = submit_;
  }
  for (const auto &firing : firings) {
    run_workflow(firing.rule, firing.source, firing.correlation_id, submit,
                 bus_.get());
  }
  return firings.size();
}

auto TriggerEngine::get_rule(std::string_view name) const
    -> Result<TriggerRule> {
  std::lock_guard lock(mu_);
  auto it = rules_.find(name);
  if (it == rules_.end()) {
    return fail(Error::NotFound);
  }
  return ok(it->second);
}

auto TriggerEngine::list_rules() const -> std::vector<TriggerRule> {
  std::vector<TriggerRule> out;
  {
    std::lock_guard lock(mu_);
    out.reserve(rules_.size());
    for (const auto &[name, rule] : rules_) {
      out.push_back(rule);
    }
  }
  std::ranges::sort(out, {}, &TriggerRule::name);
  return out;
}

auto TriggerEngine::size() const -> std::size_t {
  std::lock_guard lock(mu_);
  return rules_.size();
}

auto TriggerEngine::set_submit(SubmitCallback submit) -> void {
  std::lock_guard lock(mu_);
  submit_ = std::move(submit);
}

} // namespace flowcore
