#pragma once

#include "flowcore/config/system_config.hpp"
#include "flowcore/core/error.hpp"
#include "flowcore/events/event.hpp"
#include "flowcore/trigger/action.hpp"
#include "flowcore/trigger/schedule_clock.hpp"
#include "flowcore/trigger/trigger_rule.hpp"
#include "flowcore/util/hash.hpp"

#include <ankerl/unordered_dense.h>

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace flowcore {

class EventBus;

// Owns the active rule set. Condition rules are evaluated against every event
// handed to on_event(); schedule rules against every clock window handed to
// on_tick(). A fired rule dispatches its action outside the rule lock.
class TriggerEngine {
public:
  TriggerEngine(TriggerConfig config, SubmitCallback submit,
                std::shared_ptr<EventBus> bus = nullptr);

  TriggerEngine(const TriggerEngine &) = delete;
  auto operator=(const TriggerEngine &) -> TriggerEngine & = delete;

  // Adds or replaces the rule of the same name. A rule that fails to compile
  // is still recorded, disabled, with last_error describing the problem.
  auto register_rule(TriggerRuleDefinition definition) -> Result<void>;
  auto unregister_rule(std::string_view name) -> Result<void>;
  // Re-enabling recompiles the stored definition and clears last_error.
  auto set_enabled(std::string_view name, bool enabled) -> Result<void>;

  // Returns the number of rules fired.
  auto on_event(const Event &event) -> std::size_t;
  auto on_tick(const TickWindow &window) -> std::size_t;
  auto on_tick(util::TimePoint minute) -> std::size_t {
    return on_tick(TickWindow{.current = util::floor_minute(minute)});
  }

  [[nodiscard]] auto get_rule(std::string_view name) const
      -> Result<TriggerRule>;
  [[nodiscard]] auto list_rules() const -> std::vector<TriggerRule>;
  [[nodiscard]] auto size() const -> std::size_t;

  auto set_submit(SubmitCallback submit) -> void;
  [[nodiscard]] auto config() const noexcept -> const TriggerConfig & {
    return config_;
  }

private:
  struct Firing {
    TriggerRule rule;
    RunSource source;
    std::string correlation_id;
  };

  auto schedule_due(const TriggerRule &rule, const TickWindow &window) const
      -> std::vector<util::TimePoint>;
  auto dispatch(std::vector<Firing> firings) -> std::size_t;

  TriggerConfig config_;
  std::shared_ptr<EventBus> bus_;

  mutable std::mutex mu_;
  SubmitCallback submit_;
  ankerl::unordered_dense::map<std::string, TriggerRule, StringHash,
                               std::equal_to<>>
      rules_;
};

} // namespace flowcore
