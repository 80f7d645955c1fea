#pragma once

#include "flowcore/run/workflow_run.hpp"
#include "flowcore/trigger/trigger_rule.hpp"

#include <functional>
#include <optional>
#include <string>

namespace flowcore {

class EventBus;

inline constexpr std::string_view kTriggerSource = "trigger";

// A run requested by a fired rule.
struct RunRequest {
  std::string workflow;
  JsonValue input;
  std::optional<std::string> ns;
  RunSource source{RunSource::Trigger};
  std::string rule;
  std::string correlation_id;
};

// Must not block: implementations hand the request off and return.
using SubmitCallback = std::function<void(RunRequest)>;

// Dispatches a rule's run_workflow action: announces it on the bus and hands
// the request to `submit`.
auto run_workflow(const TriggerRule &rule, RunSource source,
                  std::string_view correlation_id, const SubmitCallback &submit,
                  EventBus *bus) -> void;

} // namespace flowcore
