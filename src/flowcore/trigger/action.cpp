#include "flowcore/trigger/action.hpp"

#include "flowcore/events/event_bus.hpp"
#include "flowcore/util/log.hpp"

namespace flowcore {

auto run_workflow(const TriggerRule &rule, RunSource source,
                  std::string_view correlation_id, const SubmitCallback &submit,
                  EventBus *bus) -> void {
  RunRequest request{.workflow = rule.action.workflow,
                     .input = rule.action.input,
                     .ns = rule.action.ns,
                     .source = source,
                     .rule = rule.name(),
                     .correlation_id = std::string(correlation_id)};

  if (bus != nullptr) {
    auto event = make_event(kWorkflowChannel, kTriggerSource, kRunWorkflowEvent,
                            JsonValue{{"identifier", request.workflow},
                                      {"payload", request.input},
                                      {"rule", request.rule}});
    event.correlation_id = request.correlation_id;
    bus->publish(std::move(event));
  }

  if (!submit) {
    log::warn("Rule {} fired but no submitter is attached", rule.name());
    return;
  }
  log::info("Rule {} fired: run_workflow {}", rule.name(), request.workflow);
  submit(std::move(request));
}

} // namespace flowcore
