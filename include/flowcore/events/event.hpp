#pragma once

#include "flowcore/util/id.hpp"
#include "flowcore/util/json.hpp"
#include "flowcore/util/time.hpp"

#include <flat_map>
#include <string>

namespace flowcore {

inline constexpr std::string_view kWorkflowChannel = "workflows";
inline constexpr std::string_view kWorkflowStartedEvent = "workflow_started";
inline constexpr std::string_view kWorkflowFinishedEvent = "workflow_finished";
inline constexpr std::string_view kRunWorkflowEvent = "run_workflow";

struct Event {
  EventId id;
  util::TimePoint time{};
  std::flat_map<std::string, std::string> headers;
  std::string correlation_id;
  std::string reply_channel;
  std::string channel;
  std::string source;
  std::string type;
  JsonValue data;
};

[[nodiscard]] auto make_event(std::string_view channel, std::string_view source,
                              std::string_view type, JsonValue data) -> Event;

// Document shape the condition DSL evaluates paths against.
[[nodiscard]] auto to_json(const Event &event) -> JsonValue;

} // namespace flowcore
