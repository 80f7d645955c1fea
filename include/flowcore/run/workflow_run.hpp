#pragma once

#include "flowcore/util/enum.hpp"
#include "flowcore/util/id.hpp"
#include "flowcore/util/json.hpp"
#include "flowcore/util/time.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>
#include <string>

namespace flowcore {

enum class RunState : std::uint8_t { Running, Completed, Failed, Cancelled };
BOOST_DESCRIBE_ENUM(RunState, Running, Completed, Failed, Cancelled)
FLOWCORE_DEFINE_ENUM_SERDE(RunState)

enum class RunSource : std::uint8_t { Api, Trigger, Schedule };
BOOST_DESCRIBE_ENUM(RunSource, Api, Trigger, Schedule)
FLOWCORE_DEFINE_ENUM_SERDE(RunSource)

[[nodiscard]] constexpr auto is_terminal(RunState s) noexcept -> bool {
  return s != RunState::Running;
}

// Snapshot of one execution. The owning coordinator is the only writer;
// everyone else sees copies.
struct WorkflowRun {
  RunId uid;
  std::string name;
  std::string workflow;
  std::string ns;
  RunSource source{RunSource::Api};
  JsonValue input;
  RunState state{RunState::Running};
  util::TimePoint started_at{};
  util::TimePoint finished_at{};
  JsonValue result;

  // Terminal states are sticky; returns false if the run already finished.
  auto finish(RunState terminal, JsonValue value) -> bool {
    if (is_terminal(state) || !is_terminal(terminal)) {
      return false;
    }
    state = terminal;
    result = std::move(value);
    finished_at = std::chrono::system_clock::now();
    return true;
  }
};

[[nodiscard]] auto to_json(const WorkflowRun &run) -> JsonValue;

} // namespace flowcore
