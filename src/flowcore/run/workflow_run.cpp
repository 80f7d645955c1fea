#include "flowcore/run/workflow_run.hpp"

namespace flowcore {

auto to_json(const WorkflowRun &run) -> JsonValue {
  auto out = make_object();
  auto &obj = out.get_object();
  obj["uid"] = run.uid.str();
  obj["name"] = run.name;
  obj["workflow"] = run.workflow;
  obj["namespace"] = run.ns;
  obj["source"] = std::string(to_string_view(run.source));
  obj["input"] = run.input;
  obj["state"] = std::string(to_string_view(run.state));
  obj["started_at"] = util::format_iso8601(run.started_at);
  if (run.finished_at == util::TimePoint{}) {
    obj["finished_at"] = nullptr;
  } else {
    obj["finished_at"] = util::format_iso8601(run.finished_at);
  }
  obj["result"] = run.result;
  return out;
}

} // namespace flowcore
