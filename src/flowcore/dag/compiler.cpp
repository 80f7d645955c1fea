#include "flowcore/dag/compiler.hpp"

#include "flowcore/util/log.hpp"

#include <algorithm>
#include <format>
#include <ranges>
#include <utility>

namespace flowcore {
namespace {

auto reject(CompileDiagnostic *diagnostic, std::string message,
            std::vector<std::string> stages = {})
    -> std::unexpected<std::error_code> {
  if (diagnostic != nullptr) {
    diagnostic->message = std::move(message);
    diagnostic->stages = std::move(stages);
  }
  return fail(Error::ValidationFailed);
}

auto validate_stage(const StageDefinition &stage, CompileDiagnostic *diag)
    -> Result<void> {
  if (stage.name.empty()) {
    return reject(diag, "stage with empty name");
  }
  if (stage.target.empty()) {
    return reject(diag, std::format("stage '{}' has no target", stage.name),
                  {stage.name});
  }
  if (stage.is_parameterized() && !stage.map_on &&
      stage.depends_on.size() > 1) {
    return reject(diag,
                  std::format("parameterized stage '{}' has {} predecessors "
                              "and no map_on key to choose its iterable",
                              stage.name, stage.depends_on.size()),
                  {stage.name});
  }
  return ok();
}

} // namespace

auto compile(std::shared_ptr<const WorkflowDefinition> definition,
             CompileDiagnostic *diagnostic) -> Result<CompiledGraph> {
  if (!definition) {
    return reject(diagnostic, "no workflow definition");
  }
  const auto &wf = *definition;
  if (wf.stages.empty()) {
    return reject(diagnostic,
                  std::format("workflow '{}' has no stages", wf.name));
  }

  CompiledGraph graph;
  graph.definition = definition;
  graph.stages.reserve(wf.stages.size());

  NodeIndex collect = kInvalidNode;
  for (const auto &stage : wf.stages) {
    if (auto r = validate_stage(stage, diagnostic); !r) {
      return fail(r.error());
    }
    auto idx = graph.dag.add_node(stage.name);
    if (!idx) {
      if (idx.error() == make_error_code(Error::AlreadyExists)) {
        return reject(diagnostic,
                      std::format("duplicate stage name '{}'", stage.name),
                      {stage.name});
      }
      return fail(idx.error());
    }
    graph.stages.push_back(&stage);
    if (stage.collect) {
      if (collect != kInvalidNode) {
        return reject(diagnostic, "more than one collect stage",
                      {graph.dag.get_key(collect), stage.name});
      }
      collect = *idx;
    }
  }

  for (auto [to, stage] : std::views::enumerate(wf.stages)) {
    for (const auto &dep : stage.depends_on) {
      auto from = graph.dag.get_index(dep);
      if (from == kInvalidNode) {
        return reject(diagnostic,
                      std::format("stage '{}' depends on unknown stage '{}'",
                                  stage.name, dep),
                      {stage.name});
      }
      if (auto r = graph.dag.add_edge(from, static_cast<NodeIndex>(to)); !r) {
        return fail(r.error());
      }
    }
  }

  std::vector<NodeIndex> leftover;
  graph.levels = graph.dag.topological_levels(&leftover);
  if (!leftover.empty()) {
    std::vector<std::string> names;
    for (auto idx : leftover) {
      names.push_back(graph.dag.get_key(idx));
    }
    auto joined = names | std::views::join_with(std::string_view{", "}) |
                  std::ranges::to<std::string>();
    return reject(diagnostic,
                  std::format("dependency cycle among stages: {}", joined),
                  std::move(names));
  }

  for (const auto &level : graph.levels) {
    graph.order.insert(graph.order.end(), level.begin(), level.end());
  }
  for (auto idx : graph.order) {
    if (graph.dag.get_dependents_view(idx).empty()) {
      graph.terminals.push_back(idx);
    }
  }
  graph.result_stage = collect != kInvalidNode ? collect : graph.terminals.back();

  log::debug("Compiled workflow '{}': {} stages in {} levels", wf.name,
             graph.size(), graph.levels.size());
  return ok(std::move(graph));
}

auto compile(const WorkflowDefinition &definition,
             CompileDiagnostic *diagnostic) -> Result<CompiledGraph> {
  return compile(std::make_shared<const WorkflowDefinition>(definition),
                 diagnostic);
}

} // namespace flowcore
