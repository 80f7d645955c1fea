#pragma once

#include "flowcore/core/error.hpp"
#include "flowcore/dag/dag.hpp"
#include "flowcore/dag/workflow.hpp"

#include <memory>
#include <string>
#include <vector>

namespace flowcore {

// Why a definition was rejected and which stages are to blame.
struct CompileDiagnostic {
  std::string message;
  std::vector<std::string> stages;
};

// Executable form of a workflow. Stage i of `stages` is node i of `dag`.
struct CompiledGraph {
  std::shared_ptr<const WorkflowDefinition> definition;
  DAG dag;
  std::vector<const StageDefinition *> stages;
  // Stages whose dependencies are satisfied simultaneously.
  std::vector<std::vector<NodeIndex>> levels;
  std::vector<NodeIndex> order;
  std::vector<NodeIndex> terminals;
  // The collect stage if one is marked, else the last terminal in
  // topological order.
  NodeIndex result_stage{kInvalidNode};

  [[nodiscard]] auto stage(NodeIndex idx) const -> const StageDefinition & {
    return *stages[idx];
  }
  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return stages.size();
  }
};

[[nodiscard]] auto compile(std::shared_ptr<const WorkflowDefinition> definition,
                           CompileDiagnostic *diagnostic = nullptr)
    -> Result<CompiledGraph>;

[[nodiscard]] auto compile(const WorkflowDefinition &definition,
                           CompileDiagnostic *diagnostic = nullptr)
    -> Result<CompiledGraph>;

} // namespace flowcore
