#pragma once

#include "flowcore/core/error.hpp"
#include "flowcore/util/hash.hpp"

#include <ankerl/unordered_dense.h>

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace flowcore {

using NodeIndex = std::uint32_t;
constexpr NodeIndex kInvalidNode = UINT32_MAX;

// Adjacency-list graph keyed by stage name. Node indices are dense and
// assigned in insertion order.
class DAG {
public:
  [[nodiscard]] auto add_node(std::string key) -> Result<NodeIndex>;
  [[nodiscard]] auto add_edge(std::string_view from, std::string_view to)
      -> Result<void>;
  [[nodiscard]] auto add_edge(NodeIndex from, NodeIndex to) -> Result<void>;

  [[nodiscard]] auto has_node(std::string_view key) const -> bool;

  // Kahn's algorithm. Nodes left unvisited are on, or downstream of, a
  // cycle and are reported through `unvisited`.
  [[nodiscard]] auto topological_levels(
      std::vector<NodeIndex> *unvisited = nullptr) const
      -> std::vector<std::vector<NodeIndex>>;
  [[nodiscard]] auto get_topological_order() const -> std::vector<NodeIndex>;
  [[nodiscard]] auto is_acyclic() const -> bool;

  [[nodiscard]] auto get_deps_view(NodeIndex idx) const noexcept
      -> std::span<const NodeIndex>;
  [[nodiscard]] auto get_dependents_view(NodeIndex idx) const noexcept
      -> std::span<const NodeIndex>;

  [[nodiscard]] auto get_index(std::string_view key) const -> NodeIndex;
  [[nodiscard]] auto get_key(NodeIndex idx) const -> const std::string &;

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return nodes_.size();
  }
  [[nodiscard]] auto empty() const noexcept -> bool { return nodes_.empty(); }
  auto clear() -> void;

private:
  [[nodiscard]] auto has_edge(NodeIndex from, NodeIndex to) const noexcept
      -> bool;

  struct Node {
    std::vector<NodeIndex> deps;
    std::vector<NodeIndex> dependents;
  };

  std::vector<Node> nodes_;
  std::vector<std::string> keys_;
  ankerl::unordered_dense::map<std::string, NodeIndex, StringHash,
                               std::equal_to<>>
      key_to_idx_;
};

} // namespace flowcore
