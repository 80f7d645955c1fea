#include "flowcore/dag/dag.hpp"

#include <algorithm>
#include <ranges>
#include <utility>
#include <vector>

namespace flowcore {

auto DAG::add_node(std::string key) -> Result<NodeIndex> {
  if (key_to_idx_.contains(key)) {
    return fail(Error::AlreadyExists);
  }
  if (nodes_.size() >= 1'000'000) {
    return fail(Error::ResourceExhausted);
  }

  auto idx = static_cast<NodeIndex>(nodes_.size());
  nodes_.emplace_back();
  key_to_idx_.emplace(key, idx);
  keys_.emplace_back(std::move(key));
  return ok(idx);
}

auto DAG::add_edge(std::string_view from, std::string_view to)
    -> Result<void> {
  NodeIndex from_idx = get_index(from);
  NodeIndex to_idx = get_index(to);
  if (from_idx == kInvalidNode || to_idx == kInvalidNode) [[unlikely]] {
    return fail(Error::NotFound);
  }
  return add_edge(from_idx, to_idx);
}

// Self loops are accepted so that cycle detection, not edge insertion,
// reports them.
auto DAG::add_edge(NodeIndex from, NodeIndex to) -> Result<void> {
  if (from >= nodes_.size() || to >= nodes_.size()) [[unlikely]] {
    return fail(Error::InvalidArgument);
  }
  if (has_edge(from, to)) {
    return ok();
  }
  nodes_[to].deps.emplace_back(from);
  nodes_[from].dependents.emplace_back(to);
  return ok();
}

auto DAG::has_edge(NodeIndex from, NodeIndex to) const noexcept -> bool {
  if (from >= nodes_.size() || to >= nodes_.size()) [[unlikely]]
    return false;
  return std::ranges::contains(nodes_[from].dependents, to);
}

auto DAG::has_node(std::string_view key) const -> bool {
  return key_to_idx_.contains(key);
}

auto DAG::topological_levels(std::vector<NodeIndex> *unvisited) const
    -> std::vector<std::vector<NodeIndex>> {
  std::vector<std::size_t> in_degree;
  in_degree.reserve(nodes_.size());
  for (const auto &node : nodes_) {
    in_degree.emplace_back(node.deps.size());
  }

  std::vector<std::vector<NodeIndex>> levels;
  std::vector<NodeIndex> current;
  for (auto [i, deg] : std::views::enumerate(in_degree)) {
    if (deg == 0) {
      current.emplace_back(static_cast<NodeIndex>(i));
    }
  }

  std::size_t visited = 0;
  while (!current.empty()) {
    std::vector<NodeIndex> next;
    for (NodeIndex n : current) {
      ++visited;
      for (NodeIndex dep : nodes_[n].dependents) {
        if (--in_degree[dep] == 0) {
          next.emplace_back(dep);
        }
      }
    }
    std::ranges::sort(next);
    levels.emplace_back(std::move(current));
    current = std::move(next);
  }

  if (unvisited != nullptr) {
    unvisited->clear();
    if (visited != nodes_.size()) {
      for (auto [i, deg] : std::views::enumerate(in_degree)) {
        if (deg != 0) {
          unvisited->emplace_back(static_cast<NodeIndex>(i));
        }
      }
    }
  }
  return levels;
}

auto DAG::get_topological_order() const -> std::vector<NodeIndex> {
  auto levels = topological_levels();
  std::vector<NodeIndex> result;
  result.reserve(nodes_.size());
  for (auto &level : levels) {
    result.insert(result.end(), level.begin(), level.end());
  }
  return result;
}

auto DAG::is_acyclic() const -> bool {
  std::vector<NodeIndex> leftover;
  (void)topological_levels(&leftover);
  return leftover.empty();
}

auto DAG::get_deps_view(NodeIndex idx) const noexcept
    -> std::span<const NodeIndex> {
  if (idx >= nodes_.size()) {
    return {};
  }
  return nodes_[idx].deps;
}

auto DAG::get_dependents_view(NodeIndex idx) const noexcept
    -> std::span<const NodeIndex> {
  if (idx >= nodes_.size()) {
    return {};
  }
  return nodes_[idx].dependents;
}

auto DAG::get_index(std::string_view key) const -> NodeIndex {
  auto it = key_to_idx_.find(key);
  return it != key_to_idx_.end() ? it->second : kInvalidNode;
}

auto DAG::get_key(NodeIndex idx) const -> const std::string & {
  static const std::string kEmpty;
  if (idx >= keys_.size()) {
    return kEmpty;
  }
  return keys_[idx];
}

auto DAG::clear() -> void {
  nodes_.clear();
  keys_.clear();
  key_to_idx_.clear();
}

} // namespace flowcore
