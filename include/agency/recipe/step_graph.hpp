#pragma once

#include "agency/core/error.hpp"
#include "agency/util/id.hpp"

#include <cstdint>
#include <span>
#include <unordered_map>
#include <vector>

namespace agency {

using NodeIndex = std::uint32_t;
inline constexpr NodeIndex kInvalidNode = UINT32_MAX;

// Dependency graph over step ids. Unlike a scheduling DAG it accepts edges
// that close a cycle so the cycle can be reported afterwards.
class StepGraph {
public:
  auto add_node(StepId id) -> NodeIndex;
  // `from` must finish before `to`.
  [[nodiscard]] auto add_edge(NodeIndex from, NodeIndex to) -> Result<void>;

  [[nodiscard]] auto has_node(const StepId& id) const -> bool;
  [[nodiscard]] auto get_index(const StepId& id) const -> NodeIndex;
  [[nodiscard]] auto get_key(NodeIndex idx) const -> const StepId&;

  [[nodiscard]] auto get_deps_view(NodeIndex idx) const noexcept
      -> std::span<const NodeIndex>;
  [[nodiscard]] auto get_dependents_view(NodeIndex idx) const noexcept
      -> std::span<const NodeIndex>;

  // One cycle as a closed path ("a", "b", "a"), or empty when acyclic.
  [[nodiscard]] auto find_cycle() const -> std::vector<StepId>;

  // Level i holds the nodes whose dependencies all sit in levels < i, in
  // insertion order. Empty if the graph has a cycle.
  [[nodiscard]] auto levels() const -> std::vector<std::vector<NodeIndex>>;

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return nodes_.size();
  }
  [[nodiscard]] auto empty() const noexcept -> bool { return nodes_.empty(); }

private:
  struct Node {
    std::vector<NodeIndex> deps;
    std::vector<NodeIndex> dependents;
  };

  std::vector<Node> nodes_;
  std::vector<StepId> keys_;
  std::unordered_map<StepId, NodeIndex> key_to_idx_;
};

}  // namespace agency
