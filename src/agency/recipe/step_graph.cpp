#include "agency/recipe/step_graph.hpp"

#include <algorithm>
#include <cstdint>

namespace agency {

auto StepGraph::add_node(StepId id) -> NodeIndex {
  auto it = key_to_idx_.find(id);
  if (it != key_to_idx_.end()) {
    return it->second;
  }

  auto idx = static_cast<NodeIndex>(nodes_.size());
  nodes_.emplace_back();
  keys_.push_back(id);
  key_to_idx_.emplace(std::move(id), idx);
  return idx;
}

auto StepGraph::add_edge(NodeIndex from, NodeIndex to) -> Result<void> {
  if (from >= nodes_.size() || to >= nodes_.size()) [[unlikely]] {
    return fail(Error::InvalidArgument);
  }
  auto& deps = nodes_[to].deps;
  if (std::ranges::find(deps, from) != deps.end()) {
    return ok();
  }
  deps.push_back(from);
  nodes_[from].dependents.push_back(to);
  return ok();
}

auto StepGraph::has_node(const StepId& id) const -> bool {
  return key_to_idx_.contains(id);
}

auto StepGraph::get_index(const StepId& id) const -> NodeIndex {
  auto it = key_to_idx_.find(id);
  return it != key_to_idx_.end() ? it->second : kInvalidNode;
}

auto StepGraph::get_key(NodeIndex idx) const -> const StepId& {
  static const StepId empty;
  return idx < keys_.size() ? keys_[idx] : empty;
}

auto StepGraph::get_deps_view(NodeIndex idx) const noexcept
    -> std::span<const NodeIndex> {
  if (idx >= nodes_.size()) {
    return {};
  }
  return nodes_[idx].deps;
}

auto StepGraph::get_dependents_view(NodeIndex idx) const noexcept
    -> std::span<const NodeIndex> {
  if (idx >= nodes_.size()) {
    return {};
  }
  return nodes_[idx].dependents;
}

auto StepGraph::find_cycle() const -> std::vector<StepId> {
  // 0 = unvisited, 1 = on the current path, 2 = done
  std::vector<std::uint8_t> state(nodes_.size(), 0);
  std::vector<std::pair<NodeIndex, std::size_t>> stack;

  for (NodeIndex start = 0; start < nodes_.size(); ++start) {
    if (state[start] != 0) {
      continue;
    }
    stack.push_back({start, 0});
    state[start] = 1;

    while (!stack.empty()) {
      auto& [node, child_idx] = stack.back();
      const auto& next = nodes_[node].dependents;

      if (child_idx < next.size()) {
        NodeIndex child = next[child_idx++];
        if (state[child] == 1) {
          auto first = std::ranges::find_if(
              stack, [child](const auto& frame) { return frame.first == child; });
          std::vector<StepId> cycle;
          for (auto it = first; it != stack.end(); ++it) {
            cycle.push_back(keys_[it->first]);
          }
          cycle.push_back(keys_[child]);
          return cycle;
        }
        if (state[child] == 0) {
          state[child] = 1;
          stack.push_back({child, 0});
        }
      } else {
        state[node] = 2;
        stack.pop_back();
      }
    }
  }
  return {};
}

auto StepGraph::levels() const -> std::vector<std::vector<NodeIndex>> {
  std::vector<std::size_t> in_degree(nodes_.size());
  for (std::size_t i = 0; i < nodes_.size(); ++i) {
    in_degree[i] = nodes_[i].deps.size();
  }

  std::vector<NodeIndex> current;
  for (NodeIndex i = 0; i < nodes_.size(); ++i) {
    if (in_degree[i] == 0) {
      current.push_back(i);
    }
  }

  std::vector<std::vector<NodeIndex>> result;
  std::size_t placed = 0;
  while (!current.empty()) {
    std::vector<NodeIndex> next;
    for (NodeIndex n : current) {
      for (NodeIndex dep : nodes_[n].dependents) {
        if (--in_degree[dep] == 0) {
          next.push_back(dep);
        }
      }
    }
    std::ranges::sort(next);
    placed += current.size();
    result.push_back(std::move(current));
    current = std::move(next);
  }

  if (placed != nodes_.size()) {
    return {};
  }
  return result;
}

}  // namespace agency
