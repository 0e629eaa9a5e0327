#pragma once

#include "maestro/core/error.hpp"
#include "maestro/util/id.hpp"

#include <cstdint>
#include <unordered_map>
#include <vector>

namespace maestro {

using NodeIndex = std::uint32_t;
inline constexpr NodeIndex kInvalidNode = UINT32_MAX;

// Index-based dependency graph. An edge from -> to means `to` depends on
// `from`. Edges that would close a cycle are rejected.
class DAG {
public:
  auto add_node(TaskId task_id) -> NodeIndex;
  [[nodiscard]] auto add_edge(const TaskId& from, const TaskId& to)
      -> Result<void>;
  [[nodiscard]] auto add_edge(NodeIndex from, NodeIndex to) -> Result<void>;

  [[nodiscard]] auto has_node(const TaskId& task_id) const -> bool;
  [[nodiscard]] auto get_index(const TaskId& task_id) const -> NodeIndex;

  // Kahn order. Among nodes that are ready at the same time the one added
  // first comes first, so a plan keeps its written order where it can.
  [[nodiscard]] auto get_topological_order() const -> std::vector<TaskId>;

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return nodes_.size();
  }
  [[nodiscard]] auto empty() const noexcept -> bool { return nodes_.empty(); }

private:
  [[nodiscard]] auto would_create_cycle(NodeIndex from, NodeIndex to) const
      -> bool;

  struct Node {
    std::vector<NodeIndex> deps;
    std::vector<NodeIndex> dependents;
  };

  std::vector<Node> nodes_;
  std::vector<TaskId> keys_;
  std::unordered_map<TaskId, NodeIndex> key_to_idx_;
};

}  // namespace maestro
