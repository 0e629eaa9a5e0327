#pragma once

#include "maestro/core/error.hpp"
#include "maestro/util/id.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace maestro {

// Reference to another step: a 1-based plan position or a task id.
using PlanDependency = std::variant<std::size_t, std::string>;

struct PlanStep {
  std::string task;
  std::string assignee;
  std::optional<int> priority;
  std::vector<PlanDependency> depends_on;
  std::optional<int> max_retries;
};

struct Plan {
  std::string name;
  std::string objective;
  std::vector<PlanStep> steps;
};

// Position k and the digit string "k" both resolve to "task_k".
[[nodiscard]] auto resolve_dependency(const PlanDependency& dep) -> TaskId;

// Human-readable dependency problems: unknown references, self references
// and cycles. Empty when the plan is consistent.
[[nodiscard]] auto find_plan_problems(std::span<const PlanStep> steps)
    -> std::vector<std::string>;

// A dependency-respecting order of the step ids, written order first among
// steps that are free at the same time. Error::InvalidPlan for an
// inconsistent plan.
[[nodiscard]] auto plan_order(std::span<const PlanStep> steps)
    -> Result<std::vector<TaskId>>;

// Error::InvalidPlan when find_plan_problems reports anything.
[[nodiscard]] auto validate_plan(std::span<const PlanStep> steps)
    -> Result<void>;

class PlanLoader {
public:
  // YAML document with `name`, `objective` and a `tasks` sequence.
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<Plan>;
  [[nodiscard]] static auto load_from_string(std::string_view yaml_str)
      -> Result<Plan>;

  // Planner reply: a JSON array of {task, assignee, priority, depends_on},
  // optionally inside a fenced code block. Text that is not a JSON array
  // degrades to one step per non-empty line.
  [[nodiscard]] static auto parse_planner_output(
      std::string_view text, std::string_view default_assignee)
      -> std::vector<PlanStep>;
};

}  // namespace maestro
