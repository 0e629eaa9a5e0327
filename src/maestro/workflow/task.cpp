#include "maestro/workflow/task.hpp"

#include <algorithm>
#include <array>
#include <utility>

namespace maestro {

namespace {

constexpr std::array<std::string_view, 7> kTaskStatusNames = {
    "pending",
    "ready",
    "running",
    "completed",
    "failed",
    "skipped",
    "cancelled",
};

}  // namespace

auto to_string_view(TaskStatus status) noexcept -> std::string_view {
  auto idx = std::to_underlying(status);
  return idx < kTaskStatusNames.size() ? kTaskStatusNames[idx] : "unknown";
}

auto parse_task_status(std::string_view name) noexcept
    -> std::optional<TaskStatus> {
  auto it = std::ranges::find(kTaskStatusNames, name);
  if (it == kTaskStatusNames.end()) {
    return std::nullopt;
  }
  return static_cast<TaskStatus>(
      std::ranges::distance(kTaskStatusNames.begin(), it));
}

auto WorkflowTask::depends_on_task(const TaskId& other) const -> bool {
  return std::ranges::find(depends_on, other) != depends_on.end();
}

}  // namespace maestro
