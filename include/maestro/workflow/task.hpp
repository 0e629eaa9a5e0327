#pragma once

#include "maestro/util/id.hpp"
#include "maestro/util/time.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace maestro {

enum class TaskStatus : std::uint8_t {
  Pending,
  Ready,
  Running,
  Completed,
  Failed,
  Skipped,
  Cancelled,
};

[[nodiscard]] auto to_string_view(TaskStatus status) noexcept
    -> std::string_view;
[[nodiscard]] auto parse_task_status(std::string_view name) noexcept
    -> std::optional<TaskStatus>;

[[nodiscard]] constexpr auto is_terminal(TaskStatus status) noexcept -> bool {
  return status == TaskStatus::Completed || status == TaskStatus::Failed ||
         status == TaskStatus::Skipped || status == TaskStatus::Cancelled;
}

// Statuses that block dependents for good.
[[nodiscard]] constexpr auto is_unsuccessful(TaskStatus status) noexcept
    -> bool {
  return status == TaskStatus::Failed || status == TaskStatus::Skipped ||
         status == TaskStatus::Cancelled;
}

inline constexpr int kDefaultPriority = 3;
inline constexpr int kDefaultMaxRetries = 2;
inline constexpr std::size_t kTaskNameMaxLength = 100;

struct WorkflowTask {
  TaskId id;
  std::string name;
  std::string description;
  std::string assignee;
  int priority{kDefaultPriority};
  std::vector<TaskId> depends_on;
  TaskStatus status{TaskStatus::Pending};
  std::optional<std::string> result;
  std::optional<std::string> error;
  std::optional<TimePoint> started_at;
  std::optional<TimePoint> completed_at;
  int retries{0};
  int max_retries{kDefaultMaxRetries};
  std::map<std::string, std::string> metadata;

  [[nodiscard]] auto depends_on_task(const TaskId& other) const -> bool;
};

}  // namespace maestro
