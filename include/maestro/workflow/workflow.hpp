#pragma once

#include "maestro/core/error.hpp"
#include "maestro/util/id.hpp"
#include "maestro/util/time.hpp"
#include "maestro/workflow/task.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace maestro {

enum class WorkflowStatus : std::uint8_t {
  Created,
  Running,
  Paused,
  Completed,
  CompletedWithErrors,
  Cancelled,
};

[[nodiscard]] auto to_string_view(WorkflowStatus status) noexcept
    -> std::string_view;
[[nodiscard]] auto parse_workflow_status(std::string_view name) noexcept
    -> std::optional<WorkflowStatus>;

inline constexpr std::size_t kDefaultResultPreview = 200;

// Task DAG for one objective. Tasks are kept in plan order; that order breaks
// priority ties in the ready set. Indices returned by the ready-set queries
// stay valid because tasks are only appended while planning.
class Workflow {
public:
  Workflow(WorkflowId id, std::string name, std::string objective);

  [[nodiscard]] auto id() const noexcept -> const WorkflowId& { return id_; }
  [[nodiscard]] auto name() const noexcept -> const std::string& {
    return name_;
  }
  [[nodiscard]] auto objective() const noexcept -> const std::string& {
    return objective_;
  }

  [[nodiscard]] auto status() const noexcept -> WorkflowStatus {
    return status_;
  }
  auto set_status(WorkflowStatus status) noexcept -> void { status_ = status; }

  [[nodiscard]] auto created_at() const noexcept -> TimePoint {
    return created_at_;
  }
  [[nodiscard]] auto completed_at() const noexcept
      -> const std::optional<TimePoint>& {
    return completed_at_;
  }
  auto set_completed_at(TimePoint t) noexcept -> void { completed_at_ = t; }

  // Fails with AlreadyExists on a duplicate id and InvalidArgument when the
  // task lists itself as a dependency.
  [[nodiscard]] auto add_task(WorkflowTask task) -> Result<void>;

  [[nodiscard]] auto find_task(const TaskId& id) -> WorkflowTask*;
  [[nodiscard]] auto find_task(const TaskId& id) const -> const WorkflowTask*;
  [[nodiscard]] auto task_at(std::size_t idx) -> WorkflowTask& {
    return tasks_[idx];
  }
  [[nodiscard]] auto task_at(std::size_t idx) const -> const WorkflowTask& {
    return tasks_[idx];
  }
  [[nodiscard]] auto tasks() const noexcept
      -> const std::vector<WorkflowTask>& {
    return tasks_;
  }
  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return tasks_.size();
  }
  [[nodiscard]] auto empty() const noexcept -> bool { return tasks_.empty(); }

  // Every dependency id names a COMPLETED task. Unknown ids never satisfy.
  [[nodiscard]] auto dependencies_met(const WorkflowTask& task) const -> bool;
  // First dependency that can no longer complete (failed, skipped or
  // cancelled), if any.
  [[nodiscard]] auto blocking_dependency(const WorkflowTask& task) const
      -> std::optional<TaskId>;

  // Marks every PENDING task whose dependencies are met as READY and returns
  // all READY tasks, stable-sorted by ascending priority.
  [[nodiscard]] auto collect_ready_tasks() -> std::vector<std::size_t>;

  // Result text of each completed dependency, keyed by dependency id.
  [[nodiscard]] auto dependency_context(const WorkflowTask& task) const
      -> std::map<std::string, std::string>;

  // No task is PENDING, READY or RUNNING.
  [[nodiscard]] auto is_complete() const -> bool;
  [[nodiscard]] auto has_failures() const -> bool;
  [[nodiscard]] auto count(TaskStatus status) const -> std::size_t;

  // Results of completed tasks with non-empty output.
  [[nodiscard]] auto results() const -> std::map<std::string, std::string>;

  [[nodiscard]] auto to_json(
      std::size_t result_preview = kDefaultResultPreview) const
      -> nlohmann::json;

private:
  WorkflowId id_;
  std::string name_;
  std::string objective_;
  WorkflowStatus status_{WorkflowStatus::Created};
  TimePoint created_at_;
  std::optional<TimePoint> completed_at_;
  std::vector<WorkflowTask> tasks_;
  std::unordered_map<TaskId, std::size_t> index_;
};

[[nodiscard]] auto task_to_json(const WorkflowTask& task,
                                std::size_t result_preview =
                                    kDefaultResultPreview) -> nlohmann::json;

// Cuts `text` to at most `max_bytes` without splitting a UTF-8 sequence.
[[nodiscard]] auto truncate_utf8(std::string_view text, std::size_t max_bytes)
    -> std::string;

}  // namespace maestro
