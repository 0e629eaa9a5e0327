#include "maestro/workflow/workflow.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <array>
#include <utility>

namespace maestro {

using json = nlohmann::json;

namespace {

constexpr std::array<std::string_view, 6> kWorkflowStatusNames = {
    "created",
    "running",
    "paused",
    "completed",
    "completed_with_errors",
    "cancelled",
};

auto optional_time(const std::optional<TimePoint>& tp) -> json {
  return tp ? json(to_iso_string(*tp)) : json(nullptr);
}

auto optional_text(const std::optional<std::string>& s) -> json {
  return s ? json(*s) : json(nullptr);
}

}  // namespace

auto to_string_view(WorkflowStatus status) noexcept -> std::string_view {
  auto idx = std::to_underlying(status);
  return idx < kWorkflowStatusNames.size() ? kWorkflowStatusNames[idx]
                                           : "unknown";
}

auto parse_workflow_status(std::string_view name) noexcept
    -> std::optional<WorkflowStatus> {
  auto it = std::ranges::find(kWorkflowStatusNames, name);
  if (it == kWorkflowStatusNames.end()) {
    return std::nullopt;
  }
  return static_cast<WorkflowStatus>(
      std::ranges::distance(kWorkflowStatusNames.begin(), it));
}

Workflow::Workflow(WorkflowId id, std::string name, std::string objective)
    : id_(std::move(id)),
      name_(std::move(name)),
      objective_(std::move(objective)),
      created_at_(Clock::now()) {}

auto Workflow::add_task(WorkflowTask task) -> Result<void> {
  if (task.id.empty()) {
    return fail(Error::InvalidArgument);
  }
  if (index_.contains(task.id)) {
    return fail(Error::AlreadyExists);
  }
  if (task.depends_on_task(task.id)) {
    return fail(Error::InvalidArgument);
  }

  // depends_on has set semantics
  std::vector<TaskId> unique_deps;
  unique_deps.reserve(task.depends_on.size());
  for (auto& dep : task.depends_on) {
    if (std::ranges::find(unique_deps, dep) == unique_deps.end()) {
      unique_deps.push_back(std::move(dep));
    }
  }
  task.depends_on = std::move(unique_deps);

  index_.emplace(task.id, tasks_.size());
  tasks_.push_back(std::move(task));
  return ok();
}

auto Workflow::find_task(const TaskId& id) -> WorkflowTask* {
  auto it = index_.find(id);
  return it != index_.end() ? &tasks_[it->second] : nullptr;
}

auto Workflow::find_task(const TaskId& id) const -> const WorkflowTask* {
  auto it = index_.find(id);
  return it != index_.end() ? &tasks_[it->second] : nullptr;
}

auto Workflow::dependencies_met(const WorkflowTask& task) const -> bool {
  return std::ranges::all_of(task.depends_on, [this](const TaskId& dep) {
    const auto* dep_task = find_task(dep);
    return dep_task && dep_task->status == TaskStatus::Completed;
  });
}

auto Workflow::blocking_dependency(const WorkflowTask& task) const
    -> std::optional<TaskId> {
  for (const auto& dep : task.depends_on) {
    const auto* dep_task = find_task(dep);
    if (dep_task && is_unsuccessful(dep_task->status)) {
      return dep;
    }
  }
  return std::nullopt;
}

auto Workflow::collect_ready_tasks() -> std::vector<std::size_t> {
  std::vector<std::size_t> ready;
  for (std::size_t i = 0; i < tasks_.size(); ++i) {
    auto& task = tasks_[i];
    if (task.status == TaskStatus::Pending && dependencies_met(task)) {
      task.status = TaskStatus::Ready;
    }
    if (task.status == TaskStatus::Ready) {
      ready.push_back(i);
    }
  }

  std::ranges::stable_sort(ready, {}, [this](std::size_t idx) {
    return tasks_[idx].priority;
  });
  return ready;
}

auto Workflow::dependency_context(const WorkflowTask& task) const
    -> std::map<std::string, std::string> {
  std::map<std::string, std::string> context;
  for (const auto& dep : task.depends_on) {
    const auto* dep_task = find_task(dep);
    if (dep_task && dep_task->status == TaskStatus::Completed &&
        dep_task->result) {
      context.emplace(dep.str(), *dep_task->result);
    }
  }
  return context;
}

auto Workflow::is_complete() const -> bool {
  return std::ranges::all_of(
      tasks_, [](const WorkflowTask& t) { return is_terminal(t.status); });
}

auto Workflow::has_failures() const -> bool {
  return count(TaskStatus::Failed) > 0;
}

auto Workflow::count(TaskStatus status) const -> std::size_t {
  return static_cast<std::size_t>(std::ranges::count_if(
      tasks_, [status](const WorkflowTask& t) { return t.status == status; }));
}

auto Workflow::results() const -> std::map<std::string, std::string> {
  std::map<std::string, std::string> out;
  for (const auto& task : tasks_) {
    if (task.status == TaskStatus::Completed && task.result &&
        !task.result->empty()) {
      out.emplace(task.id.str(), *task.result);
    }
  }
  return out;
}

auto truncate_utf8(std::string_view text, std::size_t max_bytes)
    -> std::string {
  if (text.size() <= max_bytes) {
    return std::string(text);
  }
  std::size_t cut = max_bytes;
  // Back off continuation bytes (10xxxxxx) so the cut lands on a boundary
  while (cut > 0 &&
         (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
    --cut;
  }
  return std::string(text.substr(0, cut));
}

auto task_to_json(const WorkflowTask& task, std::size_t result_preview)
    -> json {
  json deps = json::array();
  for (const auto& dep : task.depends_on) {
    deps.push_back(dep.str());
  }

  json result = nullptr;
  if (task.result) {
    result = truncate_utf8(*task.result, result_preview);
  }

  return {{"id", task.id.str()},
          {"name", task.name},
          {"description", task.description},
          {"assignee", task.assignee},
          {"priority", task.priority},
          {"depends_on", std::move(deps)},
          {"status", std::string(to_string_view(task.status))},
          {"result", std::move(result)},
          {"error", optional_text(task.error)},
          {"started_at", optional_time(task.started_at)},
          {"completed_at", optional_time(task.completed_at)},
          {"retries", task.retries},
          {"max_retries", task.max_retries}};
}

auto Workflow::to_json(std::size_t result_preview) const -> json {
  json tasks = json::array();
  for (const auto& task : tasks_) {
    tasks.push_back(task_to_json(task, result_preview));
  }

  return {{"id", id_.str()},
          {"name", name_},
          {"objective", objective_},
          {"status", std::string(to_string_view(status_))},
          {"tasks", std::move(tasks)},
          {"created_at", to_iso_string(created_at_)},
          {"completed_at", optional_time(completed_at_)}};
}

}  // namespace maestro
