#pragma once

#include "maestro/agent/agent.hpp"
#include "maestro/agent/registry.hpp"
#include "maestro/core/error.hpp"
#include "maestro/executor/executor.hpp"
#include "maestro/util/id.hpp"
#include "maestro/workflow/plan.hpp"
#include "maestro/workflow/task.hpp"
#include "maestro/workflow/workflow.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace maestro {

struct EngineOptions {
  std::size_t max_parallel{4};
  int max_retries{kDefaultMaxRetries};
  int default_priority{kDefaultPriority};
  std::string default_assignee{kDefaultAssignee};
  std::size_t result_preview{kDefaultResultPreview};
  // Reject plans with unknown or cyclic dependencies up front. When off,
  // such tasks simply never become ready.
  bool validate_plans{true};
};

// Lifecycle notifications. Both run on the thread driving the workflow and
// receive copies of the current state. Notification is best effort: a
// callback that throws is logged and otherwise ignored.
//
// Task events: "started", then the task's resulting status name.
// Workflow events: "started", then the final workflow status name.
struct WorkflowCallbacks {
  std::function<void(const Workflow& workflow, const WorkflowTask& task,
                     std::string_view event)>
      on_task_update;
  std::function<void(const Workflow& workflow, std::string_view event)>
      on_workflow_update;
};

// Owns workflows and drives them to completion. The thread calling
// execute_workflow is that workflow's driver; every other member may be
// called concurrently from any thread.
class WorkflowEngine {
public:
  WorkflowEngine(AgentRegistry& registry, IExecutor& executor,
                 EngineOptions options = {});
  ~WorkflowEngine();

  WorkflowEngine(const WorkflowEngine&) = delete;
  auto operator=(const WorkflowEngine&) -> WorkflowEngine& = delete;

  auto set_callbacks(WorkflowCallbacks callbacks) -> void;

  [[nodiscard]] auto options() const noexcept -> const EngineOptions& {
    return options_;
  }

  auto create_workflow(std::string name, std::string objective) -> WorkflowId;

  // Appends one task per step, with ids task_1..task_n in plan order. The
  // workflow must still be empty. Nothing is appended on failure.
  [[nodiscard]] auto create_tasks_from_plan(const WorkflowId& id,
                                            std::span<const PlanStep> steps)
      -> Result<std::vector<TaskId>>;

  // Runs the scheduling loop on the calling thread until every task is
  // resolved, the graph is stuck, or the workflow is cancelled. Returns the
  // results of completed tasks keyed by task id. An exception thrown by the
  // executor itself propagates after the workflow is closed as
  // completed_with_errors.
  [[nodiscard]] auto execute_workflow(const WorkflowId& id)
      -> Result<std::map<std::string, std::string>>;

  // Cooperative: checked once per scheduling iteration, so a batch already
  // dispatched always finishes.
  auto cancel(const WorkflowId& id) -> bool;
  [[nodiscard]] auto is_cancelled(const WorkflowId& id) const -> bool;

  // Status labels only; dispatch is not held back while paused.
  auto pause(const WorkflowId& id) -> bool;
  auto resume(const WorkflowId& id) -> bool;

  [[nodiscard]] auto get_workflow_status(const WorkflowId& id) const
      -> std::optional<nlohmann::json>;

  // Forgets a workflow that is not running.
  auto discard_workflow(const WorkflowId& id) -> bool;

  [[nodiscard]] auto workflow_ids() const -> std::vector<WorkflowId>;

private:
  struct Dispatch {
    std::size_t index;
    ExecutorRequest request;
  };

  struct TaskNotice {
    std::size_t index;
    std::string event;
  };

  // Outcome of one scheduling step taken under the lock.
  struct Step {
    enum class Kind { Dispatch, Advanced, Finished };
    Kind kind{Kind::Finished};
    std::vector<Dispatch> batch;
    std::vector<TaskNotice> notices;
  };

  [[nodiscard]] auto resolve_assignee(const PlanStep& step) const
      -> std::string;

  auto next_step(Workflow& wf) -> Step;
  auto run_batch(const WorkflowId& id, std::vector<Dispatch> batch) -> void;
  auto apply_result(Workflow& wf, std::size_t index,
                    const ExecutorResult& result) -> std::string;
  auto finish(const WorkflowId& id) -> std::map<std::string, std::string>;
  // Releases a run that ended by an exception: running tasks fail and the
  // workflow can be executed or discarded again.
  auto abort_run(const WorkflowId& id) noexcept -> void;

  auto notify_tasks(const WorkflowId& id,
                    const std::vector<TaskNotice>& notices) -> void;
  auto notify_workflow(const WorkflowId& id, std::string_view event) -> void;

  AgentRegistry& registry_;
  IExecutor& executor_;
  EngineOptions options_;
  WorkflowCallbacks callbacks_;

  std::unordered_map<WorkflowId, std::unique_ptr<Workflow>> workflows_;
  std::vector<WorkflowId> order_;
  std::unordered_set<WorkflowId> running_;
  mutable std::mutex mu_;

  std::unordered_set<WorkflowId> cancelled_;
  mutable std::mutex cancel_mu_;
};

}  // namespace maestro
