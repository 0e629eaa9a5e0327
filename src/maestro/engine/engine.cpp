#include "maestro/engine/engine.hpp"

#include "maestro/util/log.hpp"
#include "maestro/util/time.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <exception>
#include <utility>

namespace maestro {

namespace {

// Executors may complete from any thread; the driver drains completions here
// so that every task mutation happens on the driving thread.
class CompletionQueue {
public:
  auto push(std::size_t index, ExecutorResult result) -> void {
    {
      std::lock_guard lock(mu_);
      items_.emplace_back(index, std::move(result));
    }
    cv_.notify_one();
  }

  [[nodiscard]] auto pop() -> std::pair<std::size_t, ExecutorResult> {
    std::unique_lock lock(mu_);
    cv_.wait(lock, [this] { return !items_.empty(); });
    auto item = std::move(items_.front());
    items_.pop_front();
    return item;
  }

private:
  std::mutex mu_;
  std::condition_variable cv_;
  std::deque<std::pair<std::size_t, ExecutorResult>> items_;
};

// Same contract as std::experimental::scope_exit, which libstdc++ 12 lacks.
template <typename F>
class ScopeExit {
public:
  explicit ScopeExit(F fn) : fn_(std::move(fn)) {}
  ~ScopeExit() { fn_(); }

  ScopeExit(const ScopeExit&) = delete;
  auto operator=(const ScopeExit&) -> ScopeExit& = delete;

private:
  F fn_;
};

}  // namespace

WorkflowEngine::WorkflowEngine(AgentRegistry& registry, IExecutor& executor,
                               EngineOptions options)
    : registry_(registry), executor_(executor), options_(std::move(options)) {
  options_.max_parallel = std::max<std::size_t>(options_.max_parallel, 1);
}

WorkflowEngine::~WorkflowEngine() = default;

auto WorkflowEngine::set_callbacks(WorkflowCallbacks callbacks) -> void {
  std::lock_guard lock(mu_);
  callbacks_ = std::move(callbacks);
}

auto WorkflowEngine::create_workflow(std::string name, std::string objective)
    -> WorkflowId {
  std::lock_guard lock(mu_);
  auto id = generate_workflow_id();
  while (workflows_.contains(id)) {
    id = generate_workflow_id();
  }
  workflows_.emplace(id, std::make_unique<Workflow>(id, std::move(name),
                                                    std::move(objective)));
  order_.push_back(id);
  log::debug("Created workflow {}", id);
  return id;
}

auto WorkflowEngine::resolve_assignee(const PlanStep& step) const
    -> std::string {
  if (!step.assignee.empty() &&
      (registry_.contains(step.assignee) || registry_.size() == 0)) {
    return step.assignee;
  }
  if (auto best = registry_.find_best(step.task)) {
    return best->name;
  }
  return options_.default_assignee;
}

auto WorkflowEngine::create_tasks_from_plan(const WorkflowId& id,
                                            std::span<const PlanStep> steps)
    -> Result<std::vector<TaskId>> {
  if (options_.validate_plans) {
    if (auto r = validate_plan(steps); !r) {
      return std::unexpected(r.error());
    }
  }

  std::vector<WorkflowTask> tasks;
  tasks.reserve(steps.size());
  for (std::size_t i = 0; i < steps.size(); ++i) {
    const auto& step = steps[i];

    WorkflowTask task;
    task.id = make_task_id(i + 1);
    task.name = truncate_utf8(step.task, kTaskNameMaxLength);
    task.description = step.task;
    task.assignee = resolve_assignee(step);
    task.priority = step.priority.value_or(options_.default_priority);
    task.max_retries = step.max_retries.value_or(options_.max_retries);
    for (const auto& dep : step.depends_on) {
      task.depends_on.push_back(resolve_dependency(dep));
    }
    if (task.depends_on_task(task.id)) {
      log::warn("Plan step {} depends on itself", task.id);
      return fail(Error::InvalidPlan);
    }
    tasks.push_back(std::move(task));
  }

  std::lock_guard lock(mu_);
  auto it = workflows_.find(id);
  if (it == workflows_.end()) {
    return fail(Error::NotFound);
  }
  auto& wf = *it->second;
  if (!wf.empty() || running_.contains(id)) {
    log::warn("Workflow {} already has a plan", id);
    return fail(Error::AlreadyExists);
  }

  std::vector<TaskId> ids;
  ids.reserve(tasks.size());
  for (auto& task : tasks) {
    ids.push_back(task.id);
    if (auto r = wf.add_task(std::move(task)); !r) {
      return std::unexpected(r.error());
    }
  }
  log::info("Workflow {}: planned {} tasks", id, ids.size());
  return ids;
}

auto WorkflowEngine::execute_workflow(const WorkflowId& id)
    -> Result<std::map<std::string, std::string>> {
  {
    std::lock_guard lock(mu_);
    auto it = workflows_.find(id);
    if (it == workflows_.end()) {
      return fail(Error::NotFound);
    }
    if (running_.contains(id)) {
      log::warn("Workflow {} is already running", id);
      return fail(Error::AlreadyExists);
    }
    running_.insert(id);
    it->second->set_status(WorkflowStatus::Running);
    log::info("Workflow {} started with {} tasks", id, it->second->size());
  }
  // No-op once finish() has run; otherwise the run ended by an exception.
  ScopeExit abort_guard{[this, &id] { abort_run(id); }};

  notify_workflow(id, "started");

  while (true) {
    if (is_cancelled(id)) {
      log::info("Workflow {} cancelled", id);
      break;
    }

    Step step;
    {
      std::lock_guard lock(mu_);
      step = next_step(*workflows_.at(id));
    }
    notify_tasks(id, step.notices);

    if (step.kind == Step::Kind::Finished) {
      break;
    }
    if (step.kind == Step::Kind::Dispatch) {
      run_batch(id, std::move(step.batch));
    }
  }

  return finish(id);
}

auto WorkflowEngine::next_step(Workflow& wf) -> Step {
  Step step;
  if (wf.is_complete()) {
    return step;
  }

  auto ready = wf.collect_ready_tasks();
  if (ready.empty()) {
    auto now = Clock::now();
    for (std::size_t i = 0; i < wf.size(); ++i) {
      auto& task = wf.task_at(i);
      if (task.status != TaskStatus::Pending &&
          task.status != TaskStatus::Ready) {
        continue;
      }
      if (auto dep = wf.blocking_dependency(task)) {
        task.status = TaskStatus::Skipped;
        task.error = fmt::format("Dependency failed: {}", *dep);
        task.completed_at = now;
        log::info("Workflow {}: {} skipped, dependency {} did not complete",
                  wf.id(), task.id, *dep);
        step.notices.push_back(
            {i, std::string(to_string_view(TaskStatus::Skipped))});
      }
    }

    if (step.notices.empty()) {
      log::warn("Workflow {}: {} tasks can never become ready", wf.id(),
                wf.count(TaskStatus::Pending) + wf.count(TaskStatus::Ready));
      return step;
    }
    step.kind = Step::Kind::Advanced;
    return step;
  }

  auto n = std::min(ready.size(), options_.max_parallel);
  auto now = Clock::now();
  for (std::size_t i = 0; i < n; ++i) {
    auto idx = ready[i];
    auto& task = wf.task_at(idx);
    task.status = TaskStatus::Running;
    task.started_at = now;

    ExecutorRequest req{
        .workflow_id = wf.id(),
        .task_id = task.id,
        .assignee = task.assignee,
        .name = task.name,
        .task = task.description,
        .context = wf.dependency_context(task),
        .attempt = task.retries + 1,
    };
    log::debug("Workflow {}: dispatching {} to {} (attempt {})", wf.id(),
               task.id, task.assignee, req.attempt);
    step.batch.push_back({idx, std::move(req)});
    step.notices.push_back({idx, "started"});
  }
  step.kind = Step::Kind::Dispatch;
  return step;
}

auto WorkflowEngine::run_batch(const WorkflowId& id,
                               std::vector<Dispatch> batch) -> void {
  auto completions = std::make_shared<CompletionQueue>();
  for (auto& d : batch) {
    ExecutionSink sink{
        .on_complete =
            [completions, index = d.index](const TaskId&,
                                           ExecutorResult result) {
              completions->push(index, std::move(result));
            },
    };
    executor_.start(std::move(d.request), std::move(sink));
  }

  for (std::size_t i = 0; i < batch.size(); ++i) {
    auto [index, result] = completions->pop();
    std::string event;
    {
      std::lock_guard lock(mu_);
      event = apply_result(*workflows_.at(id), index, result);
    }
    std::vector<TaskNotice> notices{TaskNotice{index, std::move(event)}};
    notify_tasks(id, notices);
  }
}

auto WorkflowEngine::apply_result(Workflow& wf, std::size_t index,
                                  const ExecutorResult& result)
    -> std::string {
  auto& task = wf.task_at(index);
  task.completed_at = Clock::now();

  if (result.success()) {
    task.result = result.output;
    task.error.reset();
    task.status = TaskStatus::Completed;
    log::debug("Workflow {}: {} completed", wf.id(), task.id);
  } else {
    task.error = result.error.empty()
                     ? fmt::format("Executor exited with code {}",
                                   result.exit_code)
                     : result.error;
    ++task.retries;
    task.status = task.retries < task.max_retries ? TaskStatus::Pending
                                                  : TaskStatus::Failed;
    log::warn("Workflow {}: {} failed (attempt {}/{}): {}", wf.id(), task.id,
              task.retries, task.max_retries, *task.error);
  }
  return std::string(to_string_view(task.status));
}

auto WorkflowEngine::finish(const WorkflowId& id)
    -> std::map<std::string, std::string> {
  std::vector<TaskNotice> notices;
  std::map<std::string, std::string> results;
  WorkflowStatus final_status = WorkflowStatus::Completed;
  {
    std::lock_guard lock(mu_);
    auto& wf = *workflows_.at(id);
    bool cancelled = is_cancelled(id);

    if (cancelled) {
      for (std::size_t i = 0; i < wf.size(); ++i) {
        auto& task = wf.task_at(i);
        if (task.status == TaskStatus::Pending ||
            task.status == TaskStatus::Ready) {
          task.status = TaskStatus::Cancelled;
          notices.push_back(
              {i, std::string(to_string_view(TaskStatus::Cancelled))});
        }
      }
    }

    if (wf.has_failures()) {
      final_status = WorkflowStatus::CompletedWithErrors;
    } else if (cancelled) {
      final_status = WorkflowStatus::Cancelled;
    } else {
      final_status = WorkflowStatus::Completed;
    }
    wf.set_status(final_status);
    wf.set_completed_at(Clock::now());
    running_.erase(id);
    results = wf.results();

    log::info("Workflow {} finished: {} ({} completed, {} failed, {} skipped)",
              id, to_string_view(final_status),
              wf.count(TaskStatus::Completed), wf.count(TaskStatus::Failed),
              wf.count(TaskStatus::Skipped));
  }

  notify_tasks(id, notices);
  notify_workflow(id, to_string_view(final_status));
  return results;
}

auto WorkflowEngine::abort_run(const WorkflowId& id) noexcept -> void {
  std::lock_guard lock(mu_);
  if (!running_.contains(id)) {
    return;
  }
  auto it = workflows_.find(id);
  if (it != workflows_.end()) {
    auto& wf = *it->second;
    auto now = Clock::now();
    for (std::size_t i = 0; i < wf.size(); ++i) {
      auto& task = wf.task_at(i);
      if (task.status == TaskStatus::Running) {
        task.status = TaskStatus::Failed;
        task.error = "Execution aborted";
        task.completed_at = now;
      } else if (task.status == TaskStatus::Ready) {
        task.status = TaskStatus::Pending;
      }
    }
    wf.set_status(WorkflowStatus::CompletedWithErrors);
    wf.set_completed_at(now);
  }
  running_.erase(id);
  log::error("Workflow {} aborted by an exception", id);
}

auto WorkflowEngine::notify_tasks(const WorkflowId& id,
                                  const std::vector<TaskNotice>& notices)
    -> void {
  if (notices.empty()) {
    return;
  }

  std::optional<Workflow> snapshot;
  decltype(callbacks_.on_task_update) callback;
  {
    std::lock_guard lock(mu_);
    if (!callbacks_.on_task_update) {
      return;
    }
    auto it = workflows_.find(id);
    if (it == workflows_.end()) {
      return;
    }
    snapshot.emplace(*it->second);
    callback = callbacks_.on_task_update;
  }

  for (const auto& notice : notices) {
    const auto& task = snapshot->task_at(notice.index);
    try {
      callback(*snapshot, task, notice.event);
    } catch (const std::exception& e) {
      log::debug("on_task_update for {} threw: {}", task.id, e.what());
    } catch (...) {
      log::debug("on_task_update for {} threw a non-standard exception",
                 task.id);
    }
  }
}

auto WorkflowEngine::notify_workflow(const WorkflowId& id,
                                     std::string_view event) -> void {
  std::optional<Workflow> snapshot;
  decltype(callbacks_.on_workflow_update) callback;
  {
    std::lock_guard lock(mu_);
    if (!callbacks_.on_workflow_update) {
      return;
    }
    auto it = workflows_.find(id);
    if (it == workflows_.end()) {
      return;
    }
    snapshot.emplace(*it->second);
    callback = callbacks_.on_workflow_update;
  }

  try {
    callback(*snapshot, event);
  } catch (const std::exception& e) {
    log::debug("on_workflow_update for {} threw: {}", id, e.what());
  } catch (...) {
    log::debug("on_workflow_update for {} threw a non-standard exception",
               id);
  }
}

auto WorkflowEngine::cancel(const WorkflowId& id) -> bool {
  {
    std::lock_guard lock(mu_);
    if (!workflows_.contains(id)) {
      return false;
    }
  }
  {
    std::lock_guard lock(cancel_mu_);
    cancelled_.insert(id);
  }
  log::info("Cancellation requested for workflow {}", id);
  return true;
}

auto WorkflowEngine::is_cancelled(const WorkflowId& id) const -> bool {
  std::lock_guard lock(cancel_mu_);
  return cancelled_.contains(id);
}

auto WorkflowEngine::pause(const WorkflowId& id) -> bool {
  std::lock_guard lock(mu_);
  auto it = workflows_.find(id);
  if (it == workflows_.end()) {
    return false;
  }
  auto status = it->second->status();
  if (status != WorkflowStatus::Created && status != WorkflowStatus::Running) {
    return false;
  }
  it->second->set_status(WorkflowStatus::Paused);
  return true;
}

auto WorkflowEngine::resume(const WorkflowId& id) -> bool {
  std::lock_guard lock(mu_);
  auto it = workflows_.find(id);
  if (it == workflows_.end() ||
      it->second->status() != WorkflowStatus::Paused) {
    return false;
  }
  it->second->set_status(running_.contains(id) ? WorkflowStatus::Running
                                               : WorkflowStatus::Created);
  return true;
}

auto WorkflowEngine::get_workflow_status(const WorkflowId& id) const
    -> std::optional<nlohmann::json> {
  std::lock_guard lock(mu_);
  auto it = workflows_.find(id);
  if (it == workflows_.end()) {
    return std::nullopt;
  }
  return it->second->to_json(options_.result_preview);
}

auto WorkflowEngine::discard_workflow(const WorkflowId& id) -> bool {
  {
    std::lock_guard lock(mu_);
    if (running_.contains(id) || workflows_.erase(id) == 0) {
      return false;
    }
    std::erase(order_, id);
  }
  std::lock_guard lock(cancel_mu_);
  cancelled_.erase(id);
  return true;
}

auto WorkflowEngine::workflow_ids() const -> std::vector<WorkflowId> {
  std::lock_guard lock(mu_);
  return order_;
}

}  // namespace maestro
