#include "maestro/executor/composite_executor.hpp"

#include "maestro/util/log.hpp"

#include <fmt/format.h>

namespace maestro {

auto CompositeExecutor::register_executor(std::string agent,
                                          std::unique_ptr<IExecutor> executor)
    -> void {
  std::lock_guard lock(mutex_);
  executors_[std::move(agent)] = std::move(executor);
}

auto CompositeExecutor::set_fallback(std::unique_ptr<IExecutor> executor)
    -> void {
  std::lock_guard lock(mutex_);
  fallback_ = std::move(executor);
}

auto CompositeExecutor::has_route(std::string_view agent) const -> bool {
  std::lock_guard lock(mutex_);
  return route(agent) != nullptr;
}

auto CompositeExecutor::route(std::string_view agent) const -> IExecutor* {
  if (auto it = executors_.find(agent); it != executors_.end()) {
    return it->second.get();
  }
  return fallback_.get();
}

auto CompositeExecutor::start(ExecutorRequest req, ExecutionSink sink)
    -> void {
  IExecutor* target = nullptr;
  {
    std::lock_guard lock(mutex_);
    target = route(req.assignee);
    if (target != nullptr) {
      in_flight_[req.task_id] = target;
    }
  }

  if (target == nullptr) {
    log::error("CompositeExecutor: no executor registered for agent {}",
               req.assignee);
    if (sink.on_complete) {
      sink.on_complete(req.task_id,
                       make_failure(fmt::format(
                           "No executor available for agent '{}'",
                           req.assignee)));
    }
    return;
  }

  // Drop the in-flight mapping once the request completes.
  TaskId task_id = req.task_id;
  auto original_on_complete = std::move(sink.on_complete);
  sink.on_complete = [this, task_id,
                      on_complete = std::move(original_on_complete)](
                         const TaskId& id, ExecutorResult result) mutable {
    {
      std::lock_guard lock(mutex_);
      in_flight_.erase(task_id);
    }
    if (on_complete) {
      on_complete(id, std::move(result));
    }
  };

  target->start(std::move(req), std::move(sink));
}

auto CompositeExecutor::cancel(const TaskId& task_id) -> void {
  IExecutor* target = nullptr;
  {
    std::lock_guard lock(mutex_);
    auto it = in_flight_.find(task_id);
    if (it == in_flight_.end()) {
      log::debug("CompositeExecutor: no in-flight request for {}", task_id);
      return;
    }
    target = it->second;
  }
  target->cancel(task_id);
}

}  // namespace maestro
