#pragma once

#include "maestro/util/id.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>

namespace maestro {

struct ExecutorRequest {
  WorkflowId workflow_id;
  TaskId task_id;
  std::string assignee;
  std::string name;
  std::string task;
  // Results of the task's completed dependencies, keyed by task id.
  std::map<std::string, std::string> context;
  int attempt{0};
};

struct ExecutorResult {
  int exit_code{0};
  std::string output;
  std::string error;

  [[nodiscard]] auto success() const noexcept -> bool {
    return exit_code == 0 && error.empty();
  }
};

[[nodiscard]] inline auto make_failure(std::string error, int exit_code = -1)
    -> ExecutorResult {
  return ExecutorResult{
      .exit_code = exit_code, .output = {}, .error = std::move(error)};
}

struct ExecutionSink {
  // Invoked exactly once per start(), possibly from another thread.
  std::move_only_function<void(const TaskId&, ExecutorResult)> on_complete;
};

using AgentFunction = std::function<ExecutorResult(const ExecutorRequest&)>;

class IExecutor {
public:
  virtual ~IExecutor() = default;

  virtual auto start(ExecutorRequest req, ExecutionSink sink) -> void = 0;

  virtual auto cancel(const TaskId& task_id) -> void = 0;
};

// Runs fn and converts escaping exceptions into failed results.
[[nodiscard]] auto invoke_agent(const AgentFunction& fn,
                                const ExecutorRequest& req) -> ExecutorResult;

[[nodiscard]] auto create_noop_executor() -> std::unique_ptr<IExecutor>;

[[nodiscard]] auto create_inline_executor(AgentFunction fn)
    -> std::unique_ptr<IExecutor>;

}  // namespace maestro
