#pragma once

#include "maestro/core/error.hpp"
#include "maestro/executor/executor.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace maestro {

// Routes requests to per-agent executors by assignee name.
class CompositeExecutor : public IExecutor {
public:
  CompositeExecutor() = default;
  ~CompositeExecutor() override = default;

  CompositeExecutor(const CompositeExecutor&) = delete;
  auto operator=(const CompositeExecutor&) -> CompositeExecutor& = delete;

  auto register_executor(std::string agent, std::unique_ptr<IExecutor> executor)
      -> void;

  // Used for assignees without a registered executor.
  auto set_fallback(std::unique_ptr<IExecutor> executor) -> void;

  [[nodiscard]] auto has_route(std::string_view agent) const -> bool;

  auto start(ExecutorRequest req, ExecutionSink sink) -> void override;

  auto cancel(const TaskId& task_id) -> void override;

private:
  auto route(std::string_view agent) const -> IExecutor*;

  std::unordered_map<std::string, std::unique_ptr<IExecutor>, StringHash,
                     StringEqual>
      executors_;
  std::unique_ptr<IExecutor> fallback_;
  std::unordered_map<TaskId, IExecutor*> in_flight_;
  mutable std::mutex mutex_;
};

}  // namespace maestro
