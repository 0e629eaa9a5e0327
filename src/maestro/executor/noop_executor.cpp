#include "maestro/executor/executor.hpp"

#include <fmt/format.h>

namespace maestro {

class NoopExecutor : public IExecutor {
public:
  NoopExecutor() = default;
  ~NoopExecutor() override = default;

  auto start(ExecutorRequest req, ExecutionSink sink) -> void override {
    ExecutorResult result;
    result.exit_code = 0;
    result.output = fmt::format("[Mock] Completed: {}", req.name);

    if (sink.on_complete) {
      sink.on_complete(req.task_id, std::move(result));
    }
  }

  auto cancel(const TaskId& task_id) -> void override {
    (void)task_id;
  }
};

auto create_noop_executor() -> std::unique_ptr<IExecutor> {
  return std::make_unique<NoopExecutor>();
}

}  // namespace maestro
