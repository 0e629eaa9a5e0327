#include "maestro/executor/executor.hpp"

#include "maestro/util/log.hpp"

#include <exception>

namespace maestro {

auto invoke_agent(const AgentFunction& fn, const ExecutorRequest& req)
    -> ExecutorResult {
  if (!fn) {
    return make_failure("No agent function configured");
  }
  try {
    return fn(req);
  } catch (const std::exception& e) {
    log::debug("Agent '{}' threw on {}: {}", req.assignee, req.task_id,
               e.what());
    return make_failure(e.what());
  } catch (...) {
    log::debug("Agent '{}' threw a non-standard exception on {}", req.assignee,
               req.task_id);
    return make_failure("Unknown agent error");
  }
}

class InlineExecutor : public IExecutor {
public:
  explicit InlineExecutor(AgentFunction fn) : fn_{std::move(fn)} {}

  ~InlineExecutor() override = default;

  auto start(ExecutorRequest req, ExecutionSink sink) -> void override {
    auto result = invoke_agent(fn_, req);
    if (sink.on_complete) {
      sink.on_complete(req.task_id, std::move(result));
    }
  }

  auto cancel(const TaskId& task_id) -> void override {
    (void)task_id;
  }

private:
  AgentFunction fn_;
};

auto create_inline_executor(AgentFunction fn) -> std::unique_ptr<IExecutor> {
  return std::make_unique<InlineExecutor>(std::move(fn));
}

}  // namespace maestro
