#include "maestro/cli/commands.hpp"

#include "common.hpp"
#include "maestro/agent/registry.hpp"
#include "maestro/engine/engine.hpp"
#include "maestro/executor/composite_executor.hpp"
#include "maestro/executor/thread_pool_executor.hpp"
#include "maestro/util/log.hpp"
#include "maestro/workflow/plan.hpp"

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <stdexcept>

namespace maestro::cli {

namespace {

// Stand-in agent: echoes the task and the ids of the results it was given.
auto make_echo_agent(std::vector<std::string> fail_tasks) -> AgentFunction {
  return [fail_tasks = std::move(fail_tasks)](const ExecutorRequest& req)
             -> ExecutorResult {
    if (std::ranges::find(fail_tasks, req.task_id.str()) != fail_tasks.end()) {
      throw std::runtime_error(
          fmt::format("Simulated failure on attempt {}", req.attempt));
    }
    std::string output = fmt::format("{}: {}", req.assignee, req.task);
    if (!req.context.empty()) {
      output += " (using";
      for (const auto& [dep, _] : req.context) {
        output += " " + dep;
      }
      output += ")";
    }
    return ExecutorResult{.exit_code = 0, .output = std::move(output),
                          .error = {}};
  };
}

}  // namespace

auto cmd_run(const RunOptions& opts) -> int {
  auto config = load_config(opts.config_file);
  if (!config) {
    return 1;
  }
  log::set_level(config->logging.level);

  auto plan = PlanLoader::load_from_file(opts.plan_file);
  if (!plan) {
    fmt::print(stderr, "Error: {}: {}\n", opts.plan_file,
               plan.error().message());
    return 1;
  }

  AgentRegistry registry;
  populate_registry(registry, *config);

  CompositeExecutor executor;
  executor.set_fallback(create_thread_pool_executor(
      make_echo_agent(opts.fail_tasks),
      static_cast<std::size_t>(config->executor.threads)));

  WorkflowEngine engine(registry, executor, to_engine_options(config->engine));
  engine.set_callbacks(WorkflowCallbacks{
      .on_task_update =
          [](const Workflow& wf, const WorkflowTask& task,
             std::string_view event) {
            log::info("[{}] {} ({}) {}", wf.id(), task.id, task.assignee,
                      event);
          },
      .on_workflow_update =
          [](const Workflow& wf, std::string_view event) {
            log::info("[{}] workflow {}", wf.id(), event);
          },
  });

  auto name = plan->name.empty() ? opts.plan_file : plan->name;
  auto id = engine.create_workflow(std::move(name), plan->objective);
  if (auto r = engine.create_tasks_from_plan(id, plan->steps); !r) {
    fmt::print(stderr, "Error: {}\n", r.error().message());
    return 1;
  }

  auto results = engine.execute_workflow(id);
  if (!results) {
    fmt::print(stderr, "Error: {}\n", results.error().message());
    return 1;
  }

  auto snapshot = engine.get_workflow_status(id);
  if (!snapshot) {
    fmt::print(stderr, "Error: workflow {} disappeared\n", id);
    return 1;
  }
  fmt::print("{}\n", snapshot->dump(2));

  auto status = (*snapshot)["status"].get<std::string>();
  return status == to_string_view(WorkflowStatus::Completed) ? 0 : 2;
}

}  // namespace maestro::cli
