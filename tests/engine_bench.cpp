#include "maestro/agent/registry.hpp"
#include "maestro/engine/engine.hpp"
#include "maestro/executor/thread_pool_executor.hpp"
#include "maestro/workflow/workflow.hpp"

#include <benchmark/benchmark.h>

#include "test_utils.hpp"

#include <fmt/format.h>

using namespace maestro;

namespace {

// Layered graph: each task depends on up to two tasks of the previous layer.
auto make_layered_plan(int num_tasks, int width) -> std::vector<PlanStep> {
  std::vector<PlanStep> steps;
  steps.reserve(num_tasks);
  for (int i = 0; i < num_tasks; ++i) {
    PlanStep s;
    s.task = fmt::format("job {}", i);
    s.priority = i % 5;
    if (i >= width) {
      s.depends_on.emplace_back(static_cast<std::size_t>(i - width + 1));
      if ((i % width) + 1 < width) {
        s.depends_on.emplace_back(static_cast<std::size_t>(i - width + 2));
      }
    }
    steps.push_back(std::move(s));
  }
  return steps;
}

auto instant(const ExecutorRequest& req) -> ExecutorResult {
  return ExecutorResult{.exit_code = 0, .output = req.name, .error = {}};
}

}  // namespace

static void BM_CollectReadyTasks(benchmark::State& state) {
  const int num_tasks = state.range(0);
  Workflow wf(maestro::test::workflow_id("wf_bench"), "bench", "");
  for (int i = 0; i < num_tasks; ++i) {
    WorkflowTask task;
    task.id = make_task_id(static_cast<std::size_t>(i) + 1);
    task.priority = i % 5;
    if (i > 0 && i % 2 == 0) {
      task.depends_on.push_back(make_task_id(static_cast<std::size_t>(i)));
    }
    (void)wf.add_task(std::move(task));
  }

  for (auto _ : state) {
    auto ready = wf.collect_ready_tasks();
    benchmark::DoNotOptimize(ready);
  }

  state.SetItemsProcessed(num_tasks * state.iterations());
}

static void BM_FindBestAgent(benchmark::State& state) {
  AgentRegistry registry;
  register_default_profiles(registry);
  const std::string text =
      "Review the authentication module, fix the failing tests and document "
      "the public interface";

  for (auto _ : state) {
    auto best = registry.find_best(text);
    benchmark::DoNotOptimize(best);
  }
}

static void BM_ValidatePlan(benchmark::State& state) {
  auto steps = make_layered_plan(state.range(0), 8);

  for (auto _ : state) {
    auto r = validate_plan(steps);
    benchmark::DoNotOptimize(r);
  }

  state.SetItemsProcessed(state.range(0) * state.iterations());
}

static void BM_ExecuteWorkflowInline(benchmark::State& state) {
  const int num_tasks = state.range(0);
  AgentRegistry registry;
  register_default_profiles(registry);
  auto executor = create_inline_executor(instant);
  WorkflowEngine engine(registry, *executor, {.max_parallel = 8});
  auto steps = make_layered_plan(num_tasks, 8);

  for (auto _ : state) {
    auto id = engine.create_workflow("bench", "");
    (void)engine.create_tasks_from_plan(id, steps);
    auto results = engine.execute_workflow(id);
    benchmark::DoNotOptimize(results);
    (void)engine.discard_workflow(id);
  }

  state.SetItemsProcessed(num_tasks * state.iterations());
}

static void BM_ExecuteWorkflowThreadPool(benchmark::State& state) {
  const int num_tasks = state.range(0);
  AgentRegistry registry;
  register_default_profiles(registry);
  ThreadPoolExecutor pool(instant, 4);
  WorkflowEngine engine(registry, pool,
                        {.max_parallel = static_cast<std::size_t>(
                             state.range(1))});
  auto steps = make_layered_plan(num_tasks, 8);

  for (auto _ : state) {
    auto id = engine.create_workflow("bench", "");
    (void)engine.create_tasks_from_plan(id, steps);
    auto results = engine.execute_workflow(id);
    benchmark::DoNotOptimize(results);
    (void)engine.discard_workflow(id);
  }

  state.SetItemsProcessed(num_tasks * state.iterations());
}

BENCHMARK(BM_CollectReadyTasks)->Arg(10)->Arg(100)->Arg(1000);
BENCHMARK(BM_FindBestAgent);
BENCHMARK(BM_ValidatePlan)->Arg(10)->Arg(100)->Arg(1000);
BENCHMARK(BM_ExecuteWorkflowInline)->Arg(10)->Arg(100);
BENCHMARK(BM_ExecuteWorkflowThreadPool)->Args({100, 1})->Args({100, 4})->Args({100, 8});
