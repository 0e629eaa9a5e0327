#include "maestro/engine/engine.hpp"
#include "maestro/executor/thread_pool_executor.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace maestro;
using namespace std::chrono_literals;
using maestro::test::BlockingQueue;
using maestro::test::Gate;
using maestro::test::step;
using maestro::test::task_id;

namespace {

struct TaskEvent {
  std::string task;
  std::string event;
  TaskStatus status;
};

auto echo(const ExecutorRequest& req) -> ExecutorResult {
  return ExecutorResult{.exit_code = 0, .output = "done: " + req.task,
                        .error = {}};
}

auto always_fail(const ExecutorRequest&) -> ExecutorResult {
  return make_failure("agent unavailable");
}

}  // namespace

class WorkflowEngineTest : public ::testing::Test {
protected:
  void SetUp() override { register_default_profiles(registry_); }

  auto make_engine(IExecutor& executor, EngineOptions options = {})
      -> std::unique_ptr<WorkflowEngine> {
    auto engine =
        std::make_unique<WorkflowEngine>(registry_, executor, options);
    engine->set_callbacks(WorkflowCallbacks{
        .on_task_update =
            [this](const Workflow&, const WorkflowTask& task,
                   std::string_view event) {
              std::lock_guard lock(mu_);
              events_.push_back({task.id.str(), std::string(event),
                                 task.status});
            },
        .on_workflow_update =
            [this](const Workflow& wf, std::string_view event) {
              std::lock_guard lock(mu_);
              workflow_events_.emplace_back(event);
              last_workflow_.emplace(wf);
            },
    });
    return engine;
  }

  auto plan(WorkflowEngine& engine, std::vector<PlanStep> steps)
      -> WorkflowId {
    auto id = engine.create_workflow("test", "objective");
    auto r = engine.create_tasks_from_plan(id, steps);
    EXPECT_TRUE(r.has_value());
    return id;
  }

  auto events_for(std::string_view task) -> std::vector<TaskEvent> {
    std::lock_guard lock(mu_);
    std::vector<TaskEvent> out;
    for (const auto& e : events_) {
      if (e.task == task) {
        out.push_back(e);
      }
    }
    return out;
  }

  // "<task>:<event>" in emission order.
  auto timeline() -> std::vector<std::string> {
    std::lock_guard lock(mu_);
    std::vector<std::string> out;
    for (const auto& e : events_) {
      out.push_back(e.task + ":" + e.event);
    }
    return out;
  }

  static auto status_of(WorkflowEngine& engine, const WorkflowId& id)
      -> std::string {
    return engine.get_workflow_status(id)->at("status").get<std::string>();
  }

  static auto task_json(WorkflowEngine& engine, const WorkflowId& id,
                        std::size_t index) -> nlohmann::json {
    return engine.get_workflow_status(id)->at("tasks").at(index);
  }

  AgentRegistry registry_;
  std::mutex mu_;
  std::vector<TaskEvent> events_;
  std::vector<std::string> workflow_events_;
  std::optional<Workflow> last_workflow_;
};

TEST_F(WorkflowEngineTest, DependentTaskRunsAfterItsDependency) {
  auto exec = create_inline_executor(echo);
  auto engine = make_engine(*exec, {.max_parallel = 2});
  auto id = plan(*engine, {step("first"), step("second", {1})});

  auto results = engine->execute_workflow(id);
  ASSERT_TRUE(results.has_value());

  EXPECT_EQ(timeline(),
            (std::vector<std::string>{"task_1:started", "task_1:completed",
                                      "task_2:started", "task_2:completed"}));
  EXPECT_EQ(status_of(*engine, id), "completed");
  EXPECT_EQ(workflow_events_,
            (std::vector<std::string>{"started", "completed"}));
  EXPECT_EQ(results->size(), 2);
  EXPECT_EQ(results->at("task_2"), "done: second");
}

TEST_F(WorkflowEngineTest, SingleSlotRunsInPriorityOrder) {
  auto exec = create_inline_executor(echo);
  auto engine = make_engine(*exec, {.max_parallel = 1});
  auto id = plan(*engine, {step("low", {}, 2), step("high", {}, 1)});

  ASSERT_TRUE(engine->execute_workflow(id).has_value());
  EXPECT_EQ(timeline(),
            (std::vector<std::string>{"task_2:started", "task_2:completed",
                                      "task_1:started", "task_1:completed"}));
}

TEST_F(WorkflowEngineTest, EqualPriorityKeepsPlanOrder) {
  auto exec = create_inline_executor(echo);
  auto engine = make_engine(*exec, {.max_parallel = 1});
  auto id = plan(*engine, {step("a"), step("b"), step("c")});

  ASSERT_TRUE(engine->execute_workflow(id).has_value());
  auto t = timeline();
  ASSERT_EQ(t.size(), 6);
  EXPECT_EQ(t[0], "task_1:started");
  EXPECT_EQ(t[2], "task_2:started");
  EXPECT_EQ(t[4], "task_3:started");
}

TEST_F(WorkflowEngineTest, RetriesThenFails) {
  auto exec = create_inline_executor(always_fail);
  auto engine = make_engine(*exec);
  auto s = step("flaky");
  s.max_retries = 2;
  auto id = plan(*engine, {s});

  ASSERT_TRUE(engine->execute_workflow(id).has_value());

  std::vector<TaskStatus> observed;
  for (const auto& e : events_for("task_1")) {
    observed.push_back(e.status);
  }
  EXPECT_EQ(observed,
            (std::vector<TaskStatus>{TaskStatus::Running, TaskStatus::Pending,
                                     TaskStatus::Running, TaskStatus::Failed}));

  auto task = task_json(*engine, id, 0);
  EXPECT_EQ(task["status"], "failed");
  EXPECT_EQ(task["retries"], 2);
  EXPECT_EQ(task["error"], "agent unavailable");
  EXPECT_EQ(status_of(*engine, id), "completed_with_errors");
}

TEST_F(WorkflowEngineTest, RetryBoundFollowsMaxRetries) {
  std::atomic<int> attempts{0};
  auto exec = create_inline_executor([&](const ExecutorRequest& req) {
    attempts.fetch_add(1);
    return always_fail(req);
  });
  auto engine = make_engine(*exec, {.max_retries = 4});
  auto id = plan(*engine, {step("never works")});

  ASSERT_TRUE(engine->execute_workflow(id).has_value());
  EXPECT_EQ(attempts.load(), 4);
  EXPECT_EQ(task_json(*engine, id, 0)["retries"], 4);
}

TEST_F(WorkflowEngineTest, RecoversAfterTransientFailure) {
  std::atomic<int> attempts{0};
  auto exec = create_inline_executor([&](const ExecutorRequest& req) {
    if (attempts.fetch_add(1) == 0) {
      throw std::runtime_error("timeout talking to model");
    }
    return echo(req);
  });
  auto engine = make_engine(*exec);
  auto id = plan(*engine, {step("eventually")});

  ASSERT_TRUE(engine->execute_workflow(id).has_value());
  auto task = task_json(*engine, id, 0);
  EXPECT_EQ(task["status"], "completed");
  EXPECT_EQ(task["retries"], 1);
  EXPECT_TRUE(task["error"].is_null());
  EXPECT_EQ(status_of(*engine, id), "completed");
}

TEST_F(WorkflowEngineTest, FailurePropagatesTransitively) {
  auto exec = create_inline_executor([](const ExecutorRequest& req) {
    return req.task_id == task_id("task_1") ? always_fail(req) : echo(req);
  });
  auto engine = make_engine(*exec);
  auto first = step("A");
  first.max_retries = 1;
  auto id = plan(*engine, {first, step("B", {1}), step("C", {2}),
                           step("D")});

  ASSERT_TRUE(engine->execute_workflow(id).has_value());

  auto b = task_json(*engine, id, 1);
  EXPECT_EQ(b["status"], "skipped");
  EXPECT_EQ(b["error"], "Dependency failed: task_1");
  EXPECT_TRUE(b["started_at"].is_null());

  auto c = task_json(*engine, id, 2);
  EXPECT_EQ(c["status"], "skipped");
  EXPECT_EQ(c["error"], "Dependency failed: task_2");

  EXPECT_EQ(task_json(*engine, id, 3)["status"], "completed");
  EXPECT_EQ(status_of(*engine, id), "completed_with_errors");

  auto skipped = events_for("task_2");
  ASSERT_EQ(skipped.size(), 1);
  EXPECT_EQ(skipped[0].event, "skipped");
}

TEST_F(WorkflowEngineTest, CancelLetsInFlightBatchFinish) {
  Gate gate;
  BlockingQueue<std::string> started;
  ThreadPoolExecutor pool(
      [&](const ExecutorRequest& req) {
        started.push(req.task_id.str());
        gate.wait();
        return echo(req);
      },
      2);
  auto engine = make_engine(pool, {.max_parallel = 2});
  auto id = plan(*engine, {step("a"), step("b"), step("c", {1, 2})});

  Result<std::map<std::string, std::string>> result;
  std::thread driver([&] { result = engine->execute_workflow(id); });

  ASSERT_TRUE(started.try_pop_for(5s).has_value());
  ASSERT_TRUE(started.try_pop_for(5s).has_value());
  EXPECT_TRUE(engine->cancel(id));
  EXPECT_TRUE(engine->is_cancelled(id));
  gate.open();
  driver.join();

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(task_json(*engine, id, 0)["status"], "completed");
  EXPECT_EQ(task_json(*engine, id, 1)["status"], "completed");
  EXPECT_EQ(task_json(*engine, id, 2)["status"], "cancelled");
  EXPECT_EQ(status_of(*engine, id), "cancelled");
  EXPECT_FALSE(started.try_pop_for(50ms).has_value());
}

TEST_F(WorkflowEngineTest, CancelBeforeExecution) {
  auto exec = create_inline_executor(echo);
  auto engine = make_engine(*exec);
  auto id = plan(*engine, {step("a"), step("b")});

  EXPECT_TRUE(engine->cancel(id));
  ASSERT_TRUE(engine->execute_workflow(id).has_value());
  EXPECT_EQ(status_of(*engine, id), "cancelled");
  EXPECT_EQ(task_json(*engine, id, 0)["status"], "cancelled");
  EXPECT_TRUE(timeline() ==
              (std::vector<std::string>{"task_1:cancelled",
                                        "task_2:cancelled"}));
}

TEST_F(WorkflowEngineTest, CancelUnknownWorkflow) {
  auto exec = create_noop_executor();
  auto engine = make_engine(*exec);
  EXPECT_FALSE(engine->cancel(WorkflowId("wf_missing")));
}

TEST_F(WorkflowEngineTest, ZeroScoreFallsBackToDefaultAssignee) {
  auto exec = create_noop_executor();
  auto engine = make_engine(*exec);
  auto id = plan(*engine, {step("hello world")});
  EXPECT_EQ(task_json(*engine, id, 0)["assignee"], "Developer");
}

TEST_F(WorkflowEngineTest, AssigneeResolution) {
  auto exec = create_noop_executor();
  auto engine = make_engine(*exec, {.default_assignee = "Refiner"});

  auto known = step("anything at all");
  known.assignee = "Security";
  auto unknown = step("write the readme");
  unknown.assignee = "Ghost";
  auto routed = step("design the landing page layout");
  auto fallback = step("hello world");

  auto id = plan(*engine, {known, unknown, routed, fallback});
  EXPECT_EQ(task_json(*engine, id, 0)["assignee"], "Security");
  EXPECT_EQ(task_json(*engine, id, 1)["assignee"], "Documentation");
  EXPECT_EQ(task_json(*engine, id, 2)["assignee"], "UI/UX Designer");
  EXPECT_EQ(task_json(*engine, id, 3)["assignee"], "Refiner");
}

TEST_F(WorkflowEngineTest, ExplicitAssigneeKeptWithEmptyRegistry) {
  registry_.clear();
  auto exec = create_noop_executor();
  auto engine = make_engine(*exec);
  auto s = step("anything");
  s.assignee = "Ghost";
  auto id = plan(*engine, {s, step("other")});
  EXPECT_EQ(task_json(*engine, id, 0)["assignee"], "Ghost");
  EXPECT_EQ(task_json(*engine, id, 1)["assignee"], "Developer");
}

TEST_F(WorkflowEngineTest, PlanDefaults) {
  auto exec = create_noop_executor();
  auto engine = make_engine(*exec);
  PlanStep s;
  s.task = std::string(150, 'x');
  auto id = plan(*engine, {s});

  auto task = task_json(*engine, id, 0);
  EXPECT_EQ(task["id"], "task_1");
  EXPECT_EQ(task["priority"], 3);
  EXPECT_EQ(task["max_retries"], 2);
  EXPECT_EQ(task["status"], "pending");
  EXPECT_EQ(task["name"].get<std::string>().size(), 100);
  EXPECT_EQ(task["description"].get<std::string>().size(), 150);
}

TEST_F(WorkflowEngineTest, BoundedConcurrency) {
  std::atomic<int> running{0};
  std::atomic<int> peak{0};
  ThreadPoolExecutor pool(
      [&](const ExecutorRequest& req) {
        int now = running.fetch_add(1) + 1;
        int prev = peak.load();
        while (now > prev && !peak.compare_exchange_weak(prev, now)) {
        }
        maestro::test::sleep_ms(5ms);
        running.fetch_sub(1);
        return echo(req);
      },
      8);
  auto engine = make_engine(pool, {.max_parallel = 3});

  std::vector<PlanStep> steps;
  for (int i = 0; i < 10; ++i) {
    steps.push_back(step("job " + std::to_string(i)));
  }
  auto id = plan(*engine, steps);

  ASSERT_TRUE(engine->execute_workflow(id).has_value());
  EXPECT_LE(peak.load(), 3);
  EXPECT_GE(peak.load(), 1);
  EXPECT_EQ(status_of(*engine, id), "completed");
}

TEST_F(WorkflowEngineTest, DependenciesCompleteBeforeDependentsStart) {
  ThreadPoolExecutor pool(echo, 4);
  auto engine = make_engine(pool, {.max_parallel = 4});
  auto id = plan(*engine, {step("root"), step("left", {1}),
                           step("right", {1}), step("join", {2, 3}),
                           step("side")});

  ASSERT_TRUE(engine->execute_workflow(id).has_value());
  ASSERT_TRUE(last_workflow_.has_value());

  const auto& wf = *last_workflow_;
  for (const auto& task : wf.tasks()) {
    ASSERT_EQ(task.status, TaskStatus::Completed);
    for (const auto& dep : task.depends_on) {
      const auto* d = wf.find_task(dep);
      ASSERT_NE(d, nullptr);
      EXPECT_LE(*d->completed_at, *task.started_at) << task.id << " <- " << dep;
    }
  }
}

TEST_F(WorkflowEngineTest, DependencyResultsReachExecutor) {
  std::map<std::string, std::string> seen_context;
  auto exec = create_inline_executor([&](const ExecutorRequest& req) {
    if (req.task_id == task_id("task_2")) {
      seen_context = req.context;
    }
    return echo(req);
  });
  auto engine = make_engine(*exec);
  auto id = plan(*engine, {step("schema"), step("api", {1})});

  ASSERT_TRUE(engine->execute_workflow(id).has_value());
  ASSERT_EQ(seen_context.size(), 1);
  EXPECT_EQ(seen_context.at("task_1"), "done: schema");
}

TEST_F(WorkflowEngineTest, RejectsCyclicPlan) {
  auto exec = create_noop_executor();
  auto engine = make_engine(*exec);
  auto id = engine->create_workflow("cyclic", "loop");

  std::vector<PlanStep> steps{step("a", {2}), step("b", {1})};
  auto r = engine->create_tasks_from_plan(id, steps);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::InvalidPlan));
  EXPECT_TRUE(engine->get_workflow_status(id)->at("tasks").empty());
}

TEST_F(WorkflowEngineTest, RejectsDanglingReference) {
  auto exec = create_noop_executor();
  auto engine = make_engine(*exec);
  auto id = engine->create_workflow("dangling", "");

  std::vector<PlanStep> steps{step("a"), step("b", {9})};
  auto r = engine->create_tasks_from_plan(id, steps);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::InvalidPlan));
}

TEST_F(WorkflowEngineTest, UnvalidatedDanglingTaskStaysPending) {
  auto exec = create_inline_executor(echo);
  auto engine = make_engine(*exec, {.validate_plans = false});
  auto id = plan(*engine, {step("a"), step("b", {9})});

  ASSERT_TRUE(engine->execute_workflow(id).has_value());
  EXPECT_EQ(task_json(*engine, id, 0)["status"], "completed");
  EXPECT_EQ(task_json(*engine, id, 1)["status"], "pending");
  EXPECT_EQ(status_of(*engine, id), "completed");
}

TEST_F(WorkflowEngineTest, SelfReferenceAlwaysRejected) {
  auto exec = create_noop_executor();
  auto engine = make_engine(*exec, {.validate_plans = false});
  auto id = engine->create_workflow("self", "");
  std::vector<PlanStep> steps{step("a", {1})};
  auto r = engine->create_tasks_from_plan(id, steps);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::InvalidPlan));
}

TEST_F(WorkflowEngineTest, PlanOnlyOnce) {
  auto exec = create_noop_executor();
  auto engine = make_engine(*exec);
  auto id = plan(*engine, {step("a")});

  std::vector<PlanStep> more{step("b")};
  auto r = engine->create_tasks_from_plan(id, more);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::AlreadyExists));
}

TEST_F(WorkflowEngineTest, UnknownWorkflow) {
  auto exec = create_noop_executor();
  auto engine = make_engine(*exec);
  WorkflowId missing("wf_missing");

  auto r = engine->execute_workflow(missing);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::NotFound));
  EXPECT_FALSE(engine->get_workflow_status(missing).has_value());
  std::vector<PlanStep> steps{step("a")};
  EXPECT_FALSE(engine->create_tasks_from_plan(missing, steps).has_value());
}

TEST_F(WorkflowEngineTest, SecondDriverIsRejected) {
  Gate gate;
  BlockingQueue<int> started;
  ThreadPoolExecutor pool(
      [&](const ExecutorRequest& req) {
        started.push(1);
        gate.wait();
        return echo(req);
      },
      1);
  auto engine = make_engine(pool);
  auto id = plan(*engine, {step("a")});

  std::thread driver([&] { (void)engine->execute_workflow(id); });
  ASSERT_TRUE(started.try_pop_for(5s).has_value());

  auto second = engine->execute_workflow(id);
  ASSERT_FALSE(second.has_value());
  EXPECT_EQ(second.error(), make_error_code(Error::AlreadyExists));
  EXPECT_FALSE(engine->discard_workflow(id));

  gate.open();
  driver.join();
  EXPECT_TRUE(engine->discard_workflow(id));
}

TEST_F(WorkflowEngineTest, ThrowingCallbacksAreIgnored) {
  auto exec = create_inline_executor(echo);
  WorkflowEngine engine(registry_, *exec);
  engine.set_callbacks(WorkflowCallbacks{
      .on_task_update =
          [](const Workflow&, const WorkflowTask&, std::string_view) {
            throw std::runtime_error("observer down");
          },
      .on_workflow_update =
          [](const Workflow&, std::string_view) {
            throw std::logic_error("observer down");
          },
  });
  auto id = engine.create_workflow("noisy", "");
  std::vector<PlanStep> steps{step("a"), step("b", {1})};
  ASSERT_TRUE(engine.create_tasks_from_plan(id, steps).has_value());

  auto results = engine.execute_workflow(id);
  ASSERT_TRUE(results.has_value());
  EXPECT_EQ(results->size(), 2);
  EXPECT_EQ(status_of(engine, id), "completed");
}

TEST_F(WorkflowEngineTest, StatusSnapshotIsIdempotent) {
  auto exec = create_inline_executor(echo);
  auto engine = make_engine(*exec);
  auto id = plan(*engine, {step("a"), step("b", {1})});
  ASSERT_TRUE(engine->execute_workflow(id).has_value());

  auto first = engine->get_workflow_status(id);
  auto second = engine->get_workflow_status(id);
  ASSERT_TRUE(first && second);
  EXPECT_EQ(*first, *second);
  EXPECT_TRUE(first->at("completed_at").is_string());
}

TEST_F(WorkflowEngineTest, SnapshotTruncatesResults) {
  auto exec = create_inline_executor([](const ExecutorRequest&) {
    return ExecutorResult{.exit_code = 0, .output = std::string(1000, 'r'),
                          .error = {}};
  });
  auto engine = make_engine(*exec);
  auto id = plan(*engine, {step("verbose")});

  auto results = engine->execute_workflow(id);
  ASSERT_TRUE(results.has_value());
  EXPECT_EQ(results->at("task_1").size(), 1000);
  EXPECT_EQ(task_json(*engine, id, 0)["result"].get<std::string>().size(),
            200);
}

TEST_F(WorkflowEngineTest, SnapshotsAreSafeDuringExecution) {
  ThreadPoolExecutor pool(
      [](const ExecutorRequest& req) {
        maestro::test::sleep_ms(1ms);
        return echo(req);
      },
      4);
  auto engine = make_engine(pool, {.max_parallel = 4});
  std::vector<PlanStep> steps;
  for (std::size_t i = 1; i <= 20; ++i) {
    steps.push_back(i == 1 ? step("t") : step("t", {i - 1}));
  }
  auto id = plan(*engine, steps);

  std::atomic<bool> done{false};
  std::thread reader([&] {
    while (!done.load()) {
      auto snapshot = engine->get_workflow_status(id);
      ASSERT_TRUE(snapshot.has_value());
      EXPECT_EQ(snapshot->at("tasks").size(), 20);
    }
  });

  ASSERT_TRUE(engine->execute_workflow(id).has_value());
  done.store(true);
  reader.join();
  EXPECT_EQ(status_of(*engine, id), "completed");
}

TEST_F(WorkflowEngineTest, PauseAndResumeAreLabels) {
  auto exec = create_noop_executor();
  auto engine = make_engine(*exec);
  auto id = plan(*engine, {step("a")});

  EXPECT_FALSE(engine->resume(id));
  EXPECT_TRUE(engine->pause(id));
  EXPECT_EQ(status_of(*engine, id), "paused");
  EXPECT_TRUE(engine->resume(id));
  EXPECT_EQ(status_of(*engine, id), "created");

  EXPECT_TRUE(engine->pause(id));
  ASSERT_TRUE(engine->execute_workflow(id).has_value());
  EXPECT_EQ(status_of(*engine, id), "completed");
  EXPECT_FALSE(engine->pause(id));
  EXPECT_FALSE(engine->pause(WorkflowId("wf_missing")));
}

TEST_F(WorkflowEngineTest, WorkflowIdsInCreationOrder) {
  auto exec = create_noop_executor();
  auto engine = make_engine(*exec);
  auto a = engine->create_workflow("a", "");
  auto b = engine->create_workflow("b", "");
  EXPECT_NE(a, b);
  EXPECT_EQ(engine->workflow_ids(), (std::vector<WorkflowId>{a, b}));

  EXPECT_TRUE(engine->discard_workflow(a));
  EXPECT_FALSE(engine->discard_workflow(a));
  EXPECT_EQ(engine->workflow_ids(), (std::vector<WorkflowId>{b}));
}

TEST_F(WorkflowEngineTest, EmptyWorkflowCompletes) {
  auto exec = create_noop_executor();
  auto engine = make_engine(*exec);
  auto id = engine->create_workflow("empty", "");
  auto results = engine->execute_workflow(id);
  ASSERT_TRUE(results.has_value());
  EXPECT_TRUE(results->empty());
  EXPECT_EQ(status_of(*engine, id), "completed");
}

TEST_F(WorkflowEngineTest, NoopExecutorProducesMockResults) {
  auto exec = create_noop_executor();
  auto engine = make_engine(*exec);
  auto id = plan(*engine, {step("write docs")});
  auto results = engine->execute_workflow(id);
  ASSERT_TRUE(results.has_value());
  EXPECT_EQ(results->at("task_1"), "[Mock] Completed: write docs");
}

TEST_F(WorkflowEngineTest, NonStandardAgentExceptionIsRetried) {
  auto exec = create_inline_executor(
      [](const ExecutorRequest&) -> ExecutorResult { throw 42; });
  auto engine = make_engine(*exec);
  auto id = plan(*engine, {step("odd thrower"), step("after", {1})});

  ASSERT_TRUE(engine->execute_workflow(id).has_value());
  auto task = task_json(*engine, id, 0);
  EXPECT_EQ(task["status"], "failed");
  EXPECT_EQ(task["retries"], 2);
  EXPECT_EQ(task["error"], "Unknown agent error");
  EXPECT_EQ(task_json(*engine, id, 1)["status"], "skipped");
  EXPECT_EQ(status_of(*engine, id), "completed_with_errors");
  EXPECT_TRUE(engine->discard_workflow(id));
}

TEST_F(WorkflowEngineTest, NonStandardAgentExceptionOnPoolWorker) {
  ThreadPoolExecutor pool(
      [](const ExecutorRequest&) -> ExecutorResult { throw 'x'; }, 2);
  auto engine = make_engine(pool);
  auto id = plan(*engine, {step("a")});

  ASSERT_TRUE(engine->execute_workflow(id).has_value());
  EXPECT_EQ(task_json(*engine, id, 0)["error"], "Unknown agent error");
  EXPECT_EQ(status_of(*engine, id), "completed_with_errors");
}

TEST_F(WorkflowEngineTest, NonStandardCallbackExceptionIsIgnored) {
  auto exec = create_noop_executor();
  WorkflowEngine engine(registry_, *exec);
  engine.set_callbacks(WorkflowCallbacks{
      .on_task_update =
          [](const Workflow&, const WorkflowTask&, std::string_view) {
            throw 7;
          },
      .on_workflow_update = [](const Workflow&, std::string_view) {
        throw 8;
      },
  });
  auto id = engine.create_workflow("noisy", "");
  std::vector<PlanStep> steps{step("a")};
  ASSERT_TRUE(engine.create_tasks_from_plan(id, steps).has_value());

  ASSERT_TRUE(engine.execute_workflow(id).has_value());
  EXPECT_EQ(status_of(engine, id), "completed");
  EXPECT_EQ(task_json(engine, id, 0)["status"], "completed");
}

namespace {

class ExplodingExecutor : public IExecutor {
public:
  auto start(ExecutorRequest, ExecutionSink) -> void override { throw 42; }
  auto cancel(const TaskId&) -> void override {}
};

}  // namespace

TEST_F(WorkflowEngineTest, ExecutorExceptionReleasesWorkflow) {
  ExplodingExecutor exec;
  auto engine = make_engine(exec);
  auto id = plan(*engine, {step("a"), step("b")});

  EXPECT_THROW((void)engine->execute_workflow(id), int);

  auto snapshot = engine->get_workflow_status(id);
  ASSERT_TRUE(snapshot.has_value());
  EXPECT_EQ(snapshot->at("status"), "completed_with_errors");
  EXPECT_TRUE(snapshot->at("completed_at").is_string());
  EXPECT_EQ(snapshot->at("tasks").at(0)["status"], "failed");
  EXPECT_EQ(snapshot->at("tasks").at(0)["error"], "Execution aborted");

  // No longer marked as running: a second run is accepted and finds every
  // task already resolved.
  auto again = engine->execute_workflow(id);
  ASSERT_TRUE(again.has_value());
  EXPECT_TRUE(again->empty());
  EXPECT_TRUE(engine->discard_workflow(id));
}
