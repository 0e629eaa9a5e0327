#include "maestro/executor/thread_pool_executor.hpp"

#include "maestro/util/log.hpp"

#include <algorithm>
#include <iterator>

namespace maestro {

ThreadPoolExecutor::ThreadPoolExecutor(AgentFunction fn, std::size_t threads)
    : fn_{std::move(fn)} {
  threads = std::max<std::size_t>(threads, 1);
  workers_.reserve(threads);
  for (std::size_t i = 0; i < threads; ++i) {
    workers_.emplace_back([this] { worker_loop(); });
  }
  log::debug("ThreadPoolExecutor started with {} workers", threads);
}

ThreadPoolExecutor::~ThreadPoolExecutor() {
  std::deque<Job> abandoned;
  {
    std::lock_guard lock(mu_);
    stopping_ = true;
    abandoned.swap(jobs_);
  }
  cv_.notify_all();
  for (auto& w : workers_) {
    if (w.joinable()) {
      w.join();
    }
  }

  for (auto& job : abandoned) {
    if (job.sink.on_complete) {
      job.sink.on_complete(job.req.task_id,
                           make_failure("Executor shut down"));
    }
  }
}

auto ThreadPoolExecutor::start(ExecutorRequest req, ExecutionSink sink)
    -> void {
  {
    std::lock_guard lock(mu_);
    if (!stopping_) {
      jobs_.push_back(Job{std::move(req), std::move(sink)});
      cv_.notify_one();
      return;
    }
  }
  if (sink.on_complete) {
    sink.on_complete(req.task_id, make_failure("Executor shut down"));
  }
}

auto ThreadPoolExecutor::cancel(const TaskId& task_id) -> void {
  std::vector<Job> dropped;
  {
    std::lock_guard lock(mu_);
    auto it = std::stable_partition(
        jobs_.begin(), jobs_.end(),
        [&](const Job& job) { return job.req.task_id != task_id; });
    std::move(it, jobs_.end(), std::back_inserter(dropped));
    jobs_.erase(it, jobs_.end());
  }

  for (auto& job : dropped) {
    log::debug("ThreadPoolExecutor: dropped queued request {}", task_id);
    if (job.sink.on_complete) {
      job.sink.on_complete(job.req.task_id, make_failure("Cancelled"));
    }
  }
}

auto ThreadPoolExecutor::queued() const -> std::size_t {
  std::lock_guard lock(mu_);
  return jobs_.size();
}

auto ThreadPoolExecutor::worker_loop() -> void {
  while (true) {
    Job job;
    {
      std::unique_lock lock(mu_);
      cv_.wait(lock, [this] { return stopping_ || !jobs_.empty(); });
      if (stopping_) {
        return;
      }
      job = std::move(jobs_.front());
      jobs_.pop_front();
    }

    auto result = invoke_agent(fn_, job.req);
    if (job.sink.on_complete) {
      job.sink.on_complete(job.req.task_id, std::move(result));
    }
  }
}

auto create_thread_pool_executor(AgentFunction fn, std::size_t threads)
    -> std::unique_ptr<IExecutor> {
  return std::make_unique<ThreadPoolExecutor>(std::move(fn), threads);
}

}  // namespace maestro
