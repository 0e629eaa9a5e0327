#pragma once

#include "maestro/executor/executor.hpp"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <thread>
#include <vector>

namespace maestro {

// Runs an AgentFunction on a fixed set of worker threads. Requests are taken
// in submission order.
class ThreadPoolExecutor : public IExecutor {
public:
  ThreadPoolExecutor(AgentFunction fn, std::size_t threads);
  ~ThreadPoolExecutor() override;

  ThreadPoolExecutor(const ThreadPoolExecutor&) = delete;
  auto operator=(const ThreadPoolExecutor&) -> ThreadPoolExecutor& = delete;

  auto start(ExecutorRequest req, ExecutionSink sink) -> void override;

  // Drops a request that has not been picked up yet; it completes with a
  // failure. Running requests are left alone.
  auto cancel(const TaskId& task_id) -> void override;

  [[nodiscard]] auto thread_count() const noexcept -> std::size_t {
    return workers_.size();
  }

  [[nodiscard]] auto queued() const -> std::size_t;

private:
  struct Job {
    ExecutorRequest req;
    ExecutionSink sink;
  };

  auto worker_loop() -> void;

  AgentFunction fn_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<Job> jobs_;
  bool stopping_{false};
  std::vector<std::thread> workers_;
};

[[nodiscard]] auto create_thread_pool_executor(AgentFunction fn,
                                               std::size_t threads)
    -> std::unique_ptr<IExecutor>;

}  // namespace maestro
