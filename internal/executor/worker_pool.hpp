#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <thread>
#include <vector>

#include "task_executor.hpp"
#include "task_queue.hpp"

namespace stowage::executor {

/*
  Fixed-size pool of background workers draining a TaskQueue.

  Used for part uploads, so a blocking store call stalls one worker and
  never the others. Stop() drains queued tasks before joining.
*/
class WorkerPool final : public TaskExecutor {
 public:
  explicit WorkerPool(uint32_t threads);
  ~WorkerPool() override;

  WorkerPool(const WorkerPool&)            = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  void Start();
  void Stop();

  bool Submit(Task task) override;

  uint32_t Threads() const {
    return threads_;
  }

 private:
  void Run();

  uint32_t                 threads_;
  TaskQueue                queue_;
  std::vector<std::thread> workers_;
  std::atomic<bool>        running_{false};
};

} // namespace stowage::executor
