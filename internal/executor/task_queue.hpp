#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

#include "task_executor.hpp"

namespace stowage::executor {

/*
  Thread-safe blocking queue feeding the worker pool.
*/
class TaskQueue {
 public:
  // false once the queue is shut down
  bool Enqueue(Task task);

  // blocking wait; nullopt after shutdown once drained
  std::optional<Task> Dequeue();

  void Shutdown();

  std::size_t Size() const;

 private:
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::queue<Task>        queue_;
  bool                    shutdown_ = false;
};

} // namespace stowage::executor
