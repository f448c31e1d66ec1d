#pragma once

#include <functional>
#include <memory>

namespace stowage::executor {

using Task = std::function<void()>;

/*
  Task-submission seam.

  The core decides when work becomes eligible to run; an executor decides
  how it runs. Submit returns false if the executor no longer accepts work,
  in which case the task was not and will not be run.
*/
class TaskExecutor {
 public:
  virtual ~TaskExecutor() = default;

  virtual bool Submit(Task task) = 0;
};

using TaskExecutorPtr = std::shared_ptr<TaskExecutor>;

// Runs every task on the submitting thread.
class InlineExecutor final : public TaskExecutor {
 public:
  bool Submit(Task task) override {
    task();
    return true;
  }
};

} // namespace stowage::executor
