#include "worker_pool.hpp"

#include "internal/observability/logging.hpp"

namespace stowage::executor {

WorkerPool::WorkerPool(uint32_t threads) : threads_(threads == 0 ? 1 : threads) {
}

WorkerPool::~WorkerPool() {
  Stop();
}

void WorkerPool::Start() {
  if (running_.exchange(true)) return;

  workers_.reserve(threads_);
  for (uint32_t i = 0; i < threads_; ++i) {
    workers_.emplace_back(&WorkerPool::Run, this);
  }
}

void WorkerPool::Stop() {
  queue_.Shutdown();
  running_ = false;
  for (auto& worker : workers_) {
    if (worker.joinable()) worker.join();
  }
  workers_.clear();
}

bool WorkerPool::Submit(Task task) {
  return queue_.Enqueue(std::move(task));
}

void WorkerPool::Run() {
  while (true) {
    auto task = queue_.Dequeue();
    if (!task) break;

    try {
      (*task)();
    } catch (const std::exception& e) {
      STOWAGE_LOG_ERROR("worker task failed", {observability::StringField("error", e.what())});
    }
  }
}

} // namespace stowage::executor
