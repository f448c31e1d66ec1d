#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace stowage::util {

/*
  Cooperative cancellation shared between a caller and the work it started.

  A default-constructed token can never be cancelled. Copies share state.
*/
class CancellationToken {
 public:
  CancellationToken() = default;

  static CancellationToken Create();

  void Cancel() const;
  bool IsCancelled() const;

  // Sleeps up to `duration`. Returns false if woken by cancellation.
  bool SleepFor(std::chrono::milliseconds duration) const;

 private:
  struct State {
    std::mutex              mutex;
    std::condition_variable cv;
    bool                    cancelled = false;
  };

  std::shared_ptr<State> state_;
};

} // namespace stowage::util
