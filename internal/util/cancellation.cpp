#include "cancellation.hpp"

#include <thread>

namespace stowage::util {

CancellationToken CancellationToken::Create() {
  CancellationToken token;
  token.state_ = std::make_shared<State>();
  return token;
}

void CancellationToken::Cancel() const {
  if (!state_) return;
  {
    std::lock_guard lock(state_->mutex);
    state_->cancelled = true;
  }
  state_->cv.notify_all();
}

bool CancellationToken::IsCancelled() const {
  if (!state_) return false;
  std::lock_guard lock(state_->mutex);
  return state_->cancelled;
}

bool CancellationToken::SleepFor(std::chrono::milliseconds duration) const {
  if (!state_) {
    std::this_thread::sleep_for(duration);
    return true;
  }

  std::unique_lock lock(state_->mutex);
  return !state_->cv.wait_for(lock, duration, [this] { return state_->cancelled; });
}

} // namespace stowage::util
