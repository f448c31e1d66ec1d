#include "time.hpp"

namespace stowage::util {

TimePoint Now() {
  return Clock::now();
}

TimePoint DeadlineAfter(std::chrono::milliseconds timeout) {
  return Now() + timeout;
}

std::chrono::milliseconds Remaining(TimePoint deadline) {
  const auto now = Now();
  if (deadline <= now) {
    return std::chrono::milliseconds(0);
  }
  return std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
}

uint64_t WallUnixMillis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace stowage::util
