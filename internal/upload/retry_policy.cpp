#include "retry_policy.hpp"

#include <algorithm>
#include <random>

namespace stowage::upload {

std::chrono::milliseconds RetryPolicy::BackoffAfter(uint32_t attempt) const {
  auto delay = static_cast<double>(initial_backoff.count());

  for (uint32_t i = 1; i < attempt; ++i) {
    delay *= multiplier;
    if (delay >= static_cast<double>(max_backoff.count())) break;
  }

  delay = std::min(delay, static_cast<double>(max_backoff.count()));

  if (jitter) {
    static thread_local std::mt19937 gen{std::random_device{}()};
    std::uniform_real_distribution<> dis(0.5, 1.0);
    delay *= dis(gen);
  }

  return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

} // namespace stowage::upload
