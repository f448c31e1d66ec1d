#pragma once

#include <chrono>
#include <cstdint>

namespace stowage::upload {

/*
  Bounded exponential backoff for transient store failures.

  `max_attempts` counts every try, the first one included.
*/
struct RetryPolicy {
  uint32_t                  max_attempts = 3;
  std::chrono::milliseconds initial_backoff{100};
  std::chrono::milliseconds max_backoff{5000};
  double                    multiplier = 2.0;
  bool                      jitter     = false;

  // Delay before attempt `attempt + 1`, given `attempt` tries so far (>= 1).
  std::chrono::milliseconds BackoffAfter(uint32_t attempt) const;
};

} // namespace stowage::upload
