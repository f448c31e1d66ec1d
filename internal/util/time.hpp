#pragma once

#include <chrono>
#include <cstdint>

namespace stowage::util {

/*
  Time utilities. Every deadline and TTL reads the steady clock through here.

  Deadlines and TTLs use the monotonic clock; wall time is only used for
  timestamps handed to collaborators.
*/

using Clock     = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

TimePoint DeadlineAfter(std::chrono::milliseconds timeout);

// Time left until deadline, clamped at zero.
std::chrono::milliseconds Remaining(TimePoint deadline);

uint64_t WallUnixMillis();

} // namespace stowage::util
