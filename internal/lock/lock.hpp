#pragma once

#include <chrono>
#include <string>

#include "internal/util/time.hpp"

namespace stowage::lock {

/*
  A held exclusive grant on a path. `token` is unique per acquisition and
  is what Release / Extend match against, so a stale handle can never
  release a newer holder's lock.
*/
struct LockHandle {
  std::string               path;
  std::string               token;
  util::TimePoint           acquired_at;
  std::chrono::milliseconds ttl{0};
};

struct VersionStamp {
  std::string path;
  std::string version;

  bool operator==(const VersionStamp&) const = default;
};

} // namespace stowage::lock
