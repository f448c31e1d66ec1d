#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "internal/lock/lock.hpp"

namespace stowage::lock {

/*
  Authoritative lock state.

  TryAcquire must be a single atomic acquire-if-absent-or-expired; expiry
  is the backend's job, not the holder's.
*/
class LockBackend {
 public:
  virtual ~LockBackend() = default;

  virtual std::optional<LockHandle> TryAcquire(const std::string& path, std::chrono::milliseconds ttl) = 0;

  // False when the handle no longer owns the path (expired, released, taken over).
  virtual bool Release(const LockHandle& handle) = 0;
  virtual bool Extend(const LockHandle& handle, std::chrono::milliseconds ttl) = 0;

  virtual bool IsHeld(const std::string& path) = 0;
};

using LockBackendPtr = std::shared_ptr<LockBackend>;

} // namespace stowage::lock
