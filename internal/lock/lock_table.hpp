#pragma once

#include <mutex>
#include <unordered_map>

#include "internal/lock/lock_backend.hpp"

namespace stowage::lock {

/*
  In-process lock backend: one mutex-guarded path → grant map.
*/
class LockTable final : public LockBackend {
 public:
  std::optional<LockHandle> TryAcquire(const std::string& path, std::chrono::milliseconds ttl) override;

  bool Release(const LockHandle& handle) override;
  bool Extend(const LockHandle& handle, std::chrono::milliseconds ttl) override;
  bool IsHeld(const std::string& path) override;

  // Drops expired grants; returns how many were dropped.
  std::size_t PurgeExpired();
  std::size_t Size();

 private:
  struct Grant {
    std::string     token;
    util::TimePoint acquired_at;
    util::TimePoint expires_at;
  };

  static bool IsExpired(const Grant& grant, util::TimePoint now) {
    return grant.expires_at <= now;
  }

  std::mutex mutex_;

  std::unordered_map<std::string, Grant> grants_;
};

} // namespace stowage::lock
