#pragma once

#include <chrono>
#include <string>
#include <type_traits>
#include <utility>

#include "internal/lock/lock.hpp"
#include "internal/lock/lock_backend.hpp"
#include "internal/lock/version_table.hpp"
#include "internal/observability/events.hpp"
#include "internal/util/errors.hpp"

namespace stowage::lock {

struct LockOptions {
  std::chrono::milliseconds default_ttl{30000};
  std::chrono::milliseconds default_max_wait{10000};
  std::chrono::milliseconds poll_interval{5};
};

/*
  Pessimistic (Acquire / WithExclusiveAccess) and optimistic
  (ReadVersion / CompareAndSwap) concurrency control over paths.

  A path is protected by one mechanism or the other: CompareAndSwap on a
  path that currently has an exclusive holder fails with InvalidState, and
  CompareAndSwap itself holds the path exclusively while it runs, so an
  Acquire that arrives mid-swap waits for it.
*/
class LockManager {
 public:
  LockManager(LockBackendPtr backend, LockOptions options = {}, observability::EventSinkPtr events = nullptr);

  LockManager(const LockManager&)            = delete;
  LockManager& operator=(const LockManager&) = delete;

  // Zero ttl / max_wait fall back to the configured defaults.
  util::StatusOr<LockHandle> Acquire(const std::string& path, std::chrono::milliseconds ttl = {}, std::chrono::milliseconds max_wait = {});

  // Idempotent. Releasing an expired or already released handle is a no-op.
  void Release(const LockHandle& handle);

  // InvalidState if the handle no longer owns its path.
  util::Status Extend(const LockHandle& handle, std::chrono::milliseconds ttl);

  bool IsHeld(const std::string& path);

  /*
    Run `fn(const LockHandle&)` while holding `path`. The lock is released
    on every exit from `fn`, exceptions included. `fn` returns Status or
    StatusOr<T>; a failed acquisition is returned as LockTimeout without
    calling it.
  */
  template <typename Fn>
  auto WithExclusiveAccess(const std::string& path, std::chrono::milliseconds ttl, std::chrono::milliseconds max_wait, Fn&& fn)
      -> std::invoke_result_t<Fn&, const LockHandle&>;

  VersionStamp ReadVersion(const std::string& path);

  util::StatusOr<VersionStamp> CompareAndSwap(const std::string& path, const VersionStamp& expected, const MutateFn& mutate);

  const LockOptions& Options() const {
    return options_;
  }

 private:
  class ScopedLock {
   public:
    ScopedLock(LockManager& manager, LockHandle handle) : manager_(manager), handle_(std::move(handle)) {
    }

    ~ScopedLock() {
      manager_.Release(handle_);
    }

    ScopedLock(const ScopedLock&)            = delete;
    ScopedLock& operator=(const ScopedLock&) = delete;

    const LockHandle& Handle() const {
      return handle_;
    }

   private:
    LockManager& manager_;
    LockHandle   handle_;
  };

  LockBackendPtr              backend_;
  LockOptions                 options_;
  observability::EventSinkPtr events_;
  VersionTable                versions_;
};

template <typename Fn>
auto LockManager::WithExclusiveAccess(const std::string& path, std::chrono::milliseconds ttl, std::chrono::milliseconds max_wait, Fn&& fn)
    -> std::invoke_result_t<Fn&, const LockHandle&> {
  using Result = std::invoke_result_t<Fn&, const LockHandle&>;
  static_assert(std::is_constructible_v<Result, util::Status>, "WithExclusiveAccess callbacks return Status or StatusOr<T>");

  auto handle = Acquire(path, ttl, max_wait);
  if (!handle.ok()) return Result(handle.status());

  ScopedLock guard(*this, std::move(handle).value());
  return fn(guard.Handle());
}

} // namespace stowage::lock
