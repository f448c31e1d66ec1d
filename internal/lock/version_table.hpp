#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "internal/lock/lock.hpp"
#include "internal/util/errors.hpp"

namespace stowage::lock {

using MutateFn = std::function<util::Status()>;

/*
  Optimistic-concurrency stamps per path.

  Versions are opaque strings ("v<N>"); a path that was never written is
  at "v0". CompareAndSwap runs the mutation while holding the path's own
  mutex, so the compare, the mutation and the bump are one step as far as
  other CompareAndSwap callers on that path are concerned.

  Callers that must hold more than the path mutex across the swap take it
  with LockPath and then call SwapLocked.
*/
class VersionTable {
 public:
  class PathGuard {
   public:
    explicit PathGuard(std::shared_ptr<std::mutex> mutex) : mutex_(std::move(mutex)), lock_(*mutex_) {
    }

   private:
    std::shared_ptr<std::mutex>  mutex_;
    std::unique_lock<std::mutex> lock_;
  };

  VersionStamp Read(const std::string& path);

  util::StatusOr<VersionStamp> CompareAndSwap(const std::string& path, const VersionStamp& expected, const MutateFn& mutate);

  PathGuard LockPath(const std::string& path);

  // caller holds LockPath(path)
  util::StatusOr<VersionStamp> SwapLocked(const std::string& path, const VersionStamp& expected, const MutateFn& mutate);

 private:
  static constexpr std::size_t kCleanupInterval = 1000;

  std::shared_ptr<std::mutex> PathMutex(const std::string& path);
  void                        CleanupExpiredMutexesLocked();

  static std::string Format(uint64_t version) {
    return "v" + std::to_string(version);
  }

  std::mutex                                                 mutex_;
  std::unordered_map<std::string, uint64_t>                  versions_;
  std::unordered_map<std::string, std::weak_ptr<std::mutex>> path_mutexes_;
  std::size_t                                                accesses_ = 0;
};

} // namespace stowage::lock
