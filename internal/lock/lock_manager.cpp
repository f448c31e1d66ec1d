#include "lock_manager.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace stowage::lock {

using observability::Event;
using observability::EventKind;
using observability::StringField;
using util::ErrorCode;
using util::Status;

LockManager::LockManager(LockBackendPtr backend, LockOptions options, observability::EventSinkPtr events)
    : backend_(std::move(backend)), options_(options), events_(observability::OrNullSink(std::move(events))) {
  if (!backend_) throw std::invalid_argument("LockManager: lock backend is required");
  if (options_.poll_interval.count() <= 0) options_.poll_interval = std::chrono::milliseconds(1);
}

// ------------------------------------------------------------
// Exclusive locks
// ------------------------------------------------------------

util::StatusOr<LockHandle> LockManager::Acquire(const std::string& path, std::chrono::milliseconds ttl, std::chrono::milliseconds max_wait) {
  if (path.empty()) {
    return Status::Err(ErrorCode::InvalidArgument, "lock path is empty");
  }
  if (ttl.count() <= 0) ttl = options_.default_ttl;
  if (max_wait.count() <= 0) max_wait = options_.default_max_wait;

  const auto deadline = util::DeadlineAfter(max_wait);
  while (true) {
    if (auto handle = backend_->TryAcquire(path, ttl)) {
      return std::move(*handle);
    }

    auto remaining = util::Remaining(deadline);
    if (remaining.count() <= 0) break;
    std::this_thread::sleep_for(std::min(options_.poll_interval, remaining));
  }

  observability::Metrics::Instance().RecordLockTimeout();
  events_->Emit(Event{EventKind::kLockTimeout, path, {{"max_wait_ms", std::to_string(max_wait.count())}}});
  return Status::Err(ErrorCode::LockTimeout, "could not lock " + path + " within " + std::to_string(max_wait.count()) + "ms");
}

void LockManager::Release(const LockHandle& handle) {
  if (!backend_->Release(handle)) {
    STOWAGE_LOG_DEBUG("lock release was a no-op", {StringField("path", handle.path), StringField("token", handle.token)});
  }
}

util::Status LockManager::Extend(const LockHandle& handle, std::chrono::milliseconds ttl) {
  if (ttl.count() <= 0) ttl = options_.default_ttl;
  if (!backend_->Extend(handle, ttl)) {
    return Status::Err(ErrorCode::InvalidState, "lock on " + handle.path + " is no longer held by this handle");
  }
  return Status::Ok();
}

bool LockManager::IsHeld(const std::string& path) {
  return backend_->IsHeld(path);
}

// ------------------------------------------------------------
// Versions
// ------------------------------------------------------------

VersionStamp LockManager::ReadVersion(const std::string& path) {
  return versions_.Read(path);
}

util::StatusOr<VersionStamp> LockManager::CompareAndSwap(const std::string& path, const VersionStamp& expected, const MutateFn& mutate) {
  // versioned writers queue on the path mutex; the exclusive grant then keeps Acquire out until the swap is done
  auto serialized = versions_.LockPath(path);

  auto grant = backend_->TryAcquire(path, options_.default_ttl);
  if (!grant) {
    return Status::Err(ErrorCode::InvalidState, path + " is under exclusive lock; versioned writes are not allowed");
  }
  ScopedLock guard(*this, std::move(*grant));

  auto swapped = versions_.SwapLocked(path, expected, mutate);
  if (swapped.code() == ErrorCode::VersionConflict) {
    events_->Emit(Event{EventKind::kVersionConflict, path, {{"expected", expected.version}}});
    STOWAGE_LOG_DEBUG("version conflict", {StringField("path", path), StringField("expected", expected.version)});
  }
  return swapped;
}

} // namespace stowage::lock
