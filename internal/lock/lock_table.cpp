#include "lock_table.hpp"

#include "internal/util/uuid.hpp"

namespace stowage::lock {

std::optional<LockHandle> LockTable::TryAcquire(const std::string& path, std::chrono::milliseconds ttl) {
  std::lock_guard lock(mutex_);

  const auto now = util::Now();
  if (auto existing = grants_.find(path); existing != grants_.end() && !IsExpired(existing->second, now)) {
    return std::nullopt;
  }

  Grant grant;
  grant.token       = util::NewToken();
  grant.acquired_at = now;
  grant.expires_at  = now + ttl;
  grants_[path]     = grant;

  return LockHandle{path, grant.token, grant.acquired_at, ttl};
}

bool LockTable::Release(const LockHandle& handle) {
  std::lock_guard lock(mutex_);

  auto it = grants_.find(handle.path);
  if (it == grants_.end() || it->second.token != handle.token) return false;

  const bool live = !IsExpired(it->second, util::Now());
  grants_.erase(it);
  return live;
}

bool LockTable::Extend(const LockHandle& handle, std::chrono::milliseconds ttl) {
  std::lock_guard lock(mutex_);

  const auto now = util::Now();
  auto       it  = grants_.find(handle.path);
  if (it == grants_.end() || it->second.token != handle.token || IsExpired(it->second, now)) return false;

  it->second.expires_at = now + ttl;
  return true;
}

bool LockTable::IsHeld(const std::string& path) {
  std::lock_guard lock(mutex_);

  auto it = grants_.find(path);
  if (it == grants_.end()) return false;
  if (IsExpired(it->second, util::Now())) {
    grants_.erase(it);
    return false;
  }
  return true;
}

std::size_t LockTable::PurgeExpired() {
  std::lock_guard lock(mutex_);

  const auto  now     = util::Now();
  std::size_t dropped = 0;
  for (auto it = grants_.begin(); it != grants_.end();) {
    if (IsExpired(it->second, now)) {
      it = grants_.erase(it);
      ++dropped;
      continue;
    }
    ++it;
  }
  return dropped;
}

std::size_t LockTable::Size() {
  std::lock_guard lock(mutex_);
  return grants_.size();
}

} // namespace stowage::lock
