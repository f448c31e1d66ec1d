#include "version_table.hpp"

namespace stowage::lock {

using util::ErrorCode;
using util::Status;

VersionStamp VersionTable::Read(const std::string& path) {
  std::lock_guard lock(mutex_);
  auto            it = versions_.find(path);
  return VersionStamp{path, Format(it == versions_.end() ? 0 : it->second)};
}

util::StatusOr<VersionStamp> VersionTable::CompareAndSwap(const std::string& path, const VersionStamp& expected, const MutateFn& mutate) {
  auto guard = LockPath(path);
  return SwapLocked(path, expected, mutate);
}

VersionTable::PathGuard VersionTable::LockPath(const std::string& path) {
  return PathGuard(PathMutex(path));
}

util::StatusOr<VersionStamp> VersionTable::SwapLocked(const std::string& path, const VersionStamp& expected, const MutateFn& mutate) {
  if (!expected.path.empty() && expected.path != path) {
    return Status::Err(ErrorCode::InvalidArgument, "version stamp for " + expected.path + " used on " + path);
  }

  auto current = Read(path);
  if (current.version != expected.version) {
    return Status::Err(ErrorCode::VersionConflict, path + " is at " + current.version + ", expected " + expected.version);
  }

  Status mutated;
  try {
    mutated = mutate ? mutate() : Status::Ok();
  } catch (const std::exception& e) {
    mutated = Status::Err(ErrorCode::Internal, e.what());
  }
  if (!mutated.ok()) return mutated;

  std::lock_guard lock(mutex_);
  auto            next = ++versions_[path];
  return VersionStamp{path, Format(next)};
}

std::shared_ptr<std::mutex> VersionTable::PathMutex(const std::string& path) {
  std::lock_guard lock(mutex_);

  if (++accesses_ % kCleanupInterval == 0) {
    CleanupExpiredMutexesLocked();
  }

  auto it = path_mutexes_.find(path);
  if (it != path_mutexes_.end()) {
    if (auto existing = it->second.lock()) return existing;
  }

  auto created        = std::make_shared<std::mutex>();
  path_mutexes_[path] = created;
  return created;
}

void VersionTable::CleanupExpiredMutexesLocked() {
  for (auto it = path_mutexes_.begin(); it != path_mutexes_.end();) {
    if (it->second.expired()) {
      it = path_mutexes_.erase(it);
    } else {
      ++it;
    }
  }
}

} // namespace stowage::lock
