#include "cache_index.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace stowage::cache {

using observability::Event;
using observability::EventKind;
using observability::StringField;
using util::ErrorCode;
using util::Status;

CacheIndex::CacheIndex(CacheOptions options, observability::EventSinkPtr events)
    : options_(options), events_(observability::OrNullSink(std::move(events))) {
}

// ------------------------------------------------------------
// Put
// ------------------------------------------------------------

void CacheIndex::Put(const std::string& key, CacheValue value, const TagSet& tags, std::chrono::milliseconds ttl) {
  std::unique_lock lock(mutex_);
  InsertLocked(key, std::move(value), tags, EffectiveTtl(ttl));
}

void CacheIndex::InsertLocked(const std::string& key, CacheValue value, const TagSet& tags, std::chrono::milliseconds ttl) {
  RemoveLocked(key);
  MarkFlightStaleLocked(key);

  Entry entry;
  entry.value      = std::move(value);
  entry.tags       = tags;
  entry.expires_at = util::DeadlineAfter(ttl);

  for (const auto& tag : tags) {
    tag_index_[tag].insert(key);
  }
  entries_.emplace(key, std::move(entry));
}

void CacheIndex::RemoveLocked(const std::string& key) {
  auto it = entries_.find(key);
  if (it == entries_.end()) return;

  for (const auto& tag : it->second.tags) {
    auto members = tag_index_.find(tag);
    if (members == tag_index_.end()) continue;
    members->second.erase(key);
    if (members->second.empty()) tag_index_.erase(members);
  }
  entries_.erase(it);
}

// A computation for `key` must not publish once the key was written or erased under it.
void CacheIndex::MarkFlightStaleLocked(const std::string& key) {
  auto it = flights_.find(key);
  if (it != flights_.end()) it->second->overwritten = true;
}

// ------------------------------------------------------------
// Get
// ------------------------------------------------------------

std::optional<CacheValue> CacheIndex::Get(const std::string& key) {
  auto value = Find(key);
  RecordLookup(key, value.has_value());
  return value;
}

std::optional<CacheValue> CacheIndex::Find(const std::string& key) {
  {
    std::shared_lock lock(mutex_);
    auto             it = entries_.find(key);
    if (it == entries_.end()) return std::nullopt;
    if (util::Now() < it->second.expires_at) return it->second.value;
  }

  // expired: purge lazily, re-checking since the entry may have been refreshed meanwhile
  std::unique_lock lock(mutex_);
  auto             it = entries_.find(key);
  if (it == entries_.end()) return std::nullopt;
  if (util::Now() < it->second.expires_at) return it->second.value;

  RemoveLocked(key);
  ++expirations_;
  return std::nullopt;
}

void CacheIndex::RecordLookup(const std::string& key, bool hit) {
  if (hit) {
    ++hits_;
  } else {
    ++misses_;
  }
  observability::Metrics::Instance().RecordCacheLookup(hit);
  events_->Emit(Event{hit ? EventKind::kCacheHit : EventKind::kCacheMiss, key, {}});
}

// ------------------------------------------------------------
// GetOrCompute
// ------------------------------------------------------------

util::StatusOr<CacheValue> CacheIndex::GetOrCompute(const std::string& key, const TagSet& tags, std::chrono::milliseconds ttl, const ComputeFn& compute) {
  if (auto cached = Find(key)) {
    RecordLookup(key, true);
    return std::move(*cached);
  }

  std::shared_ptr<Flight> flight;
  {
    std::unique_lock lock(mutex_);

    // populated between the miss above and taking the lock
    auto entry = entries_.find(key);
    if (entry != entries_.end() && util::Now() < entry->second.expires_at) {
      CacheValue value = entry->second.value;
      lock.unlock();
      RecordLookup(key, true);
      return value;
    }

    auto existing = flights_.find(key);
    if (existing != flights_.end()) {
      flight = existing->second;
      lock.unlock();
      RecordLookup(key, false);
      return Await(flight, key);
    }

    flight                = std::make_shared<Flight>();
    flight->started_epoch = epoch_;
    flights_.emplace(key, flight);
  }
  RecordLookup(key, false);

  observability::SpanScope span("stowage.cache.compute");
  span.SetAttribute("key", key);
  ++computations_;

  util::StatusOr<CacheValue> result{Status::Err(ErrorCode::Internal, "computation produced no result")};
  if (!compute) {
    result = Status::Err(ErrorCode::CacheComputeError, "no compute function for " + key);
  } else {
    try {
      result = compute();
    } catch (const std::exception& e) {
      result = Status::Err(ErrorCode::CacheComputeError, e.what());
    } catch (...) {
      // release the flight and its waiters before propagating
      Land(key, tags, ttl, flight, Status::Err(ErrorCode::CacheComputeError, "computation of " + key + " threw a non-standard exception"));
      throw;
    }
  }

  if (!result.ok()) {
    span.RecordError(result.status().message);
    if (result.code() != ErrorCode::CacheComputeError) {
      result = Status::Err(ErrorCode::CacheComputeError, result.status().ToString());
    }
  }

  Land(key, tags, ttl, flight, result);
  return result;
}

void CacheIndex::Land(const std::string& key, const TagSet& tags, std::chrono::milliseconds ttl, const std::shared_ptr<Flight>& flight,
                      const util::StatusOr<CacheValue>& result) {
  if (!result.ok()) {
    ++compute_failures_;
    STOWAGE_LOG_WARN("cache computation failed", {StringField("key", key), StringField("error", result.status().ToString())});
  }

  {
    std::unique_lock lock(mutex_);
    const bool       stale = flight->overwritten || InvalidatedSinceLocked(tags, flight->started_epoch);
    flights_.erase(key);
    if (result.ok() && !stale) {
      InsertLocked(key, *result, tags, EffectiveTtl(ttl));
    }
    PruneTagInvalidationsLocked();
  }

  {
    std::lock_guard flight_lock(flight->mutex);
    flight->result = result;
    flight->done   = true;
  }
  flight->cv.notify_all();
}

util::StatusOr<CacheValue> CacheIndex::Await(const std::shared_ptr<Flight>& flight, const std::string& key) {
  std::unique_lock lock(flight->mutex);
  if (!flight->cv.wait_for(lock, options_.compute_wait, [&] { return flight->done; })) {
    return Status::Err(ErrorCode::CacheComputeError, "timed out waiting for computation of " + key);
  }
  return flight->result;
}

// Invalidations at or before the oldest live flight's start can no longer affect any flight.
void CacheIndex::PruneTagInvalidationsLocked() {
  if (flights_.empty()) {
    tag_invalidated_at_.clear();
    return;
  }

  uint64_t oldest = epoch_;
  for (const auto& [key, flight] : flights_) {
    oldest = std::min(oldest, flight->started_epoch);
  }
  std::erase_if(tag_invalidated_at_, [oldest](const auto& invalidated) { return invalidated.second <= oldest; });
}

bool CacheIndex::InvalidatedSinceLocked(const TagSet& tags, uint64_t epoch) const {
  for (const auto& tag : tags) {
    auto it = tag_invalidated_at_.find(tag);
    if (it != tag_invalidated_at_.end() && it->second > epoch) return true;
  }
  return false;
}

// ------------------------------------------------------------
// Invalidation
// ------------------------------------------------------------

std::size_t CacheIndex::InvalidateTag(const std::string& tag) {
  std::unique_lock lock(mutex_);

  ++epoch_;
  if (!flights_.empty()) tag_invalidated_at_[tag] = epoch_;

  auto members = tag_index_.find(tag);
  if (members == tag_index_.end()) return 0;

  // RemoveLocked edits the set being walked
  std::vector<std::string> keys(members->second.begin(), members->second.end());
  for (const auto& key : keys) {
    RemoveLocked(key);
  }

  invalidations_ += keys.size();
  return keys.size();
}

bool CacheIndex::Erase(const std::string& key) {
  std::unique_lock lock(mutex_);
  MarkFlightStaleLocked(key);
  if (!entries_.contains(key)) return false;
  RemoveLocked(key);
  return true;
}

std::size_t CacheIndex::PurgeExpired() {
  std::unique_lock lock(mutex_);

  const auto               now = util::Now();
  std::vector<std::string> expired;
  for (const auto& [key, entry] : entries_) {
    if (entry.expires_at <= now) expired.push_back(key);
  }
  for (const auto& key : expired) {
    RemoveLocked(key);
  }

  expirations_ += expired.size();
  return expired.size();
}

// ------------------------------------------------------------
// Introspection
// ------------------------------------------------------------

std::size_t CacheIndex::Size() const {
  std::shared_lock lock(mutex_);
  return entries_.size();
}

CacheStats CacheIndex::Stats() const {
  CacheStats stats;
  stats.hits             = hits_.load();
  stats.misses           = misses_.load();
  stats.computations     = computations_.load();
  stats.compute_failures = compute_failures_.load();
  stats.invalidations    = invalidations_.load();
  stats.expirations      = expirations_.load();
  return stats;
}

TagSet CacheIndex::TagsOf(const std::string& key) const {
  std::shared_lock lock(mutex_);
  auto             it = entries_.find(key);
  return it == entries_.end() ? TagSet{} : it->second.tags;
}

std::vector<std::string> CacheIndex::KeysForTag(const std::string& tag) const {
  std::shared_lock lock(mutex_);
  auto             it = tag_index_.find(tag);
  if (it == tag_index_.end()) return {};
  return std::vector<std::string>(it->second.begin(), it->second.end());
}

} // namespace stowage::cache
