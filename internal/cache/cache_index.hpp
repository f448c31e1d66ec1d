#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "internal/observability/events.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace stowage::cache {

using CacheValue = std::string; // opaque payload
using TagSet     = std::set<std::string>;
using ComputeFn  = std::function<util::StatusOr<CacheValue>()>;

struct CacheOptions {
  std::chrono::milliseconds default_ttl{60000};
  // Upper bound for callers waiting on another caller's computation.
  std::chrono::milliseconds compute_wait{30000};
};

struct CacheStats {
  uint64_t hits             = 0;
  uint64_t misses           = 0;
  uint64_t computations     = 0;
  uint64_t compute_failures = 0;
  uint64_t invalidations    = 0;
  uint64_t expirations      = 0;
};

/*
  Tag-indexed TTL cache.

  Entries and the tag → keys index live under one lock, so a reader sees
  an entry either with all of its tag memberships or not at all.

  GetOrCompute runs at most one computation per key at a time; concurrent
  callers for that key wait for it and receive the same value or the same
  failure. A computation that overlaps an invalidation of one of its tags,
  or a Put or Erase of its own key, still answers its callers but
  is not cached.
*/
class CacheIndex {
 public:
  explicit CacheIndex(CacheOptions options = {}, observability::EventSinkPtr events = nullptr);

  CacheIndex(const CacheIndex&)            = delete;
  CacheIndex& operator=(const CacheIndex&) = delete;

  // ttl of zero uses the default ttl
  void Put(const std::string& key, CacheValue value, const TagSet& tags, std::chrono::milliseconds ttl = std::chrono::milliseconds::zero());

  std::optional<CacheValue> Get(const std::string& key);

  util::StatusOr<CacheValue> GetOrCompute(const std::string& key, const TagSet& tags, std::chrono::milliseconds ttl, const ComputeFn& compute);

  // Returns the number of keys removed.
  std::size_t InvalidateTag(const std::string& tag);

  bool        Erase(const std::string& key);
  std::size_t PurgeExpired();

  std::size_t              Size() const;
  CacheStats               Stats() const;
  TagSet                   TagsOf(const std::string& key) const;
  std::vector<std::string> KeysForTag(const std::string& tag) const;

 private:
  struct Entry {
    CacheValue      value;
    TagSet          tags;
    util::TimePoint expires_at;
  };

  struct Flight {
    std::mutex                 mutex;
    std::condition_variable    cv;
    bool                       done = false;
    util::StatusOr<CacheValue> result{util::Status::Err(util::ErrorCode::Internal, "computation pending")};
    uint64_t                   started_epoch = 0;
    bool                       overwritten   = false; // guarded by CacheIndex::mutex_
  };

  // caller holds mutex_ exclusively
  void InsertLocked(const std::string& key, CacheValue value, const TagSet& tags, std::chrono::milliseconds ttl);
  void RemoveLocked(const std::string& key);
  void MarkFlightStaleLocked(const std::string& key);
  bool InvalidatedSinceLocked(const TagSet& tags, uint64_t epoch) const;
  void PruneTagInvalidationsLocked();

  // lookup without recording a hit or miss
  std::optional<CacheValue> Find(const std::string& key);

  // publishes a finished computation to the cache and to its waiters
  void Land(const std::string& key, const TagSet& tags, std::chrono::milliseconds ttl, const std::shared_ptr<Flight>& flight,
            const util::StatusOr<CacheValue>& result);

  std::chrono::milliseconds EffectiveTtl(std::chrono::milliseconds ttl) const {
    return ttl.count() > 0 ? ttl : options_.default_ttl;
  }

  util::StatusOr<CacheValue> Await(const std::shared_ptr<Flight>& flight, const std::string& key);

  void RecordLookup(const std::string& key, bool hit);

  CacheOptions                options_;
  observability::EventSinkPtr events_;

  mutable std::shared_mutex                                        mutex_;
  std::unordered_map<std::string, Entry>                           entries_;
  std::unordered_map<std::string, std::unordered_set<std::string>> tag_index_;
  std::unordered_map<std::string, std::shared_ptr<Flight>>         flights_;

  // bumped by every InvalidateTag; per-tag value of the last one, kept only
  // while some live flight started before it
  uint64_t                                  epoch_ = 0;
  std::unordered_map<std::string, uint64_t> tag_invalidated_at_;

  std::atomic<uint64_t> hits_{0};
  std::atomic<uint64_t> misses_{0};
  std::atomic<uint64_t> computations_{0};
  std::atomic<uint64_t> compute_failures_{0};
  std::atomic<uint64_t> invalidations_{0};
  std::atomic<uint64_t> expirations_{0};
};

} // namespace stowage::cache
