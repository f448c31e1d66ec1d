#include "internal/cache/cache_index.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

using std::chrono::milliseconds;
using stowage::cache::CacheIndex;
using stowage::cache::CacheOptions;
using stowage::cache::CacheValue;
using stowage::observability::EventKind;
using stowage::observability::RecordingEventSink;
using stowage::util::ErrorCode;
using stowage::util::Status;
using stowage::util::StatusOr;

void TestInvalidateTagLeavesUnrelatedKeys() {
  CacheIndex cache;

  cache.Put("k1", "v1", {"files", "user:42"}, milliseconds(60000));
  cache.Put("k2", "v2", {"files"}, milliseconds(60000));

  assert(cache.InvalidateTag("user:42") == 1);
  assert(!cache.Get("k1").has_value());
  assert(cache.Get("k2").value() == "v2");
}

void TestInvalidationCascadesThroughOtherTags() {
  CacheIndex cache;

  cache.Put("k1", "v1", {"a", "b"}, milliseconds(60000));
  cache.Put("k2", "v2", {"b"}, milliseconds(60000));

  cache.InvalidateTag("a");
  auto b_keys = cache.KeysForTag("b");
  assert(b_keys.size() == 1 && b_keys[0] == "k2");
  assert(cache.KeysForTag("a").empty());
  assert(cache.TagsOf("k1").empty());
}

void TestPutReplacesTagMembership() {
  CacheIndex cache;

  cache.Put("k", "old", {"user:1", "folder:9"}, milliseconds(60000));
  cache.Put("k", "new", {"user:2"}, milliseconds(60000));

  assert(cache.KeysForTag("user:1").empty());
  assert(cache.KeysForTag("folder:9").empty());
  assert(cache.TagsOf("k") == stowage::cache::TagSet{"user:2"});

  // stale tag no longer reaches the entry
  assert(cache.InvalidateTag("user:1") == 0);
  assert(cache.Get("k").value() == "new");
}

void TestExpiredEntriesMissAndArePurged() {
  CacheIndex cache;

  cache.Put("short", "v", {"t"}, milliseconds(5));
  cache.Put("long", "v", {"t"}, milliseconds(60000));
  std::this_thread::sleep_for(milliseconds(20));

  assert(!cache.Get("short").has_value());
  assert(cache.Size() == 1);
  assert(cache.KeysForTag("t").size() == 1);

  cache.Put("short2", "v", {}, milliseconds(5));
  std::this_thread::sleep_for(milliseconds(20));
  assert(cache.PurgeExpired() == 1);
  assert(cache.Stats().expirations == 2);
}

void TestGetOrComputeSingleFlight() {
  CacheIndex       cache;
  std::atomic<int> calls{0};

  constexpr int            kThreads = 16;
  std::vector<std::string> results(kThreads);
  std::vector<std::thread> threads;
  std::atomic<bool>        go{false};

  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&, i] {
      while (!go.load()) std::this_thread::yield();
      auto value = cache.GetOrCompute("hot", {"files"}, milliseconds(60000), [&]() -> StatusOr<CacheValue> {
        ++calls;
        std::this_thread::sleep_for(milliseconds(50));
        return std::string("computed");
      });
      assert(value.ok());
      results[i] = *value;
    });
  }
  go = true;
  for (auto& t : threads) t.join();

  assert(calls.load() == 1);
  for (const auto& r : results) assert(r == "computed");

  // every caller is counted once, whether it computed, waited or found the entry
  auto stats = cache.Stats();
  assert(stats.computations == 1);
  assert(stats.hits + stats.misses == kThreads);
  assert(stats.misses >= 1);
}

void TestDifferentKeysComputeIndependently() {
  CacheIndex       cache;
  std::atomic<int> calls{0};

  std::vector<std::thread> threads;
  for (int i = 0; i < 4; ++i) {
    threads.emplace_back([&, i] {
      auto key   = "key-" + std::to_string(i);
      auto value = cache.GetOrCompute(key, {}, milliseconds(60000), [&]() -> StatusOr<CacheValue> {
        ++calls;
        return key;
      });
      assert(value.ok() && *value == key);
    });
  }
  for (auto& t : threads) t.join();
  assert(calls.load() == 4);
}

void TestComputeFailureSharedAndNotCached() {
  CacheIndex       cache;
  std::atomic<int> calls{0};

  std::vector<std::thread> threads;
  std::atomic<int>         failures{0};
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&] {
      auto value = cache.GetOrCompute("bad", {}, milliseconds(60000), [&]() -> StatusOr<CacheValue> {
        ++calls;
        std::this_thread::sleep_for(milliseconds(30));
        return Status::Err(ErrorCode::Transient, "backend down");
      });
      if (value.code() == ErrorCode::CacheComputeError) ++failures;
    });
  }
  for (auto& t : threads) t.join();

  assert(failures.load() == 8);
  assert(calls.load() >= 1);
  assert(!cache.Get("bad").has_value());

  auto thrown = cache.GetOrCompute("throws", {}, milliseconds(60000), []() -> StatusOr<CacheValue> { throw std::runtime_error("boom"); });
  assert(thrown.code() == ErrorCode::CacheComputeError);
  assert(thrown.status().message.find("boom") != std::string::npos);
}

void TestInvalidationDuringComputeIsNotCached() {
  CacheIndex cache;

  std::atomic<bool> computing{false};
  std::thread       worker([&] {
    auto value = cache.GetOrCompute("k", {"user:7"}, milliseconds(60000), [&]() -> StatusOr<CacheValue> {
      computing = true;
      std::this_thread::sleep_for(milliseconds(50));
      return std::string("stale");
    });
    assert(value.ok() && *value == "stale");
  });

  while (!computing.load()) std::this_thread::yield();
  cache.InvalidateTag("user:7");
  worker.join();

  assert(!cache.Get("k").has_value());
}

void TestPutDuringComputeWins() {
  CacheIndex cache;

  std::atomic<bool> computing{false};
  std::atomic<bool> release{false};
  std::thread       worker([&] {
    auto value = cache.GetOrCompute("file:a", {"file"}, milliseconds(60000), [&]() -> StatusOr<CacheValue> {
      computing = true;
      while (!release.load()) std::this_thread::yield();
      return std::string("stale-v1");
    });
    assert(value.ok() && *value == "stale-v1");
  });

  while (!computing.load()) std::this_thread::yield();
  cache.Put("file:a", "fresh-v2", {"file", "user:42"}, milliseconds(60000));
  release = true;
  worker.join();

  assert(cache.Get("file:a").value() == "fresh-v2");
  assert(cache.TagsOf("file:a").contains("user:42"));
  assert(cache.InvalidateTag("user:42") == 1);
  assert(!cache.Get("file:a").has_value());
}

void TestEraseDuringComputeIsNotCached() {
  CacheIndex cache;

  std::atomic<bool> computing{false};
  std::atomic<bool> release{false};
  std::thread       worker([&] {
    auto value = cache.GetOrCompute("k", {}, milliseconds(60000), [&]() -> StatusOr<CacheValue> {
      computing = true;
      while (!release.load()) std::this_thread::yield();
      return std::string("v");
    });
    assert(value.ok());
  });

  while (!computing.load()) std::this_thread::yield();
  assert(!cache.Erase("k"));
  release = true;
  worker.join();

  assert(!cache.Get("k").has_value());
}

void TestNonStandardThrowLeavesKeyComputable() {
  CacheIndex cache;

  bool rethrown = false;
  try {
    cache.GetOrCompute("k", {}, milliseconds(60000), []() -> StatusOr<CacheValue> { throw 42; });
  } catch (int code) {
    rethrown = code == 42;
  }
  assert(rethrown);
  assert(cache.Stats().compute_failures == 1);

  int  calls = 0;
  auto value = cache.GetOrCompute("k", {}, milliseconds(60000), [&]() -> StatusOr<CacheValue> {
    ++calls;
    return std::string("recovered");
  });
  assert(value.ok() && *value == "recovered");
  assert(calls == 1);
  assert(cache.Get("k").value() == "recovered");
}

void TestInvalidationOutlivesEarlierFlight() {
  CacheIndex cache;

  std::atomic<int>  computing{0};
  std::atomic<bool> release_short{false};
  std::atomic<bool> release_long{false};

  std::thread short_flight([&] {
    auto value = cache.GetOrCompute("short", {"t"}, milliseconds(60000), [&]() -> StatusOr<CacheValue> {
      ++computing;
      while (!release_short.load()) std::this_thread::yield();
      return std::string("s");
    });
    assert(value.ok());
  });
  std::thread long_flight([&] {
    auto value = cache.GetOrCompute("long", {"t"}, milliseconds(60000), [&]() -> StatusOr<CacheValue> {
      ++computing;
      while (!release_long.load()) std::this_thread::yield();
      return std::string("l");
    });
    assert(value.ok());
  });

  while (computing.load() < 2) std::this_thread::yield();
  cache.InvalidateTag("t");

  // the first flight to finish must not discard the invalidation the other still overlaps
  release_short = true;
  short_flight.join();
  release_long = true;
  long_flight.join();

  assert(!cache.Get("short").has_value());
  assert(!cache.Get("long").has_value());

  // with no flights left, later computations cache normally
  auto value = cache.GetOrCompute("after", {"t"}, milliseconds(60000), []() -> StatusOr<CacheValue> { return std::string("a"); });
  assert(value.ok());
  assert(cache.Get("after").value() == "a");
}

void TestHitAndMissEvents() {
  auto       events = std::make_shared<RecordingEventSink>();
  CacheIndex cache(CacheOptions{}, events);

  cache.Get("absent");
  cache.Put("present", "v", {}, milliseconds(0));
  cache.Get("present");

  assert(events->Count(EventKind::kCacheMiss) == 1);
  assert(events->Count(EventKind::kCacheHit) == 1);
  assert(cache.Stats().hits == 1);
  assert(cache.Stats().misses == 1);
}

void TestEraseRemovesTagMembership() {
  CacheIndex cache;
  cache.Put("k", "v", {"a"}, milliseconds(60000));
  assert(cache.Erase("k"));
  assert(!cache.Erase("k"));
  assert(cache.KeysForTag("a").empty());
}

} // namespace

int main() {
  TestInvalidateTagLeavesUnrelatedKeys();
  TestInvalidationCascadesThroughOtherTags();
  TestPutReplacesTagMembership();
  TestExpiredEntriesMissAndArePurged();
  TestGetOrComputeSingleFlight();
  TestDifferentKeysComputeIndependently();
  TestComputeFailureSharedAndNotCached();
  TestInvalidationDuringComputeIsNotCached();
  TestPutDuringComputeWins();
  TestEraseDuringComputeIsNotCached();
  TestNonStandardThrowLeavesKeyComputable();
  TestInvalidationOutlivesEarlierFlight();
  TestHitAndMissEvents();
  TestEraseRemovesTagMembership();

  std::cout << "stowage_unit_cache_index: pass\n";
  return 0;
}
