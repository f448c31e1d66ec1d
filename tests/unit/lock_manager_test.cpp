#include "internal/lock/lock_manager.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

#include "internal/lock/lock_table.hpp"

namespace {

using std::chrono::milliseconds;
using stowage::lock::LockHandle;
using stowage::lock::LockManager;
using stowage::lock::LockOptions;
using stowage::lock::LockTable;
using stowage::lock::VersionStamp;
using stowage::observability::EventKind;
using stowage::observability::RecordingEventSink;
using stowage::util::ErrorCode;
using stowage::util::Status;
using stowage::util::StatusOr;

LockOptions FastOptions() {
  LockOptions options;
  options.default_ttl      = milliseconds(5000);
  options.default_max_wait = milliseconds(2000);
  options.poll_interval    = milliseconds(1);
  return options;
}

void TestContendedAcquireIsExclusive() {
  LockManager manager(std::make_shared<LockTable>(), FastOptions());

  constexpr int kThreads    = 8;
  constexpr int kIterations = 100;

  std::atomic<int>         inside{0};
  std::atomic<bool>        overlap{false};
  int                      counter = 0;
  std::vector<std::thread> threads;

  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < kIterations; ++i) {
        auto handle = manager.Acquire("hot/path", milliseconds(5000), milliseconds(10000));
        assert(handle.ok());
        if (inside.fetch_add(1) != 0) overlap = true;
        ++counter;
        inside.fetch_sub(1);
        manager.Release(*handle);
      }
    });
  }
  for (auto& t : threads) t.join();

  assert(!overlap.load());
  assert(counter == kThreads * kIterations);
}

void TestTwoConcurrentAcquirersOneWins() {
  LockManager manager(std::make_shared<LockTable>(), FastOptions());

  std::atomic<int>         wins{0};
  std::atomic<int>         timeouts{0};
  std::atomic<bool>        go{false};
  std::vector<std::thread> threads;
  for (int t = 0; t < 2; ++t) {
    threads.emplace_back([&] {
      while (!go.load()) std::this_thread::yield();
      auto handle = manager.Acquire("contended", milliseconds(5000), milliseconds(30));
      if (handle.ok()) {
        ++wins;
      } else if (handle.code() == ErrorCode::LockTimeout) {
        ++timeouts;
      }
    });
  }
  go = true;
  for (auto& t : threads) t.join();

  // neither releases, so exactly one holds the path
  assert(wins.load() == 1);
  assert(timeouts.load() == 1);
}

void TestTimeoutEmitsEvent() {
  auto        events = std::make_shared<RecordingEventSink>();
  LockManager manager(std::make_shared<LockTable>(), FastOptions(), events);

  auto held = manager.Acquire("busy", milliseconds(5000), milliseconds(10));
  assert(held.ok());

  auto start   = std::chrono::steady_clock::now();
  auto blocked = manager.Acquire("busy", milliseconds(5000), milliseconds(40));
  auto waited  = std::chrono::steady_clock::now() - start;

  assert(blocked.code() == ErrorCode::LockTimeout);
  assert(waited >= milliseconds(40));
  assert(events->Count(EventKind::kLockTimeout) == 1);
}

void TestWaiterSucceedsAfterRelease() {
  LockManager manager(std::make_shared<LockTable>(), FastOptions());

  auto held = manager.Acquire("handoff");
  assert(held.ok());

  std::thread releaser([&] {
    std::this_thread::sleep_for(milliseconds(20));
    manager.Release(*held);
  });
  auto next = manager.Acquire("handoff", milliseconds(5000), milliseconds(2000));
  releaser.join();
  assert(next.ok());
}

void TestExpiredLockIsReclaimedAndReleaseIsSafe() {
  LockManager manager(std::make_shared<LockTable>(), FastOptions());

  auto crashed = manager.Acquire("orphan", milliseconds(10), milliseconds(10));
  assert(crashed.ok());

  auto next = manager.Acquire("orphan", milliseconds(5000), milliseconds(500));
  assert(next.ok());

  // late release from the expired holder is a no-op
  manager.Release(*crashed);
  assert(manager.IsHeld("orphan"));
  assert(manager.Extend(*crashed, milliseconds(1000)).code == ErrorCode::InvalidState);
  assert(manager.Extend(*next, milliseconds(1000)).ok());
}

void TestWithExclusiveAccessReleasesOnEveryExit() {
  LockManager manager(std::make_shared<LockTable>(), FastOptions());

  auto result = manager.WithExclusiveAccess("scoped", milliseconds(5000), milliseconds(100), [&](const LockHandle& handle) -> StatusOr<int> {
    assert(handle.path == "scoped");
    assert(manager.IsHeld("scoped"));
    return 42;
  });
  assert(result.ok() && *result == 42);
  assert(!manager.IsHeld("scoped"));

  auto early = manager.WithExclusiveAccess("scoped", milliseconds(5000), milliseconds(100),
                                           [](const LockHandle&) { return Status::Err(ErrorCode::Internal, "early"); });
  assert(early.code == ErrorCode::Internal);
  assert(!manager.IsHeld("scoped"));

  bool caught = false;
  try {
    manager.WithExclusiveAccess("scoped", milliseconds(5000), milliseconds(100), [](const LockHandle&) -> Status { throw std::runtime_error("boom"); });
  } catch (const std::runtime_error&) {
    caught = true;
  }
  assert(caught);
  assert(!manager.IsHeld("scoped"));
}

void TestWithExclusiveAccessTimesOutWithoutCalling() {
  LockManager manager(std::make_shared<LockTable>(), FastOptions());
  auto        held = manager.Acquire("taken");
  assert(held.ok());

  bool called = false;
  auto status = manager.WithExclusiveAccess("taken", milliseconds(5000), milliseconds(20), [&](const LockHandle&) {
    called = true;
    return Status::Ok();
  });
  assert(status.code == ErrorCode::LockTimeout);
  assert(!called);
}

void TestCompareAndSwap() {
  auto        events = std::make_shared<RecordingEventSink>();
  LockManager manager(std::make_shared<LockTable>(), FastOptions(), events);

  auto v0 = manager.ReadVersion("quota:1");
  assert(v0.version == "v0");

  int  value = 0;
  auto v1    = manager.CompareAndSwap("quota:1", v0, [&] {
    value = 10;
    return Status::Ok();
  });
  assert(v1.ok() && v1->version == "v1");
  assert(manager.ReadVersion("quota:1") == *v1);

  // stale stamp conflicts regardless of what the mutation would do
  bool ran      = false;
  auto conflict = manager.CompareAndSwap("quota:1", v0, [&] {
    ran = true;
    return Status::Ok();
  });
  assert(conflict.code() == ErrorCode::VersionConflict);
  assert(!ran);
  assert(value == 10);
  assert(events->Count(EventKind::kVersionConflict) == 1);

  // failed mutation does not bump the version
  auto failed = manager.CompareAndSwap("quota:1", *v1, [] { return Status::Err(ErrorCode::InvalidArgument, "no"); });
  assert(failed.code() == ErrorCode::InvalidArgument);
  assert(manager.ReadVersion("quota:1").version == "v1");
}

void TestConcurrentCompareAndSwapSingleWinner() {
  LockManager manager(std::make_shared<LockTable>(), FastOptions());
  const auto  expected = manager.ReadVersion("counter");

  std::atomic<int>         wins{0};
  std::atomic<int>         conflicts{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&] {
      auto result = manager.CompareAndSwap("counter", expected, [] { return Status::Ok(); });
      if (result.ok()) {
        ++wins;
      } else if (result.code() == ErrorCode::VersionConflict) {
        ++conflicts;
      }
    });
  }
  for (auto& t : threads) t.join();

  assert(wins.load() == 1);
  assert(conflicts.load() == 7);
}

void TestVersionedWriteRejectedUnderExclusiveLock() {
  LockManager manager(std::make_shared<LockTable>(), FastOptions());

  auto held = manager.Acquire("docs/report.pdf");
  assert(held.ok());

  auto stamp  = manager.ReadVersion("docs/report.pdf");
  auto result = manager.CompareAndSwap("docs/report.pdf", stamp, [] { return Status::Ok(); });
  assert(result.code() == ErrorCode::InvalidState);

  manager.Release(*held);
  assert(manager.CompareAndSwap("docs/report.pdf", stamp, [] { return Status::Ok(); }).ok());
}

void TestAcquireWaitsForInFlightVersionedWrite() {
  LockManager manager(std::make_shared<LockTable>(), FastOptions());
  const auto  stamp = manager.ReadVersion("docs/report.pdf");

  std::atomic<bool>      writing{false};
  std::atomic<bool>      finish{false};
  StatusOr<VersionStamp> written{Status::Err(ErrorCode::Internal, "not run")};
  std::thread            writer([&] {
    written = manager.CompareAndSwap("docs/report.pdf", stamp, [&] {
      writing = true;
      while (!finish.load()) std::this_thread::yield();
      return Status::Ok();
    });
  });

  while (!writing.load()) std::this_thread::yield();
  assert(manager.IsHeld("docs/report.pdf"));
  assert(manager.Acquire("docs/report.pdf", milliseconds(1000), milliseconds(20)).code() == ErrorCode::LockTimeout);

  finish = true;
  writer.join();
  assert(written.ok() && written->version == "v1");
  assert(!manager.IsHeld("docs/report.pdf"));

  auto held = manager.Acquire("docs/report.pdf", milliseconds(1000), milliseconds(200));
  assert(held.ok());
  manager.Release(*held);
}

void TestAcquireDuringVersionedWriteStartsAfterIt() {
  LockManager manager(std::make_shared<LockTable>(), FastOptions());
  const auto  stamp = manager.ReadVersion("docs/report.pdf");

  std::atomic<bool> writing{false};
  std::atomic<bool> mutating{false};
  std::atomic<bool> overlapped{false};

  std::thread writer([&] {
    auto result = manager.CompareAndSwap("docs/report.pdf", stamp, [&] {
      mutating = true;
      writing  = true;
      std::this_thread::sleep_for(milliseconds(50));
      mutating = false;
      return Status::Ok();
    });
    assert(result.ok());
  });

  while (!writing.load()) std::this_thread::yield();
  auto held = manager.Acquire("docs/report.pdf", milliseconds(1000), milliseconds(2000));
  assert(held.ok());
  if (mutating.load()) overlapped = true;
  manager.Release(*held);
  writer.join();

  assert(!overlapped.load());
  assert(manager.ReadVersion("docs/report.pdf").version == "v1");
}

} // namespace

int main() {
  TestContendedAcquireIsExclusive();
  TestTwoConcurrentAcquirersOneWins();
  TestTimeoutEmitsEvent();
  TestWaiterSucceedsAfterRelease();
  TestExpiredLockIsReclaimedAndReleaseIsSafe();
  TestWithExclusiveAccessReleasesOnEveryExit();
  TestWithExclusiveAccessTimesOutWithoutCalling();
  TestCompareAndSwap();
  TestConcurrentCompareAndSwapSingleWinner();
  TestVersionedWriteRejectedUnderExclusiveLock();
  TestAcquireWaitsForInFlightVersionedWrite();
  TestAcquireDuringVersionedWriteStartsAfterIt();

  std::cout << "stowage_unit_lock_manager: pass\n";
  return 0;
}
