#include "internal/lock/lock_table.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

namespace {

using std::chrono::milliseconds;
using stowage::lock::LockTable;

void TestSecondAcquireFailsWhileHeld() {
  LockTable table;

  auto first = table.TryAcquire("docs/a", milliseconds(30000));
  assert(first.has_value());
  assert(!table.TryAcquire("docs/a", milliseconds(30000)).has_value());
  assert(table.TryAcquire("docs/b", milliseconds(30000)).has_value());
  assert(table.IsHeld("docs/a"));
}

void TestExpiredGrantCanBeTakenOver() {
  LockTable table;

  auto stale = table.TryAcquire("docs/a", milliseconds(5));
  assert(stale.has_value());
  std::this_thread::sleep_for(milliseconds(20));

  assert(!table.IsHeld("docs/a"));
  auto fresh = table.TryAcquire("docs/a", milliseconds(30000));
  assert(fresh.has_value());
  assert(fresh->token != stale->token);

  // the old holder cannot release or extend the new grant
  assert(!table.Release(*stale));
  assert(!table.Extend(*stale, milliseconds(30000)));
  assert(table.IsHeld("docs/a"));
}

void TestReleaseIsTokenScopedAndIdempotent() {
  LockTable table;

  auto handle = table.TryAcquire("docs/a", milliseconds(30000));
  assert(handle.has_value());
  assert(table.Release(*handle));
  assert(!table.Release(*handle));
  assert(!table.IsHeld("docs/a"));
}

void TestExtendKeepsGrantAlive() {
  LockTable table;

  auto handle = table.TryAcquire("docs/a", milliseconds(30));
  assert(handle.has_value());
  assert(table.Extend(*handle, milliseconds(30000)));
  std::this_thread::sleep_for(milliseconds(50));
  assert(table.IsHeld("docs/a"));
}

void TestPurgeExpired() {
  LockTable table;
  table.TryAcquire("a", milliseconds(5));
  table.TryAcquire("b", milliseconds(5));
  table.TryAcquire("c", milliseconds(30000));
  std::this_thread::sleep_for(milliseconds(20));

  assert(table.PurgeExpired() == 2);
  assert(table.Size() == 1);
}

} // namespace

int main() {
  TestSecondAcquireFailsWhileHeld();
  TestExpiredGrantCanBeTakenOver();
  TestReleaseIsTokenScopedAndIdempotent();
  TestExtendKeepsGrantAlive();
  TestPurgeExpired();

  std::cout << "stowage_unit_lock_table: pass\n";
  return 0;
}
