#include "internal/sync/header_locks.hpp"

#include <atomic>
#include <cassert>
#include <cstdint>
#include <iostream>
#include <thread>
#include <utility>
#include <vector>

namespace {

using purchase::sync::HeaderLocks;

void TestEntriesAreDroppedAfterRelease() {
  HeaderLocks locks;
  for (std::int64_t id = 1; id <= 1000; ++id) {
    auto lock = locks.Lock(id);
    assert(locks.Size() == 1);
  }
  assert(locks.Size() == 0);
}

void TestMovedLockReleasesOnce() {
  HeaderLocks locks;
  {
    auto first = locks.Lock(7);
    auto moved = std::move(first);
    assert(locks.Size() == 1);
  }
  assert(locks.Size() == 0);

  auto again = locks.Lock(7);
  assert(locks.Size() == 1);
}

void TestSameHeaderIsExclusiveWhileWaiting() {
  HeaderLocks       locks;
  std::atomic<int>  inside{0};
  std::atomic<bool> overlap{false};

  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < 200; ++i) {
        auto lock = locks.Lock(42);
        if (inside.fetch_add(1) != 0) overlap.store(true);
        std::this_thread::yield();
        inside.fetch_sub(1);
      }
    });
  }
  for (auto& t : threads) t.join();

  assert(!overlap.load());
  assert(locks.Size() == 0);
}

void TestDistinctHeadersDoNotBlock() {
  HeaderLocks locks;
  auto        held = locks.Lock(1);

  std::atomic<bool> done{false};
  std::thread       other([&] {
    auto lock = locks.Lock(2);
    done.store(true);
  });
  other.join();

  assert(done.load());
  assert(locks.Size() == 1);
}

} // namespace

int main() {
  TestEntriesAreDroppedAfterRelease();
  TestMovedLockReleasesOnce();
  TestSameHeaderIsExclusiveWhileWaiting();
  TestDistinctHeadersDoNotBlock();

  std::cout << "purchase_sync_unit_header_locks: pass\n";
  return 0;
}
