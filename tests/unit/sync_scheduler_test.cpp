#include "internal/sync/sync_scheduler.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

#include "internal/sync/sync_worker.hpp"
#include "tests/support/fakes.hpp"

namespace {

using namespace purchase;
using purchase::sync::SyncScheduler;
using purchase::sync::SyncTask;

SyncTask Push() {
  return SyncTask{SyncTask::Kind::kPushPurchases, false};
}

SyncTask Refresh(bool force) {
  return SyncTask{SyncTask::Kind::kRefreshReferenceData, force};
}

void TestFifoAndCoalescing() {
  SyncScheduler scheduler;
  assert(scheduler.Enqueue(Refresh(false)));
  assert(scheduler.Enqueue(Push()));
  assert(!scheduler.Enqueue(Push()));
  assert(scheduler.Enqueue(Refresh(true)));
  assert(scheduler.Pending() == 3);

  assert(scheduler.Dequeue()->kind == SyncTask::Kind::kRefreshReferenceData);
  assert(scheduler.Dequeue()->kind == SyncTask::Kind::kPushPurchases);
  assert(scheduler.Dequeue()->force);

  // no longer pending, so accepted again
  assert(scheduler.Enqueue(Push()));
}

void TestShutdownWakesWaiterAndRejectsWork() {
  SyncScheduler scheduler;
  bool          got_task = true;

  std::thread waiter([&] { got_task = scheduler.Dequeue().has_value(); });
  scheduler.Shutdown();
  waiter.join();

  assert(!got_task);
  assert(!scheduler.Enqueue(Push()));
}

void TestWorkerDrainsQueuedPush() {
  auto repo         = testing::MakeRepository();
  auto transport    = std::make_shared<testing::FakeTransport>();
  auto auth         = std::make_shared<testing::FakeAuth>();
  auto connectivity = std::make_shared<net::StaticConnectivityProbe>(true);
  auto engine = std::make_shared<sync::SyncEngine>(repo, testing::MakeApi(transport, auth), connectivity, auth,
                                                   std::make_shared<sync::HeaderLocks>());
  {
    auto header = testing::MakeHeader(7, "PO-W");
    auto line   = testing::MakeLine(1, 1, 100);
    auto tx     = repo->Begin();
    assert(repo->InsertHeader(*tx, header));
    line.purchase_id = header.local_id;
    assert(repo->InsertLine(*tx, line));
    tx->Commit();
  }
  transport->Respond(remote::HttpMethod::kPost, "/purchase", 200, R"({"id": 42})");

  auto scheduler = std::make_shared<SyncScheduler>();
  sync::SyncWorker worker(scheduler, engine, nullptr);
  worker.Start();

  // no cache manager wired: refresh tasks are ignored
  assert(scheduler->Enqueue(Refresh(true)));
  assert(scheduler->Enqueue(Push()));

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (!worker.LastReport() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  worker.Stop();

  auto report = worker.LastReport();
  assert(report);
  assert(report->synced == 1);
  assert(engine->PendingCount() == 0);
}

} // namespace

int main() {
  TestFifoAndCoalescing();
  TestShutdownWakesWaiterAndRejectsWork();
  TestWorkerDrainsQueuedPush();

  std::cout << "purchase_sync_unit_sync_scheduler: pass\n";
  return 0;
}
