#include "internal/cache/reference_cache_manager.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "tests/support/fakes.hpp"

namespace {

using namespace purchase;
using cache::RefreshOutcome;
using db::model::ReferenceKind;
using remote::HttpMethod;
using namespace std::chrono_literals;

constexpr const char* kSuppliersBody = R"({"data": [{"id": 1, "name": "Acme"}, {"id": 2, "name": "Bolt Co"}]})";

struct Fixture {
  std::shared_ptr<db::sqlite::SqliteRepository>  repo         = testing::MakeRepository();
  std::shared_ptr<testing::FakeTransport>        transport    = std::make_shared<testing::FakeTransport>();
  std::shared_ptr<testing::FakeAuth>             auth         = std::make_shared<testing::FakeAuth>();
  std::shared_ptr<net::StaticConnectivityProbe>  connectivity = std::make_shared<net::StaticConnectivityProbe>(true);
  std::shared_ptr<cache::LastSyncStore>          last_sync    = std::make_shared<cache::LastSyncStore>(repo);
  std::shared_ptr<cache::ReferenceCacheManager>  manager;

  Fixture() {
    manager = std::make_shared<cache::ReferenceCacheManager>(repo, last_sync, testing::MakeApi(transport, auth), connectivity, auth);
  }

  void SeedSuppliers() {
    transport->Respond(HttpMethod::kGet, "/purchase/suppliers", 200, kSuppliersBody);
    auto r = manager->RefreshIfStale(ReferenceKind::kSuppliers);
    assert(r.outcome == RefreshOutcome::kRefreshed);
  }
};

void TestNeverSyncedIsStaleAndRefreshes() {
  Fixture f;
  assert(f.manager->IsStale(ReferenceKind::kSuppliers, 10min));

  f.transport->Respond(HttpMethod::kGet, "/purchase/suppliers", 200, kSuppliersBody);
  auto r = f.manager->RefreshIfStale(ReferenceKind::kSuppliers, 10min);
  assert(r.outcome == RefreshOutcome::kRefreshed);
  assert(r.rows == 2);
  assert(f.manager->SearchSuppliers("").size() == 2);
  assert(f.last_sync->Get(ReferenceKind::kSuppliers));
  assert(!f.manager->IsStale(ReferenceKind::kSuppliers, 10min));
}

void TestFreshCacheSkipsRemote() {
  Fixture f;
  f.transport->Respond(HttpMethod::kGet, "/purchase/suppliers", 200, kSuppliersBody);
  f.last_sync->Set(ReferenceKind::kSuppliers, util::Now() - 5min);

  auto r = f.manager->RefreshIfStale(ReferenceKind::kSuppliers, 10min);
  assert(r.outcome == RefreshOutcome::kSkippedFresh);
  assert(f.transport->Total() == 0);
}

void TestOldCacheIsRefreshed() {
  Fixture f;
  f.transport->Respond(HttpMethod::kGet, "/purchase/suppliers", 200, kSuppliersBody);
  const auto old = util::Now() - 15min;
  f.last_sync->Set(ReferenceKind::kSuppliers, old);

  auto r = f.manager->RefreshIfStale(ReferenceKind::kSuppliers, 10min);
  assert(r.outcome == RefreshOutcome::kRefreshed);
  assert(f.transport->Count(HttpMethod::kGet, "/purchase/suppliers") == 1);
  assert(*f.last_sync->Get(ReferenceKind::kSuppliers) > old);
}

void TestUnparsableTimestampCountsAsStale() {
  Fixture f;
  {
    auto tx = f.repo->Begin();
    assert(f.repo->PutSystemValue(*tx, cache::LastSyncStore::Key(ReferenceKind::kProducts), "yesterday"));
    tx->Commit();
  }
  assert(f.manager->IsStale(ReferenceKind::kProducts, 24h));
}

void TestOfflineKeepsCache() {
  Fixture f;
  f.SeedSuppliers();
  f.last_sync->Set(ReferenceKind::kSuppliers, util::Now() - 48h);
  f.connectivity->SetOnline(false);
  const auto before = f.transport->Total();

  auto r = f.manager->RefreshIfStale(ReferenceKind::kSuppliers);
  assert(r.outcome == RefreshOutcome::kFailedKeptStale);
  assert(r.detail == "offline");
  assert(f.transport->Total() == before);
  assert(f.manager->SearchSuppliers("acme").size() == 1);
}

void TestUnauthenticatedKeepsCache() {
  Fixture f;
  f.auth->SetAuthenticated(false);

  auto r = f.manager->RefreshIfStale(ReferenceKind::kLocations);
  assert(r.outcome == RefreshOutcome::kFailedKeptStale);
  assert(f.transport->Total() == 0);
}

void TestRemoteFailureKeepsCache() {
  Fixture f;
  f.SeedSuppliers();
  f.last_sync->Set(ReferenceKind::kSuppliers, util::Now() - 48h);
  f.transport->Respond(HttpMethod::kGet, "/purchase/suppliers", 500, R"({"message": "boom"})");

  auto r = f.manager->RefreshIfStale(ReferenceKind::kSuppliers);
  assert(r.outcome == RefreshOutcome::kFailedKeptStale);
  assert(r.detail.find("server") == 0);
  assert(f.manager->SearchSuppliers("").size() == 2);
  assert(f.manager->IsStale(ReferenceKind::kSuppliers, 24h));

  f.transport->Unreachable(HttpMethod::kGet, "/purchase/suppliers");
  assert(f.manager->RefreshIfStale(ReferenceKind::kSuppliers).outcome == RefreshOutcome::kFailedKeptStale);
  assert(f.manager->SearchSuppliers("").size() == 2);
}

void TestEmptyRemoteSetKeepsCache() {
  Fixture f;
  f.SeedSuppliers();
  f.last_sync->Set(ReferenceKind::kSuppliers, util::Now() - 48h);
  f.transport->Respond(HttpMethod::kGet, "/purchase/suppliers", 200, R"({"data": []})");

  auto r = f.manager->RefreshIfStale(ReferenceKind::kSuppliers);
  assert(r.outcome == RefreshOutcome::kFailedKeptStale);
  assert(f.manager->SearchSuppliers("").size() == 2);
}

void TestRefreshAllAndStats() {
  Fixture f;
  f.transport->Respond(HttpMethod::kGet, "/purchase/suppliers", 200, kSuppliersBody);
  f.transport->Respond(HttpMethod::kGet, "/purchase/products", 200,
                       R"([{"product_id": 4, "product_name": "Bolt", "variation_id": 40, "sub_sku": "B-4"}])");
  f.transport->Respond(HttpMethod::kGet, "/business-location", 500, "");

  auto results = f.manager->RefreshAllIfStale();
  assert(results.size() == 3);
  assert(results[0].kind == ReferenceKind::kSuppliers && results[0].outcome == RefreshOutcome::kRefreshed);
  assert(results[1].kind == ReferenceKind::kProducts && results[1].outcome == RefreshOutcome::kRefreshed);
  assert(results[2].kind == ReferenceKind::kLocations && results[2].outcome == RefreshOutcome::kFailedKeptStale);

  auto stats = f.manager->Stats();
  assert(stats.size() == 3);
  assert(stats[0].count == 2 && stats[0].last_sync);
  assert(stats[1].count == 1 && stats[1].last_sync);
  assert(stats[2].count == 0 && !stats[2].last_sync);

  f.manager->Clear();
  for (const auto& s : f.manager->Stats()) {
    assert(s.count == 0);
    assert(!s.last_sync);
  }
}

} // namespace

int main() {
  TestNeverSyncedIsStaleAndRefreshes();
  TestFreshCacheSkipsRemote();
  TestOldCacheIsRefreshed();
  TestUnparsableTimestampCountsAsStale();
  TestOfflineKeepsCache();
  TestUnauthenticatedKeepsCache();
  TestRemoteFailureKeepsCache();
  TestEmptyRemoteSetKeepsCache();
  TestRefreshAllAndStats();

  std::cout << "purchase_sync_unit_reference_cache_manager: pass\n";
  return 0;
}
