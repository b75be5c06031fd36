#include "internal/view/purchase_view_builder.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/remote/remote_error.hpp"
#include "tests/support/fakes.hpp"

namespace {

using namespace purchase;
using db::model::SyncState;
using remote::HttpMethod;
using view::Origin;

struct Fixture {
  std::shared_ptr<db::sqlite::SqliteRepository> repo         = testing::MakeRepository();
  std::shared_ptr<testing::FakeTransport>       transport    = std::make_shared<testing::FakeTransport>();
  std::shared_ptr<testing::FakeAuth>            auth         = std::make_shared<testing::FakeAuth>();
  std::shared_ptr<net::StaticConnectivityProbe> connectivity = std::make_shared<net::StaticConnectivityProbe>(true);
  std::shared_ptr<sync::HeaderLocks>            locks        = std::make_shared<sync::HeaderLocks>();

  view::PurchaseViewBuilder builder{repo, testing::MakeApi(transport, auth), nullptr, connectivity, auth, locks};

  std::int64_t Insert(std::int64_t supplier_id, const std::string& ref_no, std::optional<std::int64_t> remote_id = std::nullopt,
                      db::model::PurchaseStatus status = db::model::PurchaseStatus::kOrdered) {
    auto h   = testing::MakeHeader(supplier_id, ref_no);
    h.status = status;
    if (remote_id) {
      h.remote_id  = remote_id;
      h.sync_state = SyncState::kSynced;
    }
    auto tx = repo->Begin();
    assert(repo->InsertHeader(*tx, h));
    tx->Commit();
    return h.local_id;
  }

  bool Exists(std::int64_t local_id) {
    auto tx = repo->Begin();
    auto h  = repo->GetHeader(*tx, local_id);
    tx->Commit();
    return h.has_value();
  }
};

std::size_t CountRemoteId(const view::PurchaseListing& listing, std::int64_t remote_id) {
  return static_cast<std::size_t>(std::count_if(listing.entries.begin(), listing.entries.end(),
                                                [remote_id](const view::PurchaseSummary& s) { return s.remote_id == remote_id; }));
}

void TestRemotePageFirstThenUnrepresentedLocals() {
  Fixture f;
  // B synced locally, C matched by supplier + reference, D local only
  const auto b = f.Insert(1, "PO-B", 2);
  f.Insert(1, "PO-C");
  const auto d = f.Insert(1, "PO-D");

  f.transport->Respond(HttpMethod::kGet, "/purchase", 200,
                       R"({"data": [{"id": 1, "contact_id": 1, "ref_no": "PO-A"},
                                    {"id": 2, "contact_id": 1, "ref_no": "PO-B"},
                                    {"id": 3, "contact_id": 1, "ref_no": "PO-C"},
                                    {"id": 2, "contact_id": 1, "ref_no": "PO-B", "status": "received"}],
                           "current_page": 1, "last_page": 1, "total": 3})");

  auto listing = f.builder.List({});
  assert(listing.from_remote);
  assert(listing.entries.size() == 4);

  assert(listing.entries[0].remote_id == 1);
  assert(listing.entries[1].remote_id == 2);
  assert(listing.entries[1].status == "received");
  assert(listing.entries[1].local_id == b);
  assert(listing.entries[2].remote_id == 3);
  assert(listing.entries[3].origin == Origin::kLocal);
  assert(listing.entries[3].local_id == d);
  assert(!listing.entries[3].synced);

  for (std::int64_t id : {1, 2, 3}) assert(CountRemoteId(listing, id) == 1);
}

void TestOfflineListingIsLocalAndFiltered() {
  Fixture f;
  {
    std::vector<db::model::SupplierRecord> suppliers(1);
    suppliers[0].id   = 1;
    suppliers[0].name = "Acme";
    auto tx = f.repo->Begin();
    assert(f.repo->ReplaceSuppliers(*tx, suppliers));
    tx->Commit();
  }
  f.Insert(1, "PO-1");
  f.Insert(1, "PO-2", std::nullopt, db::model::PurchaseStatus::kReceived);
  f.Insert(2, "PO-3");
  f.connectivity->SetOnline(false);

  remote::PurchaseListFilter filter;
  filter.supplier_id = 1;
  filter.status      = "ordered";
  auto listing = f.builder.List(filter);

  assert(!listing.from_remote);
  assert(listing.entries.size() == 1);
  assert(listing.entries[0].ref_no == "PO-1");
  assert(listing.entries[0].supplier_name == "Acme");
  assert(f.transport->Total() == 0);

  assert(f.builder.List({}).entries.size() == 3);
}

void TestRemoteFailureFallsBackToLocal() {
  Fixture f;
  f.Insert(1, "PO-1");
  f.Insert(1, "PO-2", 20);
  f.transport->Respond(HttpMethod::kGet, "/purchase", 503, "");

  auto listing = f.builder.List({});
  assert(!listing.from_remote);
  assert(listing.entries.size() == 2);
}

void TestReconcilePrunesOnlySyncedMissingRows() {
  Fixture f;
  const auto kept      = f.Insert(1, "PO-1", 101);
  const auto gone      = f.Insert(1, "PO-2", 102);
  const auto not_asked = f.Insert(1, "PO-3", 103);
  const auto pending   = f.Insert(1, "PO-4");
  f.transport->Respond(HttpMethod::kGet, "/purchase/101,102", 200, R"({"data": [{"id": 101}]})");

  auto result = f.builder.ReconcileSpecified({101, 102});
  assert(result.online);
  assert(result.found.size() == 1);
  assert(result.pruned_local_ids == std::vector<std::int64_t>{gone});

  assert(f.Exists(kept));
  assert(!f.Exists(gone));
  assert(f.Exists(not_asked));
  assert(f.Exists(pending));
}

void TestReconcileTreatsNotFoundAsNoneExist() {
  Fixture f;
  const auto a = f.Insert(1, "PO-1", 201);
  f.transport->Respond(HttpMethod::kGet, "/purchase/201", 404, R"({"message": "not found"})");

  auto result = f.builder.ReconcileSpecified({201});
  assert(result.online && result.found.empty());
  assert(!f.Exists(a));
}

void TestReconcileOfflineDoesNothing() {
  Fixture f;
  const auto a = f.Insert(1, "PO-1", 301);
  f.connectivity->SetOnline(false);

  auto result = f.builder.ReconcileSpecified({301});
  assert(!result.online);
  assert(f.Exists(a));
  assert(f.transport->Total() == 0);
}

void TestReconcileServerErrorPropagates() {
  Fixture f;
  const auto a = f.Insert(1, "PO-1", 401);
  f.transport->Respond(HttpMethod::kGet, "/purchase/401", 500, "");

  bool threw = false;
  try {
    f.builder.ReconcileSpecified({401});
  } catch (const remote::RemoteError& e) {
    threw = e.Kind() == remote::FailureKind::kServer;
  }
  assert(threw);
  assert(f.Exists(a));
}

} // namespace

int main() {
  TestRemotePageFirstThenUnrepresentedLocals();
  TestOfflineListingIsLocalAndFiltered();
  TestRemoteFailureFallsBackToLocal();
  TestReconcilePrunesOnlySyncedMissingRows();
  TestReconcileTreatsNotFoundAsNoneExist();
  TestReconcileOfflineDoesNothing();
  TestReconcileServerErrorPropagates();

  std::cout << "purchase_sync_unit_purchase_view_builder: pass\n";
  return 0;
}
