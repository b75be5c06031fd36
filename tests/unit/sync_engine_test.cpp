#include "internal/sync/sync_engine.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/core/purchase_service.hpp"
#include "internal/remote/json.hpp"
#include "tests/support/fakes.hpp"

namespace {

using namespace purchase;
using db::model::SyncState;
using remote::FailureKind;
using remote::HttpMethod;

struct Fixture {
  std::shared_ptr<db::sqlite::SqliteRepository> repo         = testing::MakeRepository();
  std::shared_ptr<testing::FakeTransport>       transport    = std::make_shared<testing::FakeTransport>();
  std::shared_ptr<testing::FakeAuth>            auth         = std::make_shared<testing::FakeAuth>();
  std::shared_ptr<net::StaticConnectivityProbe> connectivity = std::make_shared<net::StaticConnectivityProbe>(true);
  std::shared_ptr<sync::HeaderLocks>            locks        = std::make_shared<sync::HeaderLocks>();
  std::shared_ptr<remote::PurchaseApi>          api          = testing::MakeApi(transport, auth);

  sync::SyncEngine      engine{repo, api, connectivity, auth, locks};
  core::PurchaseService service{repo, api, connectivity, auth, locks};

  std::int64_t Create(std::int64_t supplier_id, const std::string& ref_no, int lines = 1) {
    core::PurchaseDraft draft;
    draft.header = testing::MakeHeader(supplier_id, ref_no);
    for (int i = 0; i < lines; ++i) draft.lines.push_back(testing::MakeLine(100 + i, 2, 50));
    return service.CreatePurchase(std::move(draft));
  }

  db::model::PurchaseHeaderRecord Header(std::int64_t local_id) {
    auto tx = repo->Begin();
    auto h  = repo->GetHeader(*tx, local_id);
    tx->Commit();
    assert(h);
    return *h;
  }
};

google::protobuf::Value BodyOf(const remote::HttpRequest& request) {
  google::protobuf::Value v;
  const bool              ok = remote::json::Parse(request.body, &v);
  assert(ok);
  return v;
}

void TestOfflineCreateThenSyncThenEditThenUpdate() {
  Fixture f;
  f.connectivity->SetOnline(false);

  const auto id = f.Create(7, "PO-1001");
  assert(f.Header(id).sync_state == SyncState::kUnsynced);
  assert(!f.Header(id).remote_id);

  auto offline = f.engine.Run();
  assert(offline.offline);
  assert(offline.attempted == 0);
  assert(f.transport->Total() == 0);

  f.connectivity->SetOnline(true);
  f.transport->Respond(HttpMethod::kPost, "/purchase", 200, R"({"success": true, "data": {"id": 555}})");

  auto first = f.engine.Run();
  assert(first.attempted == 1 && first.synced == 1 && first.failed == 0);
  auto synced = f.Header(id);
  assert(synced.sync_state == SyncState::kSynced);
  assert(synced.remote_id == 555);

  const auto create = f.transport->Requests().back();
  const auto payload = BodyOf(create);
  assert(remote::json::Int64Or(payload, "contact_id", 0) == 7);
  assert(remote::json::StringOr(payload, "ref_no") == "PO-1001");
  assert(remote::json::StringOr(payload, "transaction_date") == "2024-03-01 10:15:30");
  assert(remote::json::Field(payload, "purchases")->list_value().values_size() == 1);

  // local edit keeps the remote id and queues an update
  core::PurchaseDraft edit;
  edit.header             = testing::MakeHeader(7, "PO-1001", 180);
  edit.header.final_total = 180;
  edit.lines.push_back(testing::MakeLine(100, 3, 60));
  f.service.UpdatePurchase(id, edit);

  auto edited = f.Header(id);
  assert(edited.sync_state == SyncState::kUnsynced);
  assert(edited.remote_id == 555);

  f.transport->Respond(HttpMethod::kPut, "/purchase/555", 200, R"({"id": 555})");
  auto second = f.engine.Run();
  assert(second.synced == 1);
  assert(f.transport->Count(HttpMethod::kPut, "/purchase/555") == 1);
  assert(f.transport->Count(HttpMethod::kPost, "/purchase") == 1);
  assert(f.Header(id).sync_state == SyncState::kSynced);
  assert(f.Header(id).remote_id == 555);
}

void TestSecondRunIsIdempotent() {
  Fixture f;
  f.Create(7, "PO-A");
  f.transport->Respond(HttpMethod::kPost, "/purchase", 200, R"({"id": 10})");

  assert(f.engine.Run().synced == 1);
  const auto calls = f.transport->Total();

  auto again = f.engine.Run();
  assert(again.attempted == 0 && again.synced == 0);
  assert(f.transport->Total() == calls);
  assert(f.engine.PendingCount() == 0);
}

void TestHeaderWithoutLinesFailsLocally() {
  Fixture f;
  auto header = testing::MakeHeader(7, "PO-EMPTY");
  {
    auto tx = f.repo->Begin();
    assert(f.repo->InsertHeader(*tx, header));
    tx->Commit();
  }

  auto report = f.engine.Run();
  assert(report.attempted == 1 && report.failed == 1);
  assert(!report.failures[0].kind);
  assert(report.failures[0].message == "no line items");
  assert(f.transport->Total() == 0);
  assert(f.Header(header.local_id).sync_state == SyncState::kUnsynced);
}

void TestValidationFailureDoesNotStopTheRun() {
  Fixture f;
  const auto bad  = f.Create(7, "PO-BAD");
  const auto good = f.Create(8, "PO-GOOD");

  f.transport->On(HttpMethod::kPost, "/purchase", [](const remote::HttpRequest& r) -> remote::HttpResponse {
    if (r.body.find("PO-BAD") != std::string::npos) {
      return {422, R"({"message": "invalid", "errors": {"ref_no": ["The ref no has already been taken."]}})"};
    }
    return {200, R"({"id": 77})"};
  });

  auto report = f.engine.Run();
  assert(report.attempted == 2);
  assert(report.synced == 1 && report.failed == 1);
  assert(report.failures[0].local_id == bad);
  assert(report.failures[0].kind == FailureKind::kValidation);
  assert(report.failures[0].field_errors.count("ref_no") == 1);

  assert(f.Header(bad).sync_state == SyncState::kUnsynced);
  assert(f.Header(good).remote_id == 77);
}

void TestAuthFailureAbortsRun() {
  Fixture f;
  f.Create(7, "PO-1");
  f.Create(7, "PO-2");
  f.transport->Respond(HttpMethod::kPost, "/purchase", 401, R"({"message": "Unauthenticated."})");

  auto report = f.engine.Run();
  assert(report.auth_required);
  assert(report.attempted == 1 && report.failed == 1);
  assert(f.transport->Count(HttpMethod::kPost, "/purchase") == 1);
  assert(f.engine.PendingCount() == 2);
}

void TestNotAuthenticatedSkipsRun() {
  Fixture f;
  f.Create(7, "PO-1");
  f.auth->SetAuthenticated(false);

  auto report = f.engine.Run();
  assert(report.auth_required && report.attempted == 0);
  assert(f.transport->Total() == 0);
}

void TestNetworkFailureLeavesHeaderQueued() {
  Fixture f;
  const auto id = f.Create(7, "PO-NET");
  f.transport->Unreachable(HttpMethod::kPost, "/purchase");

  auto report = f.engine.Run();
  assert(report.failed == 1);
  assert(report.failures[0].kind == FailureKind::kNetwork);
  assert(f.Header(id).sync_state == SyncState::kUnsynced);
}

void TestCreateResponseWithoutIdIsMalformed() {
  Fixture f;
  const auto id = f.Create(7, "PO-NOID");
  f.transport->Respond(HttpMethod::kPost, "/purchase", 200, R"({"success": true})");

  auto report = f.engine.Run();
  assert(report.failed == 1);
  assert(report.failures[0].kind == FailureKind::kMalformed);
  assert(f.Header(id).sync_state == SyncState::kUnsynced);
  assert(!f.Header(id).remote_id);
}

void TestConfirmedPaymentsReplaceStagedOnes() {
  Fixture f;
  core::PurchaseDraft draft;
  draft.header = testing::MakeHeader(7, "PO-PAY");
  draft.lines.push_back(testing::MakeLine(1, 1, 100));
  db::model::PurchasePaymentRecord staged;
  staged.method = "cash";
  staged.amount = 40;
  draft.payments.push_back(staged);
  const auto id = f.service.CreatePurchase(draft);

  f.transport->Respond(HttpMethod::kPost, "/purchase", 200,
                       R"({"id": 900, "payment_lines": [{"id": 31, "method": "bank_transfer", "amount": 40, "paid_on": "2024-03-01 10:00:00"}]})");

  assert(f.engine.Run().synced == 1);
  assert(remote::json::Field(BodyOf(f.transport->Requests().back()), "payments"));

  auto tx       = f.repo->Begin();
  auto payments = f.repo->GetPayments(*tx, id);
  tx->Commit();
  assert(payments.size() == 1);
  assert(payments[0].remote_payment_id == 31);
  assert(payments[0].method == "bank_transfer");
}

void TestUnusablePaymentLinesKeepStagedPayments() {
  Fixture f;
  core::PurchaseDraft draft;
  draft.header = testing::MakeHeader(7, "PO-BADPAY");
  draft.lines.push_back(testing::MakeLine(1, 1, 100));
  db::model::PurchasePaymentRecord staged;
  staged.method = "cash";
  staged.amount = 40;
  draft.payments.push_back(staged);
  const auto id = f.service.CreatePurchase(draft);

  f.transport->Respond(HttpMethod::kPost, "/purchase", 200, R"({"id": 900, "payment_lines": ["garbage", null]})");

  auto report = f.engine.Run();
  assert(report.synced == 0);
  assert(report.failed == 1);
  assert(report.failures[0].kind == FailureKind::kMalformed);
  assert(f.Header(id).sync_state == SyncState::kUnsynced);
  assert(f.Header(id).remote_id == 900);

  {
    auto tx       = f.repo->Begin();
    auto payments = f.repo->GetPayments(*tx, id);
    tx->Commit();
    assert(payments.size() == 1);
    assert(payments[0].method == "cash");
    assert(payments[0].amount == 40);
  }

  // a line without an amount is just as unusable
  f.transport->Respond(HttpMethod::kPut, "/purchase/900", 200, R"({"id": 900, "payments": [{"method": "cash"}]})");
  report = f.engine.Run();
  assert(report.failed == 1);
  assert(f.transport->Requests().back().method == HttpMethod::kPut);
  assert(f.Header(id).sync_state == SyncState::kUnsynced);

  f.transport->Respond(HttpMethod::kPut, "/purchase/900", 200, R"({"id": 900})");
  assert(f.engine.Run().synced == 1);
  assert(f.Header(id).sync_state == SyncState::kSynced);
  assert(f.Header(id).remote_id == 900);
}

void TestUpdateResponseIdMismatchKeepsStoredId() {
  Fixture f;
  const auto id = f.Create(7, "PO-MM");
  {
    auto tx = f.repo->Begin();
    assert(f.repo->MarkSynced(*tx, id, 555));
    auto h       = f.repo->GetHeader(*tx, id);
    h->sync_state = SyncState::kUnsynced;
    assert(f.repo->UpdateHeader(*tx, *h));
    tx->Commit();
  }
  f.transport->Respond(HttpMethod::kPut, "/purchase/555", 200, R"({"id": 999})");

  assert(f.engine.Run().synced == 1);
  assert(f.Header(id).remote_id == 555);
}

void TestCancelStopsBetweenHeaders() {
  Fixture f;
  f.Create(7, "PO-1");
  f.Create(7, "PO-2");

  std::atomic<bool> cancel{false};
  f.transport->On(HttpMethod::kPost, "/purchase", [&cancel](const remote::HttpRequest&) -> remote::HttpResponse {
    cancel.store(true);
    return {200, R"({"id": 1})"};
  });

  auto report = f.engine.Run(&cancel);
  assert(report.cancelled);
  assert(report.synced == 1);
  assert(f.engine.PendingCount() == 1);
}

} // namespace

int main() {
  TestOfflineCreateThenSyncThenEditThenUpdate();
  TestSecondRunIsIdempotent();
  TestHeaderWithoutLinesFailsLocally();
  TestValidationFailureDoesNotStopTheRun();
  TestAuthFailureAbortsRun();
  TestNotAuthenticatedSkipsRun();
  TestNetworkFailureLeavesHeaderQueued();
  TestCreateResponseWithoutIdIsMalformed();
  TestConfirmedPaymentsReplaceStagedOnes();
  TestUnusablePaymentLinesKeepStagedPayments();
  TestUpdateResponseIdMismatchKeepsStoredId();
  TestCancelStopsBetweenHeaders();

  std::cout << "purchase_sync_unit_sync_engine: pass\n";
  return 0;
}
