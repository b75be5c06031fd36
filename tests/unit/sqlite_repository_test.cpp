#include "internal/db/sqlite/sqlite_repository.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "tests/support/fakes.hpp"

namespace {

using namespace purchase;
using db::ErrorCode;
using db::model::PurchaseStatus;
using db::model::SyncState;
using testing::MakeHeader;
using testing::MakeLine;

void TestHeaderRoundTripWithOptionalColumns() {
  auto repo = testing::MakeRepository();
  auto tx   = repo->Begin();

  auto header          = MakeHeader(7, "PO-1001", 250.5);
  header.tax_id        = 3;
  header.discount_type = db::model::DiscountType::kPercentage;
  header.shipping_details = "by truck";
  assert(repo->InsertHeader(*tx, header));
  assert(header.local_id > 0);

  auto loaded = repo->GetHeader(*tx, header.local_id);
  assert(loaded);
  assert(loaded->supplier_id == 7);
  assert(loaded->ref_no == "PO-1001");
  assert(loaded->final_total == 250.5);
  assert(loaded->tax_id == 3);
  assert(loaded->discount_type == db::model::DiscountType::kPercentage);
  assert(loaded->shipping_details == "by truck");
  assert(!loaded->remote_id);
  assert(loaded->sync_state == SyncState::kUnsynced);

  auto no_ref   = MakeHeader(8, "");
  no_ref.ref_no = std::nullopt;
  assert(repo->InsertHeader(*tx, no_ref));
  assert(!repo->GetHeader(*tx, no_ref.local_id)->ref_no);

  tx->Commit();
}

void TestSyncedHeaderRequiresRemoteId() {
  auto repo = testing::MakeRepository();
  auto tx   = repo->Begin();

  auto header       = MakeHeader(7, "PO-2");
  header.sync_state = SyncState::kSynced;
  auto result       = repo->InsertHeader(*tx, header);
  assert(!result);
  assert(result.code == ErrorCode::ConstraintViolation);

  header.sync_state = SyncState::kUnsynced;
  assert(repo->InsertHeader(*tx, header));

  header.sync_state = SyncState::kSynced;
  assert(repo->UpdateHeader(*tx, header).code == ErrorCode::ConstraintViolation);
}

void TestMarkSyncedAndRemoteLookup() {
  auto repo = testing::MakeRepository();
  auto tx   = repo->Begin();

  auto header = MakeHeader(7, "PO-3");
  assert(repo->InsertHeader(*tx, header));
  assert(repo->MarkSynced(*tx, header.local_id, 555));

  auto loaded = repo->GetHeaderByRemoteId(*tx, 555);
  assert(loaded && loaded->local_id == header.local_id);
  assert(loaded->sync_state == SyncState::kSynced);
  assert(repo->ListUnsyncedHeaders(*tx).empty());
  assert(repo->ListRemoteIds(*tx) == std::vector<std::int64_t>{555});

  assert(repo->MarkSynced(*tx, 9999, 1).code == ErrorCode::NotFound);

  auto missing     = MakeHeader(1, "x");
  missing.local_id = 9999;
  assert(repo->UpdateHeader(*tx, missing).code == ErrorCode::NotFound);
}

void TestListOrdering() {
  auto repo = testing::MakeRepository();
  auto tx   = repo->Begin();

  std::vector<std::int64_t> ids;
  for (const char* ref : {"A", "B", "C"}) {
    auto h = MakeHeader(1, ref);
    assert(repo->InsertHeader(*tx, h));
    ids.push_back(h.local_id);
  }

  auto all = repo->ListHeaders(*tx);
  assert(all.size() == 3);
  assert(all.front().local_id == ids.back());

  auto pending = repo->ListUnsyncedHeaders(*tx);
  assert(pending.size() == 3);
  assert(pending.front().local_id == ids.front());
}

void TestLinesAndPaymentsCascadeOnDelete() {
  auto repo = testing::MakeRepository();
  auto tx   = repo->Begin();

  auto header = MakeHeader(7, "PO-4");
  assert(repo->InsertHeader(*tx, header));

  auto first              = MakeLine(11, 2, 5.0);
  first.purchase_id       = header.local_id;
  first.lot_number        = "L-1";
  first.purchase_order_line_id = 42;
  auto second             = MakeLine(12, 1, 9.5);
  second.purchase_id      = header.local_id;
  assert(repo->InsertLine(*tx, first));
  assert(repo->InsertLine(*tx, second));
  assert(repo->CountLines(*tx, header.local_id) == 2);

  auto lines = repo->GetLines(*tx, header.local_id);
  assert(lines.size() == 2);
  assert(lines[0].variation_id == 110);
  assert(lines[0].lot_number == "L-1");
  assert(lines[0].purchase_order_line_id == 42);
  assert(!lines[1].purchase_order_line_id);

  lines[1].quantity = 4;
  assert(repo->UpdateLine(*tx, lines[1]));
  assert(repo->GetLines(*tx, header.local_id)[1].quantity == 4);

  db::model::PurchasePaymentRecord payment;
  payment.purchase_id = header.local_id;
  payment.method      = "cash";
  payment.amount      = 10;
  assert(repo->InsertPayment(*tx, payment));
  assert(repo->GetPayments(*tx, header.local_id).size() == 1);

  assert(repo->DeleteHeader(*tx, header.local_id));
  assert(!repo->GetHeader(*tx, header.local_id));
  assert(repo->GetLines(*tx, header.local_id).empty());
  assert(repo->GetPayments(*tx, header.local_id).empty());

  assert(repo->DeleteHeader(*tx, header.local_id).code == ErrorCode::NotFound);
}

void TestReferenceReplaceAndSearch() {
  auto repo = testing::MakeRepository();
  auto tx   = repo->Begin();

  std::vector<db::model::SupplierRecord> suppliers(3);
  suppliers[0].id   = 1;
  suppliers[0].name = "beta supplies";
  suppliers[1].id   = 2;
  suppliers[1].name = "Alpha Traders";
  suppliers[2].id   = 3;
  suppliers[2].name = "100% Cotton";
  assert(repo->ReplaceSuppliers(*tx, suppliers));

  auto all = repo->SearchSuppliers(*tx, "");
  assert(all.size() == 3);
  assert(all[1].name == "Alpha Traders");
  assert(all[2].name == "beta supplies");

  auto hit = repo->SearchSuppliers(*tx, "ALPHA");
  assert(hit.size() == 1 && hit[0].id == 2);

  // wildcard characters match literally
  auto percent = repo->SearchSuppliers(*tx, "0%");
  assert(percent.size() == 1 && percent[0].id == 3);
  assert(repo->SearchSuppliers(*tx, "_").empty());

  assert(repo->ReplaceSuppliers(*tx, {suppliers[0]}));
  assert(repo->CountReference(*tx, db::model::ReferenceKind::kSuppliers) == 1);

  std::vector<db::model::ProductRecord> products(1);
  products[0].product_id   = 5;
  products[0].product_name = "Bolt";
  products[0].sub_sku      = "B-5";
  assert(repo->ReplaceProducts(*tx, products));
  assert(repo->SearchProducts(*tx, "bol").size() == 1);

  assert(repo->ClearReferenceCaches(*tx));
  assert(repo->CountReference(*tx, db::model::ReferenceKind::kSuppliers) == 0);
  assert(repo->CountReference(*tx, db::model::ReferenceKind::kProducts) == 0);
}

void TestSystemValues() {
  auto repo = testing::MakeRepository();
  auto tx   = repo->Begin();

  assert(!repo->GetSystemValue(*tx, "suppliers_last_sync"));
  assert(repo->PutSystemValue(*tx, "suppliers_last_sync", "2024-03-01T00:00:00.000Z"));
  assert(repo->PutSystemValue(*tx, "suppliers_last_sync", "2024-03-02T00:00:00.000Z"));
  assert(*repo->GetSystemValue(*tx, "suppliers_last_sync") == "2024-03-02T00:00:00.000Z");

  assert(repo->DeleteSystemValue(*tx, "suppliers_last_sync"));
  assert(!repo->GetSystemValue(*tx, "suppliers_last_sync"));
}

void TestRollbackDiscardsWrites() {
  auto repo = testing::MakeRepository();
  {
    auto tx = repo->Begin();
    auto h  = MakeHeader(1, "gone");
    assert(repo->InsertHeader(*tx, h));
  } // destructor rolls back

  auto tx = repo->Begin();
  assert(repo->ListHeaders(*tx).empty());
  tx->Commit();
}

} // namespace

int main() {
  TestHeaderRoundTripWithOptionalColumns();
  TestSyncedHeaderRequiresRemoteId();
  TestMarkSyncedAndRemoteLookup();
  TestListOrdering();
  TestLinesAndPaymentsCascadeOnDelete();
  TestReferenceReplaceAndSearch();
  TestSystemValues();
  TestRollbackDiscardsWrites();

  std::cout << "purchase_sync_unit_sqlite_repository: pass\n";
  return 0;
}
