#include "purchase_service.hpp"

#include <stdexcept>

#include "internal/db/api/db_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/remote/remote_error.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace purchase::core {

using db::ThrowIfDbError;
using observability::IntField;
using observability::StringField;

namespace {

void StoreChildren(db::Repository& repository, db::Transaction& tx, std::int64_t local_id, PurchaseDraft& draft) {
  for (auto& line : draft.lines) {
    line.id          = 0;
    line.purchase_id = local_id;
    ThrowIfDbError(repository.InsertLine(tx, line), "store purchase line");
  }
  for (auto& payment : draft.payments) {
    payment.id                = 0;
    payment.purchase_id       = local_id;
    payment.remote_payment_id = std::nullopt;
    if (payment.paid_on.empty()) payment.paid_on = util::FormatIso8601(util::Now());
    ThrowIfDbError(repository.InsertPayment(tx, payment), "store purchase payment");
  }
}

} // namespace

PurchaseService::PurchaseService(std::shared_ptr<db::Repository> repository, std::shared_ptr<remote::PurchaseApi> api,
                                 std::shared_ptr<net::ConnectivityProbe> connectivity, std::shared_ptr<net::AuthProvider> auth,
                                 std::shared_ptr<sync::HeaderLocks> locks)
    : repository_(std::move(repository)),
      api_(std::move(api)),
      connectivity_(std::move(connectivity)),
      auth_(std::move(auth)),
      locks_(std::move(locks)) {
  if (!repository_ || !api_ || !connectivity_ || !auth_ || !locks_) {
    throw std::invalid_argument("PurchaseService requires repository, api, probes and header locks");
  }
}

void PurchaseService::Validate(const PurchaseDraft& draft) {
  if (draft.header.supplier_id <= 0) throw util::InvalidArgument("purchase: supplier is required");
  if (draft.header.location_id <= 0) throw util::InvalidArgument("purchase: business location is required");
  if (draft.lines.empty()) throw util::InvalidArgument("purchase: at least one line item is required");
  if (draft.header.final_total <= 0) throw util::InvalidArgument("purchase: final total must be greater than zero");
  for (const auto& line : draft.lines) {
    if (line.quantity < 0) throw util::InvalidArgument("purchase: line quantity must not be negative");
  }
}

void PurchaseService::RequireRemote(const char* operation) {
  if (!connectivity_->IsOnline()) {
    throw remote::RemoteError(remote::FailureKind::kNetwork, 0, std::string(operation) + " requires a connection");
  }
  if (!auth_->IsAuthenticated()) {
    throw remote::RemoteError(remote::FailureKind::kAuthentication, 401, "Authentication failed. Please login again.");
  }
}

std::int64_t PurchaseService::CreatePurchase(PurchaseDraft draft) {
  Validate(draft);

  auto& header      = draft.header;
  header.local_id   = 0;
  header.remote_id  = std::nullopt;
  header.sync_state = db::model::SyncState::kUnsynced;
  if (header.tax_id && *header.tax_id == 0) header.tax_id = std::nullopt;
  if (header.transaction_date.empty()) header.transaction_date = util::FormatIso8601(util::Now());

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->InsertHeader(*tx, header), "create purchase");
  StoreChildren(*repository_, *tx, header.local_id, draft);
  tx->Commit();

  PURCHASE_LOG_INFO("purchase created", {IntField("local_id", header.local_id),
                                         IntField("lines", static_cast<std::int64_t>(draft.lines.size()))});
  return header.local_id;
}

void PurchaseService::UpdatePurchase(std::int64_t local_id, PurchaseDraft draft) {
  Validate(draft);
  auto lock = locks_->Lock(local_id);

  auto tx      = repository_->Begin();
  auto current = repository_->GetHeader(*tx, local_id);
  if (!current) throw util::NotFound("update purchase: purchase " + std::to_string(local_id) + " not found");

  auto& header      = draft.header;
  header.local_id   = local_id;
  header.remote_id  = current->remote_id;
  header.sync_state = db::model::SyncState::kUnsynced;
  if (header.tax_id && *header.tax_id == 0) header.tax_id = std::nullopt;
  if (header.transaction_date.empty()) header.transaction_date = current->transaction_date;

  ThrowIfDbError(repository_->UpdateHeader(*tx, header), "update purchase");
  ThrowIfDbError(repository_->DeleteLinesByPurchase(*tx, local_id), "replace purchase lines");
  ThrowIfDbError(repository_->DeletePaymentsByPurchase(*tx, local_id), "replace purchase payments");
  StoreChildren(*repository_, *tx, local_id, draft);
  tx->Commit();

  PURCHASE_LOG_INFO("purchase updated", {IntField("local_id", local_id)});
}

PurchaseDetail PurchaseService::GetPurchase(std::int64_t local_id) {
  auto tx     = repository_->Begin();
  auto header = repository_->GetHeader(*tx, local_id);
  if (!header) throw util::NotFound("get purchase: purchase " + std::to_string(local_id) + " not found");

  PurchaseDetail detail;
  detail.header   = std::move(*header);
  detail.lines    = repository_->GetLines(*tx, local_id);
  detail.payments = repository_->GetPayments(*tx, local_id);
  tx->Commit();
  return detail;
}

void PurchaseService::DeletePurchase(std::int64_t local_id) {
  auto lock = locks_->Lock(local_id);

  std::optional<db::model::PurchaseHeaderRecord> header;
  {
    auto tx = repository_->Begin();
    header  = repository_->GetHeader(*tx, local_id);
    tx->Commit();
  }
  if (!header) throw util::NotFound("delete purchase: purchase " + std::to_string(local_id) + " not found");

  if (header->remote_id) {
    RequireRemote("deleting a synced purchase");
    try {
      api_->DeletePurchase(*header->remote_id);
    } catch (const remote::RemoteError& e) {
      // already gone remotely; the local copy can go too
      if (e.Status() != 404) throw;
    }
  }

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->DeleteHeader(*tx, local_id), "delete purchase");
  tx->Commit();

  PURCHASE_LOG_INFO("purchase deleted", {IntField("local_id", local_id), IntField("remote_id", header->remote_id.value_or(0))});
}

void PurchaseService::UpdateStatus(std::int64_t local_id, db::model::PurchaseStatus status) {
  auto lock = locks_->Lock(local_id);

  std::optional<db::model::PurchaseHeaderRecord> header;
  {
    auto tx = repository_->Begin();
    header  = repository_->GetHeader(*tx, local_id);
    tx->Commit();
  }
  if (!header) throw util::NotFound("update status: purchase " + std::to_string(local_id) + " not found");

  header->status = status;
  if (header->sync_state == db::model::SyncState::kSynced) {
    RequireRemote("changing the status of a synced purchase");
    api_->UpdateStatus(*header->remote_id, db::model::ToString(status));
  }

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->UpdateHeader(*tx, *header), "update purchase status");
  tx->Commit();

  PURCHASE_LOG_INFO("purchase status changed", {IntField("local_id", local_id), StringField("status", db::model::ToString(status))});
}

bool PurchaseService::CheckReferenceNumber(std::int64_t supplier_id, const std::string& ref_no) {
  if (ref_no.empty()) return false;
  RequireRemote("checking a reference number");
  return api_->CheckReferenceNumber(supplier_id, ref_no);
}

} // namespace purchase::core
