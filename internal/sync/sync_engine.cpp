#include "sync_engine.hpp"

#include <stdexcept>

#include "internal/db/api/db_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/remote/json.hpp"
#include "internal/remote/response_shapes.hpp"
#include "internal/remote/wire_mapping.hpp"
#include "internal/sync/payload_builder.hpp"

namespace purchase::sync {

using observability::IntField;
using observability::StringField;

SyncEngine::SyncEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<remote::PurchaseApi> api,
                       std::shared_ptr<net::ConnectivityProbe> connectivity, std::shared_ptr<net::AuthProvider> auth,
                       std::shared_ptr<HeaderLocks> locks)
    : repository_(std::move(repository)),
      api_(std::move(api)),
      connectivity_(std::move(connectivity)),
      auth_(std::move(auth)),
      locks_(std::move(locks)) {
  if (!repository_ || !api_ || !connectivity_ || !auth_ || !locks_) {
    throw std::invalid_argument("SyncEngine requires repository, api, probes and header locks");
  }
}

std::int64_t SyncEngine::PendingCount() {
  auto tx      = repository_->Begin();
  auto pending = repository_->ListUnsyncedHeaders(*tx);
  tx->Commit();
  return static_cast<std::int64_t>(pending.size());
}

SyncReport SyncEngine::Run(const std::atomic<bool>* cancel) {
  observability::SpanScope span("sync.run");
  SyncReport               report;

  if (!connectivity_->IsOnline()) {
    report.offline = true;
    span.AddEvent("offline");
    PURCHASE_LOG_INFO("sync skipped: offline");
    return report;
  }
  if (!auth_->IsAuthenticated()) {
    report.auth_required = true;
    span.AddEvent("auth_required");
    PURCHASE_LOG_WARN("sync skipped: not authenticated");
    return report;
  }

  std::vector<std::int64_t> pending;
  {
    auto tx = repository_->Begin();
    for (const auto& header : repository_->ListUnsyncedHeaders(*tx)) pending.push_back(header.local_id);
    tx->Commit();
  }
  observability::Metrics::Instance().SetPendingPurchases(static_cast<std::int64_t>(pending.size()));

  for (auto local_id : pending) {
    if (cancel && cancel->load()) {
      report.cancelled = true;
      span.AddEvent("cancelled");
      break;
    }
    ++report.attempted;

    HeaderFailure failure;
    failure.local_id = local_id;
    std::string outcome;

    try {
      switch (Push(local_id)) {
        case PushResult::kSynced:
          ++report.synced;
          observability::Metrics::Instance().RecordSyncOutcome("synced");
          continue;
        case PushResult::kGone:
          // deleted or synced by someone else since the listing
          --report.attempted;
          continue;
        case PushResult::kNoLines:
          failure.message = "no line items";
          outcome         = "no_lines";
          break;
      }
    } catch (const remote::RemoteError& e) {
      failure.kind         = e.Kind();
      failure.message      = e.what();
      failure.field_errors = e.Fields();
      outcome              = remote::ToString(e.Kind());
    } catch (const std::exception& e) {
      failure.message = e.what();
      outcome         = "store";
    }

    ++report.failed;
    observability::Metrics::Instance().RecordSyncOutcome(outcome);
    PURCHASE_LOG_WARN("purchase sync failed", {IntField("local_id", local_id), StringField("reason", outcome),
                                               StringField("error", failure.message)});

    const bool auth_failure = failure.kind == remote::FailureKind::kAuthentication;
    report.failures.push_back(std::move(failure));
    if (auth_failure) {
      report.auth_required = true;
      span.AddEvent("auth_required");
      break;
    }
  }

  span.SetAttribute("sync.attempted", static_cast<std::int64_t>(report.attempted));
  span.SetAttribute("sync.synced", static_cast<std::int64_t>(report.synced));
  span.SetAttribute("sync.failed", static_cast<std::int64_t>(report.failed));
  PURCHASE_LOG_INFO("sync run finished", {IntField("attempted", static_cast<std::int64_t>(report.attempted)),
                                          IntField("synced", static_cast<std::int64_t>(report.synced)),
                                          IntField("failed", static_cast<std::int64_t>(report.failed)),
                                          observability::BoolField("cancelled", report.cancelled),
                                          observability::BoolField("auth_required", report.auth_required)});
  return report;
}

namespace {

std::optional<std::vector<db::model::PurchasePaymentRecord>> ConfirmedPayments(const google::protobuf::Value& response,
                                                                              std::int64_t                   local_id) {
  auto items = remote::ExtractPaymentLines(response);
  if (!items) return std::nullopt;

  std::vector<db::model::PurchasePaymentRecord> out;
  out.reserve(items->size());
  for (const auto* item : *items) {
    if (!remote::json::IsObject(item) || !remote::json::AsDouble(remote::json::Field(*item, "amount"))) {
      throw remote::RemoteError(remote::FailureKind::kMalformed, 200, "response carried an unusable payment line");
    }
    out.push_back(remote::PaymentFromJson(*item, local_id));
  }
  return out;
}

} // namespace

// The remote already holds the purchase; remember its id so the next run
// updates it instead of creating a second one. Staged payments stay.
void SyncEngine::KeepRemoteId(db::model::PurchaseHeaderRecord header, std::int64_t remote_id) {
  header.remote_id = remote_id;
  auto tx          = repository_->Begin();
  db::ThrowIfDbError(repository_->UpdateHeader(*tx, header), "record remote purchase id");
  tx->Commit();
  PURCHASE_LOG_WARN("create accepted but response was unusable; purchase stays queued for update",
                    {IntField("local_id", header.local_id), IntField("remote_id", remote_id)});
}

SyncEngine::PushResult SyncEngine::Push(std::int64_t local_id) {
  observability::SpanScope span("sync.push");
  span.SetAttribute("purchase.local_id", local_id);

  auto lock = locks_->Lock(local_id);

  std::optional<db::model::PurchaseHeaderRecord> header;
  std::vector<db::model::PurchaseLineRecord>     lines;
  std::vector<db::model::PurchasePaymentRecord>  payments;
  {
    auto tx = repository_->Begin();
    header  = repository_->GetHeader(*tx, local_id);
    if (header && header->sync_state == db::model::SyncState::kUnsynced) {
      lines    = repository_->GetLines(*tx, local_id);
      payments = repository_->GetPayments(*tx, local_id);
    }
    tx->Commit();
  }
  if (!header || header->sync_state != db::model::SyncState::kUnsynced) return PushResult::kGone;
  if (lines.empty()) return PushResult::kNoLines;

  const auto payload = PayloadBuilder::Build(*header, lines, payments);

  google::protobuf::Value response;
  std::int64_t            remote_id = 0;
  if (!header->remote_id) {
    response = api_->CreatePurchase(payload);
    auto id  = remote::ExtractRemoteId(response);
    if (!id) {
      throw remote::RemoteError(remote::FailureKind::kMalformed, 200, "create response carried no purchase id");
    }
    remote_id = *id;
  } else {
    response = api_->UpdatePurchase(*header->remote_id, payload);
    auto id  = remote::ExtractRemoteId(response);
    if (id && *id != *header->remote_id) {
      PURCHASE_LOG_WARN("update response names a different purchase id; keeping the stored one",
                        {IntField("local_id", local_id), IntField("remote_id", *header->remote_id),
                         IntField("response_id", *id)});
    }
    remote_id = *header->remote_id;
  }
  span.SetAttribute("purchase.remote_id", remote_id);

  std::optional<std::vector<db::model::PurchasePaymentRecord>> confirmed;
  try {
    confirmed = ConfirmedPayments(response, local_id);
  } catch (const remote::RemoteError&) {
    if (!header->remote_id) KeepRemoteId(*header, remote_id);
    throw;
  }

  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->MarkSynced(*tx, local_id, remote_id), "mark purchase synced");
  if (confirmed) {
    db::ThrowIfDbError(repository_->DeletePaymentsByPurchase(*tx, local_id), "replace staged payments");
    for (auto& payment : *confirmed) {
      db::ThrowIfDbError(repository_->InsertPayment(*tx, payment), "store confirmed payment");
    }
  }
  tx->Commit();

  PURCHASE_LOG_INFO("purchase synced", {IntField("local_id", local_id), IntField("remote_id", remote_id),
                                        StringField("mode", header->remote_id ? "update" : "create")});
  return PushResult::kSynced;
}

} // namespace purchase::sync
