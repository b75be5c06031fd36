#include "purchase_view_builder.hpp"

#include <set>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include "internal/cache/reference_cache_manager.hpp"
#include "internal/db/api/db_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/reconcile/dedup.hpp"
#include "internal/remote/remote_error.hpp"

namespace purchase::view {

using observability::IntField;
using observability::StringField;

namespace {

std::optional<std::int64_t> SummaryKey(const PurchaseSummary& s) {
  return s.remote_id;
}

bool PassesLocalFilter(const remote::PurchaseListFilter& filter, const db::model::PurchaseHeaderRecord& header) {
  if (filter.status && !filter.status->empty() && *filter.status != db::model::ToString(header.status)) return false;
  if (filter.supplier_id && *filter.supplier_id != header.supplier_id) return false;
  return true;
}

} // namespace

const char* ToString(Origin origin) {
  return origin == Origin::kRemote ? "remote" : "local";
}

PurchaseViewBuilder::PurchaseViewBuilder(std::shared_ptr<db::Repository> repository, std::shared_ptr<remote::PurchaseApi> api,
                                         std::shared_ptr<cache::ReferenceCacheManager> cache,
                                         std::shared_ptr<net::ConnectivityProbe>       connectivity,
                                         std::shared_ptr<net::AuthProvider> auth, std::shared_ptr<sync::HeaderLocks> locks)
    : repository_(std::move(repository)),
      api_(std::move(api)),
      cache_(std::move(cache)),
      connectivity_(std::move(connectivity)),
      auth_(std::move(auth)),
      locks_(std::move(locks)) {
  if (!repository_ || !api_ || !connectivity_ || !auth_ || !locks_) {
    throw std::invalid_argument("PurchaseViewBuilder requires repository, api, probes and header locks");
  }
}

std::vector<PurchaseSummary> PurchaseViewBuilder::LocalEntries(const remote::PurchaseListFilter&                  filter,
                                                               const std::vector<db::model::PurchaseHeaderRecord>& headers) {
  std::unordered_map<std::int64_t, std::string> supplier_names;
  {
    auto tx = repository_->Begin();
    for (const auto& s : repository_->SearchSuppliers(*tx, "")) supplier_names.emplace(s.id, s.name);
    tx->Commit();
  }

  std::vector<PurchaseSummary> out;
  for (const auto& h : headers) {
    if (!PassesLocalFilter(filter, h)) continue;

    PurchaseSummary s;
    s.origin           = Origin::kLocal;
    s.local_id         = h.local_id;
    s.remote_id        = h.remote_id;
    s.supplier_id      = h.supplier_id;
    s.location_id      = h.location_id;
    s.ref_no           = h.ref_no;
    s.status           = db::model::ToString(h.status);
    s.transaction_date = h.transaction_date;
    s.final_total      = h.final_total;
    s.synced           = h.sync_state == db::model::SyncState::kSynced;
    if (auto it = supplier_names.find(h.supplier_id); it != supplier_names.end()) s.supplier_name = it->second;
    out.push_back(std::move(s));
  }
  return out;
}

PurchaseListing PurchaseViewBuilder::LocalOnly(const remote::PurchaseListFilter&          filter,
                                               std::vector<db::model::PurchaseHeaderRecord> headers) {
  PurchaseListing listing;
  listing.entries      = reconcile::DedupByRemoteId(LocalEntries(filter, headers), &SummaryKey);
  listing.from_remote  = false;
  listing.current_page = 1;
  listing.last_page    = 1;
  listing.per_page     = static_cast<std::int64_t>(listing.entries.size());
  listing.total        = static_cast<std::int64_t>(listing.entries.size());
  return listing;
}

PurchaseListing PurchaseViewBuilder::List(const remote::PurchaseListFilter& filter) {
  observability::SpanScope span("view.list");

  std::vector<db::model::PurchaseHeaderRecord> headers;
  {
    auto tx = repository_->Begin();
    headers = repository_->ListHeaders(*tx);
    tx->Commit();
  }

  if (!connectivity_->IsOnline() || !auth_->IsAuthenticated()) {
    span.AddEvent("local_only");
    return LocalOnly(filter, std::move(headers));
  }

  if (cache_) cache_->RefreshAllIfStale();

  remote::PurchasePage page;
  try {
    page = api_->ListPurchases(filter);
  } catch (const remote::RemoteError& e) {
    PURCHASE_LOG_WARN("remote purchase listing unavailable; showing local purchases",
                      {StringField("kind", remote::ToString(e.Kind())), StringField("error", e.what())});
    span.RecordException(e.what());
    return LocalOnly(filter, std::move(headers));
  }

  std::unordered_map<std::int64_t, std::int64_t> local_by_remote;
  for (const auto& h : headers) {
    if (h.remote_id) local_by_remote.emplace(*h.remote_id, h.local_id);
  }

  std::vector<PurchaseSummary> entries;
  entries.reserve(page.items.size());
  for (const auto& p : page.items) {
    PurchaseSummary s;
    s.origin           = Origin::kRemote;
    s.remote_id        = p.remote_id;
    s.supplier_id      = p.supplier_id;
    s.location_id      = p.location_id;
    s.ref_no           = p.ref_no;
    s.status           = p.status;
    s.payment_status   = p.payment_status;
    s.transaction_date = p.transaction_date;
    s.final_total      = p.final_total;
    s.supplier_name    = p.supplier_name;
    if (auto it = local_by_remote.find(p.remote_id); it != local_by_remote.end()) s.local_id = it->second;
    entries.push_back(std::move(s));
  }
  entries = reconcile::DedupByRemoteId(std::move(entries), &SummaryKey);

  std::unordered_set<std::int64_t>                   remote_ids;
  std::set<std::pair<std::int64_t, std::string>>     remote_refs;
  for (const auto& e : entries) {
    if (e.remote_id) remote_ids.insert(*e.remote_id);
    if (e.ref_no && !e.ref_no->empty()) remote_refs.emplace(e.supplier_id, *e.ref_no);
  }

  std::size_t appended = 0;
  for (auto& local : LocalEntries(filter, headers)) {
    const bool represented = local.remote_id ? remote_ids.count(*local.remote_id) > 0
                                             : (local.ref_no && !local.ref_no->empty() &&
                                                remote_refs.count({local.supplier_id, *local.ref_no}) > 0);
    if (represented) continue;
    entries.push_back(std::move(local));
    ++appended;
  }

  PurchaseListing listing;
  listing.entries      = reconcile::DedupByRemoteId(std::move(entries), &SummaryKey);
  listing.from_remote  = true;
  listing.current_page = page.current_page;
  listing.last_page    = page.last_page;
  listing.per_page     = page.per_page;
  listing.total        = page.total;

  span.SetAttribute("view.remote", static_cast<std::int64_t>(page.items.size()));
  span.SetAttribute("view.local_appended", static_cast<std::int64_t>(appended));
  return listing;
}

ReconcileResult PurchaseViewBuilder::ReconcileSpecified(const std::vector<std::int64_t>& remote_ids) {
  observability::SpanScope span("view.reconcile");
  ReconcileResult          result;
  if (remote_ids.empty()) {
    result.online = true;
    return result;
  }
  if (!connectivity_->IsOnline() || !auth_->IsAuthenticated()) return result;

  try {
    result.found = api_->GetPurchases(remote_ids);
  } catch (const remote::RemoteError& e) {
    // 404: none of the requested purchases exist anymore
    if (e.Status() != 404) throw;
  }
  result.online = true;

  std::unordered_set<std::int64_t> keep;
  for (const auto& p : result.found) keep.insert(p.remote_id);
  const std::unordered_set<std::int64_t> requested(remote_ids.begin(), remote_ids.end());

  std::vector<db::model::PurchaseHeaderRecord> candidates;
  {
    auto tx = repository_->Begin();
    for (auto& h : repository_->ListHeaders(*tx)) {
      // unsynced rows carry edits the remote has not seen yet
      if (h.sync_state != db::model::SyncState::kSynced || !h.remote_id || requested.count(*h.remote_id) == 0) continue;
      candidates.push_back(std::move(h));
    }
    tx->Commit();
  }

  auto prunable = reconcile::SelectPrunable(candidates, keep, [](const db::model::PurchaseHeaderRecord& h) { return h.remote_id; });
  for (const auto& h : prunable) {
    auto lock = locks_->Lock(h.local_id);
    auto tx   = repository_->Begin();

    // re-check under the lock; an edit since the scan keeps the row
    auto current = repository_->GetHeader(*tx, h.local_id);
    if (!current || current->sync_state != db::model::SyncState::kSynced) {
      tx->Commit();
      continue;
    }
    db::ThrowIfDbError(repository_->DeleteHeader(*tx, h.local_id), "prune purchase");
    tx->Commit();
    result.pruned_local_ids.push_back(h.local_id);
    PURCHASE_LOG_INFO("pruned purchase missing remotely", {IntField("local_id", h.local_id), IntField("remote_id", *h.remote_id)});
  }

  span.SetAttribute("reconcile.pruned", static_cast<std::int64_t>(result.pruned_local_ids.size()));
  return result;
}

} // namespace purchase::view
