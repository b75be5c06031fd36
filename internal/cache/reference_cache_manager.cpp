#include "reference_cache_manager.hpp"

#include <future>
#include <stdexcept>

#include "internal/db/api/db_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/remote/remote_error.hpp"

namespace purchase::cache {

using db::model::ReferenceKind;

namespace {

constexpr ReferenceKind kAllKinds[] = {ReferenceKind::kSuppliers, ReferenceKind::kProducts, ReferenceKind::kLocations};

// remote set came back empty; keep what we have
class EmptyRemoteSet : public std::runtime_error {
 public:
  EmptyRemoteSet() : std::runtime_error("remote returned no records") {
  }
};

} // namespace

const char* ToString(RefreshOutcome outcome) {
  switch (outcome) {
    case RefreshOutcome::kRefreshed:
      return "refreshed";
    case RefreshOutcome::kSkippedFresh:
      return "skipped_fresh";
    case RefreshOutcome::kFailedKeptStale:
      return "failed_kept_stale";
  }
  return "unknown";
}

std::chrono::milliseconds CacheMaxAges::For(ReferenceKind kind) const {
  switch (kind) {
    case ReferenceKind::kSuppliers:
      return suppliers;
    case ReferenceKind::kProducts:
      return products;
    case ReferenceKind::kLocations:
      return locations;
  }
  return suppliers;
}

ReferenceCacheManager::ReferenceCacheManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<LastSyncStore> last_sync,
                                             std::shared_ptr<remote::PurchaseApi> api,
                                             std::shared_ptr<net::ConnectivityProbe> connectivity,
                                             std::shared_ptr<net::AuthProvider> auth, CacheMaxAges max_ages)
    : repository_(std::move(repository)),
      last_sync_(std::move(last_sync)),
      api_(std::move(api)),
      connectivity_(std::move(connectivity)),
      auth_(std::move(auth)),
      max_ages_(max_ages) {
  if (!repository_ || !last_sync_ || !api_ || !connectivity_ || !auth_) {
    throw std::invalid_argument("ReferenceCacheManager requires repository, last sync store, api and probes");
  }
}

bool ReferenceCacheManager::IsStale(ReferenceKind kind, std::chrono::milliseconds max_age) {
  auto last = last_sync_->Get(kind);
  if (!last) return true;
  return util::Now() - *last >= max_age;
}

RefreshResult ReferenceCacheManager::RefreshIfStale(ReferenceKind kind) {
  return RefreshIfStale(kind, max_ages_.For(kind));
}

RefreshResult ReferenceCacheManager::RefreshIfStale(ReferenceKind kind, std::chrono::milliseconds max_age) {
  observability::SpanScope span("cache.refresh");
  span.SetAttribute("cache.kind", db::model::ToString(kind));

  auto result = Refresh(kind, max_age);

  span.SetAttribute("cache.outcome", ToString(result.outcome));
  if (result.outcome == RefreshOutcome::kFailedKeptStale) span.RecordException(result.detail);
  observability::Metrics::Instance().RecordCacheRefresh(db::model::ToString(kind), ToString(result.outcome));
  return result;
}

RefreshResult ReferenceCacheManager::Refresh(ReferenceKind kind, std::chrono::milliseconds max_age) {
  RefreshResult result;
  result.kind = kind;

  auto failed = [&](std::string detail) {
    result.outcome = RefreshOutcome::kFailedKeptStale;
    result.detail  = std::move(detail);
    PURCHASE_LOG_WARN("reference cache refresh failed; keeping cached data",
                      {observability::StringField("kind", db::model::ToString(kind)),
                       observability::StringField("reason", result.detail)});
    return result;
  };

  try {
    if (!IsStale(kind, max_age)) {
      result.outcome = RefreshOutcome::kSkippedFresh;
      return result;
    }
    if (!connectivity_->IsOnline()) return failed("offline");
    if (!auth_->IsAuthenticated()) return failed("not authenticated");

    result.rows    = FetchAndReplace(kind);
    result.outcome = RefreshOutcome::kRefreshed;
    PURCHASE_LOG_INFO("reference cache refreshed", {observability::StringField("kind", db::model::ToString(kind)),
                                                    observability::IntField("rows", static_cast<std::int64_t>(result.rows))});
    return result;
  } catch (const remote::RemoteError& e) {
    return failed(std::string(remote::ToString(e.Kind())) + ": " + e.what());
  } catch (const std::exception& e) {
    return failed(e.what());
  }
}

std::size_t ReferenceCacheManager::FetchAndReplace(ReferenceKind kind) {
  const auto now = util::Now();

  switch (kind) {
    case ReferenceKind::kSuppliers: {
      auto rows = api_->GetSuppliers();
      if (rows.empty()) throw EmptyRemoteSet();
      auto tx = repository_->Begin();
      db::ThrowIfDbError(repository_->ReplaceSuppliers(*tx, rows), "replace cached suppliers");
      last_sync_->Set(*tx, kind, now);
      tx->Commit();
      return rows.size();
    }
    case ReferenceKind::kProducts: {
      auto rows = api_->GetProducts();
      if (rows.empty()) throw EmptyRemoteSet();
      auto tx = repository_->Begin();
      db::ThrowIfDbError(repository_->ReplaceProducts(*tx, rows), "replace cached products");
      last_sync_->Set(*tx, kind, now);
      tx->Commit();
      return rows.size();
    }
    case ReferenceKind::kLocations: {
      auto rows = api_->GetLocations();
      if (rows.empty()) throw EmptyRemoteSet();
      auto tx = repository_->Begin();
      db::ThrowIfDbError(repository_->ReplaceLocations(*tx, rows), "replace cached locations");
      last_sync_->Set(*tx, kind, now);
      tx->Commit();
      return rows.size();
    }
  }
  throw std::invalid_argument("unknown reference kind");
}

std::vector<RefreshResult> ReferenceCacheManager::RefreshAllIfStale() {
  std::vector<std::future<RefreshResult>> pending;
  for (auto kind : kAllKinds) {
    pending.push_back(std::async(std::launch::async, [this, kind] { return RefreshIfStale(kind); }));
  }
  std::vector<RefreshResult> results;
  for (auto& f : pending) results.push_back(f.get());
  return results;
}

std::vector<RefreshResult> ReferenceCacheManager::RefreshAllIfStale(std::chrono::milliseconds max_age) {
  std::vector<std::future<RefreshResult>> pending;
  for (auto kind : kAllKinds) {
    pending.push_back(std::async(std::launch::async, [this, kind, max_age] { return RefreshIfStale(kind, max_age); }));
  }
  std::vector<RefreshResult> results;
  for (auto& f : pending) results.push_back(f.get());
  return results;
}

std::vector<db::model::SupplierRecord> ReferenceCacheManager::SearchSuppliers(const std::string& term) {
  auto tx   = repository_->Begin();
  auto rows = repository_->SearchSuppliers(*tx, term);
  tx->Commit();
  return rows;
}

std::vector<db::model::ProductRecord> ReferenceCacheManager::SearchProducts(const std::string& term) {
  auto tx   = repository_->Begin();
  auto rows = repository_->SearchProducts(*tx, term);
  tx->Commit();
  return rows;
}

std::vector<db::model::LocationRecord> ReferenceCacheManager::SearchLocations(const std::string& term) {
  auto tx   = repository_->Begin();
  auto rows = repository_->SearchLocations(*tx, term);
  tx->Commit();
  return rows;
}

std::vector<CacheStats> ReferenceCacheManager::Stats() {
  std::vector<CacheStats> out;
  auto                    tx = repository_->Begin();
  for (auto kind : kAllKinds) {
    CacheStats s;
    s.kind      = kind;
    s.count     = repository_->CountReference(*tx, kind);
    s.last_sync = last_sync_->Get(*tx, kind);
    out.push_back(s);
  }
  tx->Commit();
  return out;
}

void ReferenceCacheManager::Clear() {
  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->ClearReferenceCaches(*tx), "clear reference caches");
  for (auto kind : kAllKinds) last_sync_->Clear(*tx, kind);
  tx->Commit();
  PURCHASE_LOG_INFO("reference caches cleared");
}

} // namespace purchase::cache
