#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/cache/last_sync_store.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/net/probes.hpp"
#include "internal/remote/purchase_api.hpp"

namespace purchase::cache {

enum class RefreshOutcome {
  kRefreshed,
  kSkippedFresh,
  // offline, unauthenticated, remote failure or empty remote set; cache untouched
  kFailedKeptStale,
};

const char* ToString(RefreshOutcome outcome);

struct RefreshResult {
  db::model::ReferenceKind kind    = db::model::ReferenceKind::kSuppliers;
  RefreshOutcome           outcome = RefreshOutcome::kSkippedFresh;
  std::size_t              rows    = 0;
  std::string              detail;
};

struct CacheMaxAges {
  std::chrono::milliseconds suppliers = std::chrono::hours(24);
  std::chrono::milliseconds products  = std::chrono::hours(24);
  std::chrono::milliseconds locations = std::chrono::hours(24);

  std::chrono::milliseconds For(db::model::ReferenceKind kind) const;
};

struct CacheStats {
  db::model::ReferenceKind       kind  = db::model::ReferenceKind::kSuppliers;
  std::int64_t                   count = 0;
  std::optional<util::TimePoint> last_sync;
};

/*
  Staleness-gated refresh of the supplier, product and location caches.

  Refresh never throws: every failure degrades to kFailedKeptStale and
  the previous snapshot stays in place. A successful refresh replaces the
  table and stamps the last sync time in one transaction.
*/
class ReferenceCacheManager {
 public:
  ReferenceCacheManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<LastSyncStore> last_sync,
                        std::shared_ptr<remote::PurchaseApi> api, std::shared_ptr<net::ConnectivityProbe> connectivity,
                        std::shared_ptr<net::AuthProvider> auth, CacheMaxAges max_ages = {});

  RefreshResult RefreshIfStale(db::model::ReferenceKind kind);
  RefreshResult RefreshIfStale(db::model::ReferenceKind kind, std::chrono::milliseconds max_age);

  // all three kinds; remote fetches run concurrently
  std::vector<RefreshResult> RefreshAllIfStale();
  std::vector<RefreshResult> RefreshAllIfStale(std::chrono::milliseconds max_age);

  bool IsStale(db::model::ReferenceKind kind, std::chrono::milliseconds max_age);

  std::vector<db::model::SupplierRecord> SearchSuppliers(const std::string& term);
  std::vector<db::model::ProductRecord>  SearchProducts(const std::string& term);
  std::vector<db::model::LocationRecord> SearchLocations(const std::string& term);

  std::vector<CacheStats> Stats();

  // empties the three tables and forgets their timestamps
  void Clear();

  const CacheMaxAges& MaxAges() const {
    return max_ages_;
  }

 private:
  RefreshResult Refresh(db::model::ReferenceKind kind, std::chrono::milliseconds max_age);
  std::size_t   FetchAndReplace(db::model::ReferenceKind kind);

  std::shared_ptr<db::Repository>         repository_;
  std::shared_ptr<LastSyncStore>          last_sync_;
  std::shared_ptr<remote::PurchaseApi>    api_;
  std::shared_ptr<net::ConnectivityProbe> connectivity_;
  std::shared_ptr<net::AuthProvider>      auth_;
  CacheMaxAges                            max_ages_;
};

} // namespace purchase::cache
