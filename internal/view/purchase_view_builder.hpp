#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/net/probes.hpp"
#include "internal/remote/purchase_api.hpp"
#include "internal/sync/header_locks.hpp"

namespace purchase::cache {
class ReferenceCacheManager;
}

namespace purchase::view {

enum class Origin { kRemote, kLocal };

const char* ToString(Origin origin);

// One row of the merged listing.
struct PurchaseSummary {
  Origin                      origin = Origin::kRemote;
  std::optional<std::int64_t> local_id;
  std::optional<std::int64_t> remote_id;
  std::int64_t                supplier_id = 0;
  std::int64_t                location_id = 0;
  std::optional<std::string>  ref_no;
  std::string                 status;
  std::string                 payment_status;
  std::string                 transaction_date;
  double                      final_total = 0.0;
  std::string                 supplier_name;
  bool                        synced = true;
};

struct PurchaseListing {
  std::vector<PurchaseSummary> entries;
  std::int64_t                 current_page = 1;
  std::int64_t                 last_page    = 1;
  std::int64_t                 per_page     = 0;
  std::int64_t                 total        = 0;
  // false when the remote listing was unavailable and only local rows are shown
  bool from_remote = false;
};

struct ReconcileResult {
  bool                                online = false;
  std::vector<remote::RemotePurchase> found;
  std::vector<std::int64_t>           pruned_local_ids;
};

/*
  Builds the single "local + remote" purchase listing.

  Online, the remote page comes first and every local header it does
  not already represent is appended; offline or on any remote failure
  the listing is local-only. Entries are unique by remote id.
*/
class PurchaseViewBuilder {
 public:
  PurchaseViewBuilder(std::shared_ptr<db::Repository> repository, std::shared_ptr<remote::PurchaseApi> api,
                      std::shared_ptr<cache::ReferenceCacheManager> cache, std::shared_ptr<net::ConnectivityProbe> connectivity,
                      std::shared_ptr<net::AuthProvider> auth, std::shared_ptr<sync::HeaderLocks> locks);

  PurchaseListing List(const remote::PurchaseListFilter& filter);

  // Looks up remote_ids remotely and deletes synced local copies of the ones that are gone.
  ReconcileResult ReconcileSpecified(const std::vector<std::int64_t>& remote_ids);

 private:
  PurchaseListing LocalOnly(const remote::PurchaseListFilter& filter, std::vector<db::model::PurchaseHeaderRecord> headers);

  std::vector<PurchaseSummary> LocalEntries(const remote::PurchaseListFilter&                  filter,
                                            const std::vector<db::model::PurchaseHeaderRecord>& headers);

  std::shared_ptr<db::Repository>               repository_;
  std::shared_ptr<remote::PurchaseApi>          api_;
  std::shared_ptr<cache::ReferenceCacheManager> cache_;
  std::shared_ptr<net::ConnectivityProbe>       connectivity_;
  std::shared_ptr<net::AuthProvider>            auth_;
  std::shared_ptr<sync::HeaderLocks>            locks_;
};

} // namespace purchase::view
