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

namespace purchase::core {

// Caller-supplied purchase content; ids and sync state are ignored.
struct PurchaseDraft {
  db::model::PurchaseHeaderRecord                header;
  std::vector<db::model::PurchaseLineRecord>     lines;
  std::vector<db::model::PurchasePaymentRecord>  payments;
};

struct PurchaseDetail {
  db::model::PurchaseHeaderRecord               header;
  std::vector<db::model::PurchaseLineRecord>    lines;
  std::vector<db::model::PurchasePaymentRecord> payments;
};

/*
  Local purchase operations.

  Writes land in the local store unsynced and are pushed later by the
  sync engine. Deleting or changing the status of a purchase the remote
  already knows goes to the remote first.

  Errors: util::InvalidArgument for bad drafts, util::NotFound,
  util::InvalidState, util::StoreError from the store and
  remote::RemoteError from remote calls.
*/
class PurchaseService {
 public:
  PurchaseService(std::shared_ptr<db::Repository> repository, std::shared_ptr<remote::PurchaseApi> api,
                  std::shared_ptr<net::ConnectivityProbe> connectivity, std::shared_ptr<net::AuthProvider> auth,
                  std::shared_ptr<sync::HeaderLocks> locks);

  // returns the new local id
  std::int64_t CreatePurchase(PurchaseDraft draft);

  void UpdatePurchase(std::int64_t local_id, PurchaseDraft draft);

  PurchaseDetail GetPurchase(std::int64_t local_id);

  void DeletePurchase(std::int64_t local_id);

  void UpdateStatus(std::int64_t local_id, db::model::PurchaseStatus status);

  // true when the supplier already has a purchase with this reference remotely
  bool CheckReferenceNumber(std::int64_t supplier_id, const std::string& ref_no);

  static void Validate(const PurchaseDraft& draft);

 private:
  void RequireRemote(const char* operation);

  std::shared_ptr<db::Repository>         repository_;
  std::shared_ptr<remote::PurchaseApi>    api_;
  std::shared_ptr<net::ConnectivityProbe> connectivity_;
  std::shared_ptr<net::AuthProvider>      auth_;
  std::shared_ptr<sync::HeaderLocks>      locks_;
};

} // namespace purchase::core
