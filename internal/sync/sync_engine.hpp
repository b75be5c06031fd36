#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/net/probes.hpp"
#include "internal/remote/purchase_api.hpp"
#include "internal/remote/remote_error.hpp"
#include "internal/sync/header_locks.hpp"

namespace purchase::sync {

struct HeaderFailure {
  std::int64_t local_id = 0;
  // nullopt for local failures (no line items, store errors)
  std::optional<remote::FailureKind> kind;
  std::string                        message;
  remote::FieldErrors                field_errors;
};

struct SyncReport {
  std::size_t attempted = 0;
  std::size_t synced    = 0;
  std::size_t failed    = 0;

  bool offline       = false;
  bool auth_required = false;
  bool cancelled     = false;

  std::vector<HeaderFailure> failures;
};

/*
  Pushes unsynced purchase headers to the remote service.

  Headers are processed one at a time, oldest first. Each push and the
  write that records its outcome run under the header's lock, so a local
  edit cannot land between the remote call and MarkSynced. The store
  transaction is never held across a network call.

  Per-header failures are collected in the report and the run moves on;
  an authentication failure stops the run.
*/
class SyncEngine {
 public:
  SyncEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<remote::PurchaseApi> api,
             std::shared_ptr<net::ConnectivityProbe> connectivity, std::shared_ptr<net::AuthProvider> auth,
             std::shared_ptr<HeaderLocks> locks);

  // cancel is polled between headers only
  SyncReport Run(const std::atomic<bool>* cancel = nullptr);

  std::int64_t PendingCount();

 private:
  enum class PushResult { kSynced, kGone, kNoLines };

  PushResult Push(std::int64_t local_id);
  void       KeepRemoteId(db::model::PurchaseHeaderRecord header, std::int64_t remote_id);

  std::shared_ptr<db::Repository>         repository_;
  std::shared_ptr<remote::PurchaseApi>    api_;
  std::shared_ptr<net::ConnectivityProbe> connectivity_;
  std::shared_ptr<net::AuthProvider>      auth_;
  std::shared_ptr<HeaderLocks>            locks_;
};

} // namespace purchase::sync
