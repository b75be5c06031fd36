#pragma once

namespace purchase::sync {

/*
  A queued background request.
*/
struct SyncTask {
  enum class Kind {
    kPushPurchases,
    kRefreshReferenceData,
  };

  Kind kind = Kind::kPushPurchases;

  // refresh only: ignore staleness and refetch
  bool force = false;
};

} // namespace purchase::sync
