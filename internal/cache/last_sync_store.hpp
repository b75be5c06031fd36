#pragma once

#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace purchase::cache {

/*
  Per-kind last refresh timestamps, kept in the system key/value table
  as ISO-8601 UTC text under "<kind>_last_sync".
*/
class LastSyncStore {
 public:
  explicit LastSyncStore(std::shared_ptr<db::Repository> repository);

  static std::string Key(db::model::ReferenceKind kind);

  // nullopt when never refreshed or the stored value does not parse
  std::optional<util::TimePoint> Get(db::model::ReferenceKind kind);
  std::optional<util::TimePoint> Get(db::Transaction& tx, db::model::ReferenceKind kind);

  void Set(db::model::ReferenceKind kind, util::TimePoint when);
  void Set(db::Transaction& tx, db::model::ReferenceKind kind, util::TimePoint when);

  void Clear(db::model::ReferenceKind kind);
  void Clear(db::Transaction& tx, db::model::ReferenceKind kind);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace purchase::cache
