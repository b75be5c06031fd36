#include "last_sync_store.hpp"

#include "internal/db/api/db_error.hpp"
#include "internal/observability/logging.hpp"

namespace purchase::cache {

LastSyncStore::LastSyncStore(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

std::string LastSyncStore::Key(db::model::ReferenceKind kind) {
  return std::string(db::model::ToString(kind)) + "_last_sync";
}

std::optional<util::TimePoint> LastSyncStore::Get(db::model::ReferenceKind kind) {
  auto tx    = repository_->Begin();
  auto value = Get(*tx, kind);
  tx->Commit();
  return value;
}

std::optional<util::TimePoint> LastSyncStore::Get(db::Transaction& tx, db::model::ReferenceKind kind) {
  auto text = repository_->GetSystemValue(tx, Key(kind));
  if (!text) return std::nullopt;

  auto parsed = util::ParseIso8601(*text);
  if (!parsed) {
    PURCHASE_LOG_WARN("unparsable last sync timestamp; treating cache as stale",
                      {observability::StringField("key", Key(kind)), observability::StringField("value", *text)});
  }
  return parsed;
}

void LastSyncStore::Set(db::model::ReferenceKind kind, util::TimePoint when) {
  auto tx = repository_->Begin();
  Set(*tx, kind, when);
  tx->Commit();
}

void LastSyncStore::Set(db::Transaction& tx, db::model::ReferenceKind kind, util::TimePoint when) {
  db::ThrowIfDbError(repository_->PutSystemValue(tx, Key(kind), util::FormatIso8601(when)), "store " + Key(kind));
}

void LastSyncStore::Clear(db::model::ReferenceKind kind) {
  auto tx = repository_->Begin();
  Clear(*tx, kind);
  tx->Commit();
}

void LastSyncStore::Clear(db::Transaction& tx, db::model::ReferenceKind kind) {
  db::ThrowIfDbError(repository_->DeleteSystemValue(tx, Key(kind)), "clear " + Key(kind));
}

} // namespace purchase::cache
