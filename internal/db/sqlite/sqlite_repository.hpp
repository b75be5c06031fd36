#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace purchase::db::sqlite {

class SqliteRepository final : public Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertHeader(Transaction& tx, model::PurchaseHeaderRecord& record) override;
  std::optional<model::PurchaseHeaderRecord> GetHeader(Transaction& tx, std::int64_t local_id) override;
  std::optional<model::PurchaseHeaderRecord> GetHeaderByRemoteId(Transaction& tx, std::int64_t remote_id) override;
  Result UpdateHeader(Transaction& tx, const model::PurchaseHeaderRecord& record) override;
  Result DeleteHeader(Transaction& tx, std::int64_t local_id) override;
  std::vector<model::PurchaseHeaderRecord> ListHeaders(Transaction& tx) override;
  std::vector<model::PurchaseHeaderRecord> ListUnsyncedHeaders(Transaction& tx) override;
  std::vector<std::int64_t> ListRemoteIds(Transaction& tx) override;
  Result MarkSynced(Transaction& tx, std::int64_t local_id, std::int64_t remote_id) override;

  Result InsertLine(Transaction& tx, model::PurchaseLineRecord& record) override;
  std::vector<model::PurchaseLineRecord> GetLines(Transaction& tx, std::int64_t purchase_id) override;
  Result UpdateLine(Transaction& tx, const model::PurchaseLineRecord& record) override;
  Result DeleteLine(Transaction& tx, std::int64_t line_id) override;
  Result DeleteLinesByPurchase(Transaction& tx, std::int64_t purchase_id) override;
  std::int64_t CountLines(Transaction& tx, std::int64_t purchase_id) override;

  Result InsertPayment(Transaction& tx, model::PurchasePaymentRecord& record) override;
  std::vector<model::PurchasePaymentRecord> GetPayments(Transaction& tx, std::int64_t purchase_id) override;
  Result DeletePayment(Transaction& tx, std::int64_t payment_id) override;
  Result DeletePaymentsByPurchase(Transaction& tx, std::int64_t purchase_id) override;

  Result ReplaceSuppliers(Transaction& tx, const std::vector<model::SupplierRecord>& rows) override;
  Result ReplaceProducts(Transaction& tx, const std::vector<model::ProductRecord>& rows) override;
  Result ReplaceLocations(Transaction& tx, const std::vector<model::LocationRecord>& rows) override;
  std::vector<model::SupplierRecord> SearchSuppliers(Transaction& tx, const std::string& term) override;
  std::vector<model::ProductRecord> SearchProducts(Transaction& tx, const std::string& term) override;
  std::vector<model::LocationRecord> SearchLocations(Transaction& tx, const std::string& term) override;
  std::int64_t CountReference(Transaction& tx, model::ReferenceKind kind) override;
  Result ClearReferenceCaches(Transaction& tx) override;

  std::optional<std::string> GetSystemValue(Transaction& tx, const std::string& key) override;
  Result PutSystemValue(Transaction& tx, const std::string& key, const std::string& value) override;
  Result DeleteSystemValue(Transaction& tx, const std::string& key) override;

 private:
  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
};

} // namespace purchase::db::sqlite
