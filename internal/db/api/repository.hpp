#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/purchase_header_record.hpp"
#include "internal/db/model/purchase_line_record.hpp"
#include "internal/db/model/purchase_payment_record.hpp"
#include "internal/db/model/reference_records.hpp"

namespace purchase::db {

/*
  Local store contract.

  Every call runs inside a Transaction obtained from Begin(). Mutations
  report failures through Result; lookups return nullopt / empty when
  nothing matches.
*/
class Repository {
 public:
  virtual ~Repository() = default;

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ------------------------------------------------------------------
  // Purchase headers
  // ------------------------------------------------------------------

  // assigns record.local_id on success
  virtual Result InsertHeader(Transaction& tx, model::PurchaseHeaderRecord& record) = 0;

  virtual std::optional<model::PurchaseHeaderRecord> GetHeader(Transaction& tx, std::int64_t local_id) = 0;

  virtual std::optional<model::PurchaseHeaderRecord> GetHeaderByRemoteId(Transaction& tx, std::int64_t remote_id) = 0;

  virtual Result UpdateHeader(Transaction& tx, const model::PurchaseHeaderRecord& record) = 0;

  // lines, then payments, then the header row
  virtual Result DeleteHeader(Transaction& tx, std::int64_t local_id) = 0;

  // newest first
  virtual std::vector<model::PurchaseHeaderRecord> ListHeaders(Transaction& tx) = 0;

  // oldest first, the order they are pushed
  virtual std::vector<model::PurchaseHeaderRecord> ListUnsyncedHeaders(Transaction& tx) = 0;

  virtual std::vector<std::int64_t> ListRemoteIds(Transaction& tx) = 0;

  virtual Result MarkSynced(Transaction& tx, std::int64_t local_id, std::int64_t remote_id) = 0;

  // ------------------------------------------------------------------
  // Purchase lines
  // ------------------------------------------------------------------

  virtual Result InsertLine(Transaction& tx, model::PurchaseLineRecord& record) = 0;

  virtual std::vector<model::PurchaseLineRecord> GetLines(Transaction& tx, std::int64_t purchase_id) = 0;

  virtual Result UpdateLine(Transaction& tx, const model::PurchaseLineRecord& record) = 0;

  virtual Result DeleteLine(Transaction& tx, std::int64_t line_id) = 0;

  virtual Result DeleteLinesByPurchase(Transaction& tx, std::int64_t purchase_id) = 0;

  virtual std::int64_t CountLines(Transaction& tx, std::int64_t purchase_id) = 0;

  // ------------------------------------------------------------------
  // Purchase payments
  // ------------------------------------------------------------------

  virtual Result InsertPayment(Transaction& tx, model::PurchasePaymentRecord& record) = 0;

  virtual std::vector<model::PurchasePaymentRecord> GetPayments(Transaction& tx, std::int64_t purchase_id) = 0;

  virtual Result DeletePayment(Transaction& tx, std::int64_t payment_id) = 0;

  virtual Result DeletePaymentsByPurchase(Transaction& tx, std::int64_t purchase_id) = 0;

  // ------------------------------------------------------------------
  // Reference caches (clear-then-repopulate)
  // ------------------------------------------------------------------

  virtual Result ReplaceSuppliers(Transaction& tx, const std::vector<model::SupplierRecord>& rows) = 0;
  virtual Result ReplaceProducts(Transaction& tx, const std::vector<model::ProductRecord>& rows)   = 0;
  virtual Result ReplaceLocations(Transaction& tx, const std::vector<model::LocationRecord>& rows) = 0;

  // case-insensitive substring match, ascending by name; empty term lists everything
  virtual std::vector<model::SupplierRecord> SearchSuppliers(Transaction& tx, const std::string& term) = 0;
  virtual std::vector<model::ProductRecord>  SearchProducts(Transaction& tx, const std::string& term)  = 0;
  virtual std::vector<model::LocationRecord> SearchLocations(Transaction& tx, const std::string& term) = 0;

  virtual std::int64_t CountReference(Transaction& tx, model::ReferenceKind kind) = 0;

  virtual Result ClearReferenceCaches(Transaction& tx) = 0;

  // ------------------------------------------------------------------
  // System key/value
  // ------------------------------------------------------------------

  virtual std::optional<std::string> GetSystemValue(Transaction& tx, const std::string& key) = 0;

  virtual Result PutSystemValue(Transaction& tx, const std::string& key, const std::string& value) = 0;

  virtual Result DeleteSystemValue(Transaction& tx, const std::string& key) = 0;
};

} // namespace purchase::db
