#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/time.hpp"

namespace purchase::db::sqlite {

using purchase::db::ErrorCode;
using purchase::db::Result;

namespace {

using Stmt = std::unique_ptr<sqlite3_stmt, int (*)(sqlite3_stmt*)>;

Stmt PrepareStmt(sqlite3* db, const char* sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
        sqlite3_finalize(st);
        return Stmt(nullptr, sqlite3_finalize);
    }
    return Stmt(st, sqlite3_finalize);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
    if (s) BindText(st, idx, *s);
    else sqlite3_bind_null(st, idx);
}

void BindI64(sqlite3_stmt* st, int idx, std::int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindOptI64(sqlite3_stmt* st, int idx, const std::optional<std::int64_t>& v) {
    if (v) BindI64(st, idx, *v);
    else sqlite3_bind_null(st, idx);
}

void BindDouble(sqlite3_stmt* st, int idx, double v) {
    sqlite3_bind_double(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
    if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
    return ColText(st, col);
}

std::int64_t ColI64(sqlite3_stmt* st, int col) {
    return static_cast<std::int64_t>(sqlite3_column_int64(st, col));
}

std::optional<std::int64_t> ColOptI64(sqlite3_stmt* st, int col) {
    if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
    return ColI64(st, col);
}

double ColDouble(sqlite3_stmt* st, int col) {
    return sqlite3_column_double(st, col);
}

// %term% with LIKE wildcards in the term taken literally (ESCAPE '\')
std::string LikePattern(const std::string& term) {
    std::string out = "%";
    for (char c : term) {
        if (c == '%' || c == '_' || c == '\\') out.push_back('\\');
        out.push_back(c);
    }
    out.push_back('%');
    return out;
}

void BindHeaderFields(sqlite3_stmt* st, const model::PurchaseHeaderRecord& r) {
    BindOptI64(st, 1, r.remote_id);
    BindI64(st, 2, r.supplier_id);
    BindI64(st, 3, r.location_id);
    BindOptText(st, 4, r.ref_no);
    BindText(st, 5, model::ToString(r.status));
    BindText(st, 6, r.transaction_date);
    BindDouble(st, 7, r.total_before_tax);
    BindDouble(st, 8, r.discount_amount);
    BindText(st, 9, model::ToString(r.discount_type));
    BindOptI64(st, 10, r.tax_id);
    BindDouble(st, 11, r.tax_amount);
    BindDouble(st, 12, r.shipping_charges);
    BindText(st, 13, r.shipping_details);
    BindDouble(st, 14, r.final_total);
    BindText(st, 15, r.additional_notes);
    BindI64(st, 16, static_cast<std::int64_t>(r.sync_state));
}

model::PurchaseHeaderRecord ReadHeader(sqlite3_stmt* st) {
    model::PurchaseHeaderRecord r;
    r.local_id         = ColI64(st, 0);
    r.remote_id        = ColOptI64(st, 1);
    r.supplier_id      = ColI64(st, 2);
    r.location_id      = ColI64(st, 3);
    r.ref_no           = ColOptText(st, 4);
    r.status           = model::ParsePurchaseStatus(ColText(st, 5)).value_or(model::PurchaseStatus::kOrdered);
    r.transaction_date = ColText(st, 6);
    r.total_before_tax = ColDouble(st, 7);
    r.discount_amount  = ColDouble(st, 8);
    r.discount_type    = model::ParseDiscountType(ColText(st, 9)).value_or(model::DiscountType::kFixed);
    r.tax_id           = ColOptI64(st, 10);
    r.tax_amount       = ColDouble(st, 11);
    r.shipping_charges = ColDouble(st, 12);
    r.shipping_details = ColText(st, 13);
    r.final_total      = ColDouble(st, 14);
    r.additional_notes = ColText(st, 15);
    r.sync_state       = ColI64(st, 16) == 1 ? model::SyncState::kSynced : model::SyncState::kUnsynced;
    return r;
}

void BindLineFields(sqlite3_stmt* st, const model::PurchaseLineRecord& r) {
    BindI64(st, 1, r.purchase_id);
    BindI64(st, 2, r.product_id);
    BindI64(st, 3, r.variation_id);
    BindDouble(st, 4, r.quantity);
    BindDouble(st, 5, r.unit_price);
    BindDouble(st, 6, r.line_discount_amount);
    BindText(st, 7, model::ToString(r.line_discount_type));
    BindOptI64(st, 8, r.item_tax_id);
    BindDouble(st, 9, r.item_tax);
    BindOptI64(st, 10, r.sub_unit_id);
    BindText(st, 11, r.lot_number);
    BindText(st, 12, r.mfg_date);
    BindText(st, 13, r.exp_date);
    BindOptI64(st, 14, r.purchase_order_line_id);
    BindOptI64(st, 15, r.purchase_requisition_line_id);
}

model::PurchaseLineRecord ReadLine(sqlite3_stmt* st) {
    model::PurchaseLineRecord r;
    r.id                           = ColI64(st, 0);
    r.purchase_id                  = ColI64(st, 1);
    r.product_id                   = ColI64(st, 2);
    r.variation_id                 = ColI64(st, 3);
    r.quantity                     = ColDouble(st, 4);
    r.unit_price                   = ColDouble(st, 5);
    r.line_discount_amount         = ColDouble(st, 6);
    r.line_discount_type           = model::ParseDiscountType(ColText(st, 7)).value_or(model::DiscountType::kFixed);
    r.item_tax_id                  = ColOptI64(st, 8);
    r.item_tax                     = ColDouble(st, 9);
    r.sub_unit_id                  = ColOptI64(st, 10);
    r.lot_number                   = ColText(st, 11);
    r.mfg_date                     = ColText(st, 12);
    r.exp_date                     = ColText(st, 13);
    r.purchase_order_line_id       = ColOptI64(st, 14);
    r.purchase_requisition_line_id = ColOptI64(st, 15);
    return r;
}

Result PrepareError(sqlite3* db) {
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
        case SQLITE_FULL:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
        case SQLITE_NOTADB:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

namespace {

Result StepById(sqlite3* db, const char* sql, std::int64_t id, Result (*translate)(sqlite3*, int)) {
    auto st = PrepareStmt(db, sql);
    if (!st) return PrepareError(db);
    BindI64(st.get(), 1, id);
    return translate(db, sqlite3_step(st.get()));
}

} // namespace

// ------------------------------------------------------------------
// Purchase headers
// ------------------------------------------------------------------

Result SqliteRepository::InsertHeader(Transaction& t, model::PurchaseHeaderRecord& r) {
    auto* db = TX(t).Handle();

    if (r.sync_state == model::SyncState::kSynced && !r.remote_id)
        return Result::Err(ErrorCode::ConstraintViolation, "synced purchase requires a remote id");

    auto st = PrepareStmt(db, sql::INSERT_HEADER);
    if (!st) return PrepareError(db);

    BindHeaderFields(st.get(), r);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);

    r.local_id = static_cast<std::int64_t>(sqlite3_last_insert_rowid(db));
    return Result::Ok();
}

std::optional<model::PurchaseHeaderRecord>
SqliteRepository::GetHeader(Transaction& t, std::int64_t local_id) {
    auto* db = TX(t).Handle();

    auto st = PrepareStmt(db, sql::SELECT_HEADER);
    if (!st) return std::nullopt;

    BindI64(st.get(), 1, local_id);
    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
    return ReadHeader(st.get());
}

std::optional<model::PurchaseHeaderRecord>
SqliteRepository::GetHeaderByRemoteId(Transaction& t, std::int64_t remote_id) {
    auto* db = TX(t).Handle();

    auto st = PrepareStmt(db, sql::SELECT_HEADER_BY_REMOTE_ID);
    if (!st) return std::nullopt;

    BindI64(st.get(), 1, remote_id);
    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
    return ReadHeader(st.get());
}

Result SqliteRepository::UpdateHeader(Transaction& t, const model::PurchaseHeaderRecord& r) {
    auto* db = TX(t).Handle();

    if (r.sync_state == model::SyncState::kSynced && !r.remote_id)
        return Result::Err(ErrorCode::ConstraintViolation, "synced purchase requires a remote id");

    auto st = PrepareStmt(db, sql::UPDATE_HEADER);
    if (!st) return PrepareError(db);

    BindHeaderFields(st.get(), r);
    BindI64(st.get(), 17, r.local_id);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "purchase " + std::to_string(r.local_id));
    return Result::Ok();
}

Result SqliteRepository::DeleteHeader(Transaction& t, std::int64_t local_id) {
    auto* db = TX(t).Handle();

    // children first so an interrupted delete never leaves orphans
    if (auto r = StepById(db, sql::DELETE_LINES_BY_PURCHASE, local_id, &Translate); !r) return r;
    if (auto r = StepById(db, sql::DELETE_PAYMENTS_BY_PURCHASE, local_id, &Translate); !r) return r;
    if (auto r = StepById(db, sql::DELETE_HEADER, local_id, &Translate); !r) return r;

    if (sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "purchase " + std::to_string(local_id));
    return Result::Ok();
}

std::vector<model::PurchaseHeaderRecord> SqliteRepository::ListHeaders(Transaction& t) {
    std::vector<model::PurchaseHeaderRecord> out;
    auto* db = TX(t).Handle();

    auto st = PrepareStmt(db, sql::SELECT_ALL_HEADERS);
    if (!st) return out;

    while (sqlite3_step(st.get()) == SQLITE_ROW) out.push_back(ReadHeader(st.get()));
    return out;
}

std::vector<model::PurchaseHeaderRecord> SqliteRepository::ListUnsyncedHeaders(Transaction& t) {
    std::vector<model::PurchaseHeaderRecord> out;
    auto* db = TX(t).Handle();

    auto st = PrepareStmt(db, sql::SELECT_UNSYNCED_HEADERS);
    if (!st) return out;

    while (sqlite3_step(st.get()) == SQLITE_ROW) out.push_back(ReadHeader(st.get()));
    return out;
}

std::vector<std::int64_t> SqliteRepository::ListRemoteIds(Transaction& t) {
    std::vector<std::int64_t> out;
    auto* db = TX(t).Handle();

    auto st = PrepareStmt(db, sql::SELECT_REMOTE_IDS);
    if (!st) return out;

    while (sqlite3_step(st.get()) == SQLITE_ROW) out.push_back(ColI64(st.get(), 0));
    return out;
}

Result SqliteRepository::MarkSynced(Transaction& t, std::int64_t local_id, std::int64_t remote_id) {
    auto* db = TX(t).Handle();

    auto st = PrepareStmt(db, sql::MARK_HEADER_SYNCED);
    if (!st) return PrepareError(db);

    BindI64(st.get(), 1, remote_id);
    BindI64(st.get(), 2, local_id);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "purchase " + std::to_string(local_id));
    return Result::Ok();
}

// ------------------------------------------------------------------
// Purchase lines
// ------------------------------------------------------------------

Result SqliteRepository::InsertLine(Transaction& t, model::PurchaseLineRecord& r) {
    auto* db = TX(t).Handle();

    auto st = PrepareStmt(db, sql::INSERT_LINE);
    if (!st) return PrepareError(db);

    BindLineFields(st.get(), r);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);

    r.id = static_cast<std::int64_t>(sqlite3_last_insert_rowid(db));
    return Result::Ok();
}

std::vector<model::PurchaseLineRecord> SqliteRepository::GetLines(Transaction& t, std::int64_t purchase_id) {
    std::vector<model::PurchaseLineRecord> out;
    auto* db = TX(t).Handle();

    auto st = PrepareStmt(db, sql::SELECT_LINES);
    if (!st) return out;

    BindI64(st.get(), 1, purchase_id);
    while (sqlite3_step(st.get()) == SQLITE_ROW) out.push_back(ReadLine(st.get()));
    return out;
}

Result SqliteRepository::UpdateLine(Transaction& t, const model::PurchaseLineRecord& r) {
    auto* db = TX(t).Handle();

    auto st = PrepareStmt(db, sql::UPDATE_LINE);
    if (!st) return PrepareError(db);

    BindLineFields(st.get(), r);
    BindI64(st.get(), 16, r.id);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "purchase line " + std::to_string(r.id));
    return Result::Ok();
}

Result SqliteRepository::DeleteLine(Transaction& t, std::int64_t line_id) {
    return StepById(TX(t).Handle(), sql::DELETE_LINE, line_id, &Translate);
}

Result SqliteRepository::DeleteLinesByPurchase(Transaction& t, std::int64_t purchase_id) {
    return StepById(TX(t).Handle(), sql::DELETE_LINES_BY_PURCHASE, purchase_id, &Translate);
}

std::int64_t SqliteRepository::CountLines(Transaction& t, std::int64_t purchase_id) {
    auto* db = TX(t).Handle();

    auto st = PrepareStmt(db, sql::COUNT_LINES);
    if (!st) return 0;

    BindI64(st.get(), 1, purchase_id);
    if (sqlite3_step(st.get()) != SQLITE_ROW) return 0;
    return ColI64(st.get(), 0);
}

// ------------------------------------------------------------------
// Purchase payments
// ------------------------------------------------------------------

Result SqliteRepository::InsertPayment(Transaction& t, model::PurchasePaymentRecord& r) {
    auto* db = TX(t).Handle();

    auto st = PrepareStmt(db, sql::INSERT_PAYMENT);
    if (!st) return PrepareError(db);

    BindI64(st.get(), 1, r.purchase_id);
    BindOptI64(st.get(), 2, r.remote_payment_id);
    BindText(st.get(), 3, r.method);
    BindDouble(st.get(), 4, r.amount);
    BindText(st.get(), 5, r.note);
    BindOptI64(st.get(), 6, r.account_id);
    BindText(st.get(), 7, r.paid_on);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);

    r.id = static_cast<std::int64_t>(sqlite3_last_insert_rowid(db));
    return Result::Ok();
}

std::vector<model::PurchasePaymentRecord> SqliteRepository::GetPayments(Transaction& t, std::int64_t purchase_id) {
    std::vector<model::PurchasePaymentRecord> out;
    auto* db = TX(t).Handle();

    auto st = PrepareStmt(db, sql::SELECT_PAYMENTS);
    if (!st) return out;

    BindI64(st.get(), 1, purchase_id);
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        model::PurchasePaymentRecord r;
        r.id                = ColI64(st.get(), 0);
        r.purchase_id       = ColI64(st.get(), 1);
        r.remote_payment_id = ColOptI64(st.get(), 2);
        r.method            = ColText(st.get(), 3);
        r.amount            = ColDouble(st.get(), 4);
        r.note              = ColText(st.get(), 5);
        r.account_id        = ColOptI64(st.get(), 6);
        r.paid_on           = ColText(st.get(), 7);
        out.push_back(std::move(r));
    }
    return out;
}

Result SqliteRepository::DeletePayment(Transaction& t, std::int64_t payment_id) {
    return StepById(TX(t).Handle(), sql::DELETE_PAYMENT, payment_id, &Translate);
}

Result SqliteRepository::DeletePaymentsByPurchase(Transaction& t, std::int64_t purchase_id) {
    return StepById(TX(t).Handle(), sql::DELETE_PAYMENTS_BY_PURCHASE, purchase_id, &Translate);
}

// ------------------------------------------------------------------
// Reference caches
// ------------------------------------------------------------------

Result SqliteRepository::ReplaceSuppliers(Transaction& t, const std::vector<model::SupplierRecord>& rows) {
    auto* db = TX(t).Handle();

    int rc = sqlite3_exec(db, "DELETE FROM cached_suppliers;", nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) return Translate(db, rc);

    auto st = PrepareStmt(db, sql::INSERT_SUPPLIER);
    if (!st) return PrepareError(db);

    const auto stamp = util::FormatIso8601(util::Now());
    for (const auto& r : rows) {
        sqlite3_reset(st.get());
        sqlite3_clear_bindings(st.get());
        BindI64(st.get(), 1, r.id);
        BindText(st.get(), 2, r.name);
        BindText(st.get(), 3, r.business_name);
        BindText(st.get(), 4, r.mobile);
        BindText(st.get(), 5, r.address_line_1);
        BindText(st.get(), 6, r.city);
        BindText(st.get(), 7, r.state);
        BindText(st.get(), 8, r.country);
        BindText(st.get(), 9, r.zip_code);
        BindText(st.get(), 10, r.contact_code);
        BindText(st.get(), 11, r.pay_term_type);
        BindI64(st.get(), 12, r.pay_term_number);
        BindDouble(st.get(), 13, r.balance);
        BindText(st.get(), 14, stamp);

        rc = sqlite3_step(st.get());
        if (rc != SQLITE_DONE) return Translate(db, rc);
    }
    return Result::Ok();
}

Result SqliteRepository::ReplaceProducts(Transaction& t, const std::vector<model::ProductRecord>& rows) {
    auto* db = TX(t).Handle();

    int rc = sqlite3_exec(db, "DELETE FROM cached_products;", nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) return Translate(db, rc);

    auto st = PrepareStmt(db, sql::INSERT_PRODUCT);
    if (!st) return PrepareError(db);

    const auto stamp = util::FormatIso8601(util::Now());
    for (const auto& r : rows) {
        sqlite3_reset(st.get());
        sqlite3_clear_bindings(st.get());
        BindI64(st.get(), 1, r.product_id);
        BindText(st.get(), 2, r.product_name);
        BindText(st.get(), 3, r.product_type);
        BindI64(st.get(), 4, r.variation_id);
        BindText(st.get(), 5, r.variation_name);
        BindText(st.get(), 6, r.sub_sku);
        BindDouble(st.get(), 7, r.default_purchase_price);
        BindText(st.get(), 8, stamp);

        rc = sqlite3_step(st.get());
        if (rc != SQLITE_DONE) return Translate(db, rc);
    }
    return Result::Ok();
}

Result SqliteRepository::ReplaceLocations(Transaction& t, const std::vector<model::LocationRecord>& rows) {
    auto* db = TX(t).Handle();

    int rc = sqlite3_exec(db, "DELETE FROM cached_locations;", nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) return Translate(db, rc);

    auto st = PrepareStmt(db, sql::INSERT_LOCATION);
    if (!st) return PrepareError(db);

    const auto stamp = util::FormatIso8601(util::Now());
    for (const auto& r : rows) {
        sqlite3_reset(st.get());
        sqlite3_clear_bindings(st.get());
        BindI64(st.get(), 1, r.id);
        BindText(st.get(), 2, r.name);
        BindText(st.get(), 3, r.location_code);
        BindText(st.get(), 4, r.address);
        BindText(st.get(), 5, r.city);
        BindText(st.get(), 6, r.state);
        BindText(st.get(), 7, r.country);
        BindText(st.get(), 8, r.zip_code);
        BindText(st.get(), 9, stamp);

        rc = sqlite3_step(st.get());
        if (rc != SQLITE_DONE) return Translate(db, rc);
    }
    return Result::Ok();
}

std::vector<model::SupplierRecord> SqliteRepository::SearchSuppliers(Transaction& t, const std::string& term) {
    std::vector<model::SupplierRecord> out;
    auto* db = TX(t).Handle();

    auto st = PrepareStmt(db, sql::SEARCH_SUPPLIERS);
    if (!st) return out;

    BindText(st.get(), 1, LikePattern(term));
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        model::SupplierRecord r;
        r.id              = ColI64(st.get(), 0);
        r.name            = ColText(st.get(), 1);
        r.business_name   = ColText(st.get(), 2);
        r.mobile          = ColText(st.get(), 3);
        r.address_line_1  = ColText(st.get(), 4);
        r.city            = ColText(st.get(), 5);
        r.state           = ColText(st.get(), 6);
        r.country         = ColText(st.get(), 7);
        r.zip_code        = ColText(st.get(), 8);
        r.contact_code    = ColText(st.get(), 9);
        r.pay_term_type   = ColText(st.get(), 10);
        r.pay_term_number = ColI64(st.get(), 11);
        r.balance         = ColDouble(st.get(), 12);
        out.push_back(std::move(r));
    }
    return out;
}

std::vector<model::ProductRecord> SqliteRepository::SearchProducts(Transaction& t, const std::string& term) {
    std::vector<model::ProductRecord> out;
    auto* db = TX(t).Handle();

    auto st = PrepareStmt(db, sql::SEARCH_PRODUCTS);
    if (!st) return out;

    BindText(st.get(), 1, LikePattern(term));
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        model::ProductRecord r;
        r.product_id             = ColI64(st.get(), 0);
        r.product_name           = ColText(st.get(), 1);
        r.product_type           = ColText(st.get(), 2);
        r.variation_id           = ColI64(st.get(), 3);
        r.variation_name         = ColText(st.get(), 4);
        r.sub_sku                = ColText(st.get(), 5);
        r.default_purchase_price = ColDouble(st.get(), 6);
        out.push_back(std::move(r));
    }
    return out;
}

std::vector<model::LocationRecord> SqliteRepository::SearchLocations(Transaction& t, const std::string& term) {
    std::vector<model::LocationRecord> out;
    auto* db = TX(t).Handle();

    auto st = PrepareStmt(db, sql::SEARCH_LOCATIONS);
    if (!st) return out;

    BindText(st.get(), 1, LikePattern(term));
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        model::LocationRecord r;
        r.id            = ColI64(st.get(), 0);
        r.name          = ColText(st.get(), 1);
        r.location_code = ColText(st.get(), 2);
        r.address       = ColText(st.get(), 3);
        r.city          = ColText(st.get(), 4);
        r.state         = ColText(st.get(), 5);
        r.country       = ColText(st.get(), 6);
        r.zip_code      = ColText(st.get(), 7);
        out.push_back(std::move(r));
    }
    return out;
}

std::int64_t SqliteRepository::CountReference(Transaction& t, model::ReferenceKind kind) {
    auto* db = TX(t).Handle();

    const char* sql = "SELECT COUNT(*) FROM cached_suppliers;";
    if (kind == model::ReferenceKind::kProducts) sql = "SELECT COUNT(*) FROM cached_products;";
    if (kind == model::ReferenceKind::kLocations) sql = "SELECT COUNT(*) FROM cached_locations;";

    auto st = PrepareStmt(db, sql);
    if (!st || sqlite3_step(st.get()) != SQLITE_ROW) return 0;
    return ColI64(st.get(), 0);
}

Result SqliteRepository::ClearReferenceCaches(Transaction& t) {
    auto* db = TX(t).Handle();

    int rc = sqlite3_exec(db, "DELETE FROM cached_suppliers; DELETE FROM cached_products; DELETE FROM cached_locations;", nullptr,
                          nullptr, nullptr);
    return rc == SQLITE_OK ? Result::Ok() : Translate(db, rc);
}

// ------------------------------------------------------------------
// System key/value
// ------------------------------------------------------------------

std::optional<std::string> SqliteRepository::GetSystemValue(Transaction& t, const std::string& key) {
    auto* db = TX(t).Handle();

    auto st = PrepareStmt(db, sql::SELECT_SYSTEM_VALUE);
    if (!st) return std::nullopt;

    BindText(st.get(), 1, key);
    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
    return ColOptText(st.get(), 0);
}

Result SqliteRepository::PutSystemValue(Transaction& t, const std::string& key, const std::string& value) {
    auto* db = TX(t).Handle();

    if (auto r = DeleteSystemValue(t, key); !r) return r;

    auto st = PrepareStmt(db, sql::INSERT_SYSTEM_VALUE);
    if (!st) return PrepareError(db);

    BindText(st.get(), 1, key);
    BindText(st.get(), 2, value);
    return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::DeleteSystemValue(Transaction& t, const std::string& key) {
    auto* db = TX(t).Handle();

    auto st = PrepareStmt(db, sql::DELETE_SYSTEM_VALUE);
    if (!st) return PrepareError(db);

    BindText(st.get(), 1, key);
    return Translate(db, sqlite3_step(st.get()));
}

} // namespace purchase::db::sqlite
