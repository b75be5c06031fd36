#pragma once

namespace purchase::db::sql {

/*
  Canonical SQL for the local store.

  Table and column names are the persisted schema of existing
  installations: `contact_id` is the supplier, `transaction_id` the
  remote identifier, `is_synced` the sync flag.
*/

// ------------------------------------------------------------------
// Schema (current version)
// ------------------------------------------------------------------

static constexpr const char* CREATE_SYSTEM =
    "CREATE TABLE IF NOT EXISTS system (id INTEGER PRIMARY KEY AUTOINCREMENT, keyId INTEGER DEFAULT null,"
    " key TEXT, value TEXT);";

static constexpr const char* CREATE_PURCHASE =
    "CREATE TABLE IF NOT EXISTS purchase (id INTEGER PRIMARY KEY AUTOINCREMENT, transaction_date TEXT, ref_no TEXT,"
    " contact_id INTEGER, location_id INTEGER, status TEXT, tax_id INTEGER, discount_amount REAL,"
    " discount_type TEXT, additional_notes TEXT, shipping_details TEXT, shipping_charges REAL DEFAULT 0.00,"
    " total_before_tax REAL, tax_amount REAL, final_total REAL,"
    " is_synced INTEGER, transaction_id INTEGER DEFAULT null);";

// v7 shape, before shipping_details was added in v9
static constexpr const char* CREATE_PURCHASE_V7 =
    "CREATE TABLE IF NOT EXISTS purchase (id INTEGER PRIMARY KEY AUTOINCREMENT, transaction_date TEXT, ref_no TEXT,"
    " contact_id INTEGER, location_id INTEGER, status TEXT, tax_id INTEGER, discount_amount REAL,"
    " discount_type TEXT, additional_notes TEXT, shipping_charges REAL DEFAULT 0.00,"
    " total_before_tax REAL, tax_amount REAL, final_total REAL,"
    " is_synced INTEGER, transaction_id INTEGER DEFAULT null);";

static constexpr const char* CREATE_PURCHASE_LINES =
    "CREATE TABLE IF NOT EXISTS purchase_lines (id INTEGER PRIMARY KEY AUTOINCREMENT, purchase_id INTEGER,"
    " product_id INTEGER, variation_id INTEGER, quantity REAL, unit_price REAL,"
    " line_discount_amount REAL, line_discount_type TEXT, item_tax_id INTEGER,"
    " item_tax REAL, sub_unit_id INTEGER, lot_number TEXT, mfg_date TEXT, exp_date TEXT,"
    " purchase_order_line_id INTEGER, purchase_requisition_line_id INTEGER);";

static constexpr const char* CREATE_PURCHASE_PAYMENTS =
    "CREATE TABLE IF NOT EXISTS purchase_payments (id INTEGER PRIMARY KEY AUTOINCREMENT, purchase_id INTEGER,"
    " payment_id INTEGER DEFAULT null, method TEXT, amount REAL, note TEXT,"
    " account_id INTEGER DEFAULT null, paid_on TEXT);";

static constexpr const char* CREATE_CACHED_SUPPLIERS =
    "CREATE TABLE IF NOT EXISTS cached_suppliers (id INTEGER PRIMARY KEY, name TEXT, business_name TEXT,"
    " mobile TEXT, address_line_1 TEXT, city TEXT, state TEXT, country TEXT,"
    " zip_code TEXT, contact_id TEXT, pay_term_type TEXT, pay_term_number INTEGER,"
    " balance REAL, last_sync TEXT);";

static constexpr const char* CREATE_CACHED_PRODUCTS =
    "CREATE TABLE IF NOT EXISTS cached_products (id INTEGER PRIMARY KEY AUTOINCREMENT, product_id INTEGER,"
    " product_name TEXT, product_type TEXT, variation_id INTEGER, variation_name TEXT,"
    " sub_sku TEXT, default_purchase_price REAL, last_sync TEXT);";

static constexpr const char* CREATE_CACHED_LOCATIONS =
    "CREATE TABLE IF NOT EXISTS cached_locations (id INTEGER PRIMARY KEY, name TEXT, location_id TEXT,"
    " address TEXT, city TEXT, state TEXT, country TEXT, zip_code TEXT, last_sync TEXT);";

static constexpr const char* CREATE_PURCHASE_INDEXES[] = {
    "CREATE INDEX IF NOT EXISTS idx_purchase_transaction_id ON purchase(transaction_id);",
    "CREATE INDEX IF NOT EXISTS idx_purchase_is_synced ON purchase(is_synced);",
    "CREATE INDEX IF NOT EXISTS idx_purchase_lines_purchase_id ON purchase_lines(purchase_id);",
    "CREATE INDEX IF NOT EXISTS idx_purchase_payments_purchase_id ON purchase_payments(purchase_id);",
};

// ------------------------------------------------------------------
// Legacy point-of-sale tables (only touched when upgrading old files)
// ------------------------------------------------------------------

static constexpr const char* CREATE_LEGACY_SELL_LINES =
    "CREATE TABLE sell_lines (id INTEGER PRIMARY KEY AUTOINCREMENT, sell_id INTEGER,"
    " product_id INTEGER,variation_id INTEGER, quantity REAL, unit_price REAL,"
    " tax_rate_id INTEGER, discount_amount REAL, discount_type TEXT, note TEXT,"
    " is_completed INTEGER);";

static constexpr const char* CREATE_LEGACY_VARIATIONS =
    "CREATE TABLE variations (id INTEGER PRIMARY KEY AUTOINCREMENT, product_id INTEGER,"
    " variation_id INTEGER, product_name TEXT, product_variation_name TEXT, variation_name TEXT,"
    " display_name TEXT, sku TEXT, sub_sku TEXT, type TEXT, enable_stock INTEGER,"
    " brand_id INTEGER, unit_id INTEGER, category_id INTEGER, sub_category_id INTEGER,"
    " tax_id INTEGER, default_sell_price REAL, sell_price_inc_tax REAL, product_image_url TEXT,"
    " selling_price_group BLOB DEFAULT null, product_description TEXT);";

static constexpr const char* CREATE_LEGACY_CONTACT =
    "CREATE TABLE IF NOT EXISTS contact (id INTEGER PRIMARY KEY AUTOINCREMENT, name TEXT, city TEXT, state TEXT,"
    " country TEXT, address_line_1 TEXT, address_line_2 TEXT, zip_code TEXT, mobile TEXT);";

// ------------------------------------------------------------------
// Purchase headers
// ------------------------------------------------------------------

#define PURCHASE_HEADER_COLUMNS                                                                                           \
  "id,transaction_id,contact_id,location_id,ref_no,status,transaction_date,total_before_tax,discount_amount,"           \
  "discount_type,tax_id,tax_amount,shipping_charges,shipping_details,final_total,additional_notes,is_synced"

static constexpr const char* INSERT_HEADER =
    "INSERT INTO purchase(transaction_id,contact_id,location_id,ref_no,status,transaction_date,total_before_tax,"
    "discount_amount,discount_type,tax_id,tax_amount,shipping_charges,shipping_details,final_total,additional_notes,"
    "is_synced) VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_HEADER = "SELECT " PURCHASE_HEADER_COLUMNS " FROM purchase WHERE id=?;";

static constexpr const char* SELECT_HEADER_BY_REMOTE_ID =
    "SELECT " PURCHASE_HEADER_COLUMNS " FROM purchase WHERE transaction_id=? ORDER BY id LIMIT 1;";

static constexpr const char* SELECT_ALL_HEADERS = "SELECT " PURCHASE_HEADER_COLUMNS " FROM purchase ORDER BY id DESC;";

static constexpr const char* SELECT_UNSYNCED_HEADERS =
    "SELECT " PURCHASE_HEADER_COLUMNS " FROM purchase WHERE is_synced IS NULL OR is_synced=0 ORDER BY id;";

static constexpr const char* SELECT_REMOTE_IDS =
    "SELECT transaction_id FROM purchase WHERE transaction_id IS NOT NULL ORDER BY id;";

static constexpr const char* UPDATE_HEADER =
    "UPDATE purchase SET transaction_id=?,contact_id=?,location_id=?,ref_no=?,status=?,transaction_date=?,"
    "total_before_tax=?,discount_amount=?,discount_type=?,tax_id=?,tax_amount=?,shipping_charges=?,"
    "shipping_details=?,final_total=?,additional_notes=?,is_synced=? WHERE id=?;";

static constexpr const char* MARK_HEADER_SYNCED = "UPDATE purchase SET transaction_id=?,is_synced=1 WHERE id=?;";

static constexpr const char* DELETE_HEADER = "DELETE FROM purchase WHERE id=?;";

#undef PURCHASE_HEADER_COLUMNS

// ------------------------------------------------------------------
// Lines / payments
// ------------------------------------------------------------------

static constexpr const char* INSERT_LINE =
    "INSERT INTO purchase_lines(purchase_id,product_id,variation_id,quantity,unit_price,line_discount_amount,"
    "line_discount_type,item_tax_id,item_tax,sub_unit_id,lot_number,mfg_date,exp_date,purchase_order_line_id,"
    "purchase_requisition_line_id) VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_LINES =
    "SELECT id,purchase_id,product_id,variation_id,quantity,unit_price,line_discount_amount,line_discount_type,"
    "item_tax_id,item_tax,sub_unit_id,lot_number,mfg_date,exp_date,purchase_order_line_id,purchase_requisition_line_id"
    " FROM purchase_lines WHERE purchase_id=? ORDER BY id;";

static constexpr const char* UPDATE_LINE =
    "UPDATE purchase_lines SET purchase_id=?,product_id=?,variation_id=?,quantity=?,unit_price=?,line_discount_amount=?,"
    "line_discount_type=?,item_tax_id=?,item_tax=?,sub_unit_id=?,lot_number=?,mfg_date=?,exp_date=?,"
    "purchase_order_line_id=?,purchase_requisition_line_id=? WHERE id=?;";

static constexpr const char* DELETE_LINE = "DELETE FROM purchase_lines WHERE id=?;";

static constexpr const char* DELETE_LINES_BY_PURCHASE = "DELETE FROM purchase_lines WHERE purchase_id=?;";

static constexpr const char* COUNT_LINES = "SELECT COUNT(*) FROM purchase_lines WHERE purchase_id=?;";

static constexpr const char* INSERT_PAYMENT =
    "INSERT INTO purchase_payments(purchase_id,payment_id,method,amount,note,account_id,paid_on)"
    " VALUES(?,?,?,?,?,?,?);";

static constexpr const char* SELECT_PAYMENTS =
    "SELECT id,purchase_id,payment_id,method,amount,note,account_id,paid_on"
    " FROM purchase_payments WHERE purchase_id=? ORDER BY id;";

static constexpr const char* DELETE_PAYMENT = "DELETE FROM purchase_payments WHERE id=?;";

static constexpr const char* DELETE_PAYMENTS_BY_PURCHASE = "DELETE FROM purchase_payments WHERE purchase_id=?;";

// ------------------------------------------------------------------
// Reference caches
// ------------------------------------------------------------------

static constexpr const char* INSERT_SUPPLIER =
    "INSERT OR REPLACE INTO cached_suppliers(id,name,business_name,mobile,address_line_1,city,state,country,zip_code,"
    "contact_id,pay_term_type,pay_term_number,balance,last_sync) VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SEARCH_SUPPLIERS =
    "SELECT id,name,business_name,mobile,address_line_1,city,state,country,zip_code,contact_id,pay_term_type,"
    "pay_term_number,balance FROM cached_suppliers"
    " WHERE name LIKE ?1 ESCAPE '\\' OR business_name LIKE ?1 ESCAPE '\\' OR contact_id LIKE ?1 ESCAPE '\\'"
    " ORDER BY name COLLATE NOCASE ASC, id ASC;";

static constexpr const char* INSERT_PRODUCT =
    "INSERT INTO cached_products(product_id,product_name,product_type,variation_id,variation_name,sub_sku,"
    "default_purchase_price,last_sync) VALUES(?,?,?,?,?,?,?,?);";

static constexpr const char* SEARCH_PRODUCTS =
    "SELECT product_id,product_name,product_type,variation_id,variation_name,sub_sku,default_purchase_price"
    " FROM cached_products WHERE product_name LIKE ?1 ESCAPE '\\' OR sub_sku LIKE ?1 ESCAPE '\\'"
    " ORDER BY product_name COLLATE NOCASE ASC, id ASC;";

static constexpr const char* INSERT_LOCATION =
    "INSERT OR REPLACE INTO cached_locations(id,name,location_id,address,city,state,country,zip_code,last_sync)"
    " VALUES(?,?,?,?,?,?,?,?,?);";

static constexpr const char* SEARCH_LOCATIONS =
    "SELECT id,name,location_id,address,city,state,country,zip_code FROM cached_locations"
    " WHERE name LIKE ?1 ESCAPE '\\' OR location_id LIKE ?1 ESCAPE '\\'"
    " ORDER BY name COLLATE NOCASE ASC, id ASC;";

// ------------------------------------------------------------------
// System key/value
// ------------------------------------------------------------------

static constexpr const char* SELECT_SYSTEM_VALUE = "SELECT value FROM system WHERE key=? ORDER BY id DESC LIMIT 1;";

static constexpr const char* INSERT_SYSTEM_VALUE = "INSERT INTO system(key,value) VALUES(?,?);";

static constexpr const char* DELETE_SYSTEM_VALUE = "DELETE FROM system WHERE key=?;";

} // namespace purchase::db::sql
