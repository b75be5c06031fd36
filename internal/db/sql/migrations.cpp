#include "migrations.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/observability/logging.hpp"

namespace purchase::db::sql {

namespace {

/*
  Legacy rebuild: rename the old table away, create the new shape and
  copy the columns both shapes share. The renamed table is kept.
*/
void RebuildLegacyTable(MigrationExecutor& executor, const std::string& table, const std::string& previous, const char* create_sql) {
  executor.ExecuteSQL("ALTER TABLE " + table + " RENAME TO " + previous + ";");
  executor.ExecuteSQL(create_sql);

  const auto old_columns = executor.Columns(previous);
  const auto new_columns = executor.Columns(table);

  std::string shared;
  for (const auto& column : new_columns) {
    if (std::find(old_columns.begin(), old_columns.end(), column) == old_columns.end()) continue;
    if (!shared.empty()) shared += ",";
    shared += column;
  }
  if (shared.empty()) return;

  executor.ExecuteSQL("INSERT INTO " + table + "(" + shared + ") SELECT " + shared + " FROM " + previous + ";");
}

void AddColumnIfMissing(MigrationExecutor& executor, const std::string& table, const std::string& column, const std::string& decl) {
  if (!executor.TableExists(table) || ColumnExists(executor, table, column)) return;
  executor.ExecuteSQL("ALTER TABLE " + table + " ADD COLUMN " + column + " " + decl + ";");
}

void CreateCurrentSchema(MigrationExecutor& executor) {
  executor.ExecuteSQL(CREATE_SYSTEM);
  executor.ExecuteSQL(CREATE_PURCHASE);
  executor.ExecuteSQL(CREATE_PURCHASE_LINES);
  executor.ExecuteSQL(CREATE_PURCHASE_PAYMENTS);
  executor.ExecuteSQL(CREATE_CACHED_SUPPLIERS);
  executor.ExecuteSQL(CREATE_CACHED_PRODUCTS);
  executor.ExecuteSQL(CREATE_CACHED_LOCATIONS);
  for (const char* index_sql : CREATE_PURCHASE_INDEXES) {
    executor.ExecuteSQL(index_sql);
  }
}

void ApplyStep(MigrationExecutor& executor, const std::string& label, int version, const std::function<void(MigrationExecutor&)>& apply) {
  executor.ExecuteSQL("BEGIN IMMEDIATE;");
  try {
    apply(executor);
    executor.SetSchemaVersion(version);
    executor.ExecuteSQL("COMMIT;");
  } catch (const std::exception& e) {
    executor.ExecuteSQL("ROLLBACK;");
    throw std::runtime_error("schema migration v" + std::to_string(version) + " (" + label + ") failed: " + e.what());
  }
}

} // namespace

const std::vector<Migration>& SchemaMigrations() {
  static const std::vector<Migration> kMigrations = {
      {2, "rebuild sell_lines",
       [](MigrationExecutor& e) {
         if (e.TableExists("sell_lines") && !e.TableExists("prev_sell_line")) {
           RebuildLegacyTable(e, "sell_lines", "prev_sell_line", CREATE_LEGACY_SELL_LINES);
         }
       }},
      {3, "rebuild variations",
       [](MigrationExecutor& e) {
         if (e.TableExists("variations") && !e.TableExists("prev_variations")) {
           RebuildLegacyTable(e, "variations", "prev_variations", CREATE_LEGACY_VARIATIONS);
         }
       }},
      {4, "contact table",
       [](MigrationExecutor& e) {
         if (e.TableExists("sell")) e.ExecuteSQL(CREATE_LEGACY_CONTACT);
       }},
      {5, "sell.invoice_url", [](MigrationExecutor& e) { AddColumnIfMissing(e, "sell", "invoice_url", "TEXT DEFAULT null"); }},
      {6, "sell_payments.account_id",
       [](MigrationExecutor& e) { AddColumnIfMissing(e, "sell_payments", "account_id", "INTEGER DEFAULT null"); }},
      {7, "purchase tables",
       [](MigrationExecutor& e) {
         e.ExecuteSQL(CREATE_PURCHASE_V7);
         e.ExecuteSQL(CREATE_PURCHASE_LINES);
         e.ExecuteSQL(CREATE_PURCHASE_PAYMENTS);
       }},
      {8, "reference caches",
       [](MigrationExecutor& e) {
         e.ExecuteSQL(CREATE_CACHED_SUPPLIERS);
         e.ExecuteSQL(CREATE_CACHED_PRODUCTS);
         e.ExecuteSQL(CREATE_CACHED_LOCATIONS);
       }},
      {9, "purchase.shipping_details", [](MigrationExecutor& e) { AddColumnIfMissing(e, "purchase", "shipping_details", "TEXT"); }},
      {10, "purchase lookup indexes",
       [](MigrationExecutor& e) {
         for (const char* index_sql : CREATE_PURCHASE_INDEXES) {
           e.ExecuteSQL(index_sql);
         }
       }},
  };
  return kMigrations;
}

int CurrentSchemaVersion() {
  return SchemaMigrations().back().version;
}

bool ColumnExists(MigrationExecutor& executor, const std::string& table, const std::string& column) {
  const auto columns = executor.Columns(table);
  return std::find(columns.begin(), columns.end(), column) != columns.end();
}

int RunMigrations(MigrationExecutor& executor) {
  int       version = executor.SchemaVersion();
  const int target  = CurrentSchemaVersion();

  if (version > target) {
    throw std::runtime_error("local store schema v" + std::to_string(version) + " is newer than supported v" + std::to_string(target));
  }

  if (version == 0) {
    if (!executor.TableExists("system")) {
      ApplyStep(executor, "create", target, CreateCurrentSchema);
      PURCHASE_LOG_INFO("Created local store schema", {observability::IntField("version", target)});
      return 1;
    }
    // unversioned file from the very first release
    version = 1;
  }

  int applied = 0;
  for (const auto& migration : SchemaMigrations()) {
    if (migration.version <= version) continue;
    ApplyStep(executor, migration.description, migration.version, migration.apply);
    PURCHASE_LOG_INFO("Applied schema migration",
                      {observability::IntField("version", migration.version), observability::StringField("step", migration.description)});
    ++applied;
  }
  return applied;
}

} // namespace purchase::db::sql
