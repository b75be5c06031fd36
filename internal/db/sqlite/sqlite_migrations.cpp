#include "sqlite_migrations.hpp"

#include <mutex>

namespace purchase::db::sqlite {

void SqliteMigrationExecutor::ExecuteSQL(const std::string& sql) {
  db_.Exec(sql);
}

bool SqliteMigrationExecutor::TableExists(const std::string& table) {
  sqlite3_stmt* st = db_.Prepare("SELECT 1 FROM sqlite_master WHERE type='table' AND name=?;");
  sqlite3_bind_text(st, 1, table.c_str(), -1, SQLITE_TRANSIENT);
  const bool exists = sqlite3_step(st) == SQLITE_ROW;
  sqlite3_finalize(st);
  return exists;
}

std::vector<std::string> SqliteMigrationExecutor::Columns(const std::string& table) {
  std::vector<std::string> out;

  // pragma arguments cannot be bound
  sqlite3_stmt* st = db_.Prepare("SELECT name FROM pragma_table_info('" + table + "');");
  while (sqlite3_step(st) == SQLITE_ROW) {
    const unsigned char* name = sqlite3_column_text(st, 0);
    if (name) out.emplace_back(reinterpret_cast<const char*>(name));
  }
  sqlite3_finalize(st);
  return out;
}

int SqliteMigrationExecutor::SchemaVersion() {
  sqlite3_stmt* st      = db_.Prepare("PRAGMA user_version;");
  int           version = 0;
  if (sqlite3_step(st) == SQLITE_ROW) version = sqlite3_column_int(st, 0);
  sqlite3_finalize(st);
  return version;
}

void SqliteMigrationExecutor::SetSchemaVersion(int version) {
  db_.Exec("PRAGMA user_version=" + std::to_string(version) + ";");
}

int MigrateSchema(SqliteDB& db) {
  std::lock_guard         lock(db.WriterMutex());
  SqliteMigrationExecutor executor(db);
  return sql::RunMigrations(executor);
}

} // namespace purchase::db::sqlite
