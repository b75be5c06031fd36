#pragma once

#include <string>
#include <vector>

#include "internal/db/sql/migrations.hpp"
#include "sqlite_db.hpp"

namespace purchase::db::sqlite {

class SqliteMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(SqliteDB& db) : db_(db) {
  }

  void ExecuteSQL(const std::string& sql) override;

  bool                     TableExists(const std::string& table) override;
  std::vector<std::string> Columns(const std::string& table) override;

  int  SchemaVersion() override;
  void SetSchemaVersion(int version) override;

 private:
  SqliteDB& db_;
};

// Runs pending migrations while holding the connection's writer slot.
int MigrateSchema(SqliteDB& db);

} // namespace purchase::db::sqlite
