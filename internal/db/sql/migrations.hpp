#pragma once

#include <functional>
#include <string>
#include <vector>

namespace purchase::db::sql {

/*
  Backend-agnostic migration execution.

  The backend supplies SQL execution plus the introspection the upgrade
  steps need to stay safe on files written by older releases.
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;

  virtual bool TableExists(const std::string& table)                             = 0;
  virtual std::vector<std::string> Columns(const std::string& table)             = 0;

  virtual int  SchemaVersion()            = 0;
  virtual void SetSchemaVersion(int version) = 0;
};

struct Migration {
  int                                     version = 0;
  std::string                             description;
  std::function<void(MigrationExecutor&)> apply;
};

/*
  Ordered, additive upgrade steps. Each step runs in its own transaction
  together with the user_version bump.
*/
const std::vector<Migration>& SchemaMigrations();

int CurrentSchemaVersion();

bool ColumnExists(MigrationExecutor& executor, const std::string& table, const std::string& column);

/*
  Brings the store to CurrentSchemaVersion().

  A brand new file gets the current schema in one step; an existing file
  runs every missing step in order. Returns the number of steps applied
  (a fresh create counts as one). Throws std::runtime_error when a step
  fails or the file is newer than this build.
*/
int RunMigrations(MigrationExecutor& executor);

} // namespace purchase::db::sql
