#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace purchase::db::sqlite {

/*
  Thin RAII wrapper around the single sqlite3* connection of the process.

  All writers go through WriterMutex(): transactions hold it for their
  whole lifetime so concurrent callers queue instead of racing.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  std::mutex& WriterMutex() {
    return writer_mutex_;
  }

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  writer_mutex_;
};

} // namespace purchase::db::sqlite
