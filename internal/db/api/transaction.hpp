#pragma once

namespace purchase::db {

/*
  Abstract transaction.

  - Changes are invisible to other connections until Commit()
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - A live transaction owns the store's single writer slot; other
    callers block in Begin() until it ends

  SQLite: BEGIN IMMEDIATE under the connection's writer mutex
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true once Commit() or Rollback() ran
  virtual bool IsCommitted() const = 0;
};

}
