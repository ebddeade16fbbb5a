#pragma once

namespace ragturn::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - Write transactions are serialized: a second Begin() blocks until the
    first finishes. Never hold two transactions on one thread.

  SQLite: BEGIN IMMEDIATE on a pooled connection
  Postgres: pqxx::work on a pooled connection
  Memory: repository lock + working copy
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true if commit already performed
  virtual bool IsCommitted() const = 0;
};

}
