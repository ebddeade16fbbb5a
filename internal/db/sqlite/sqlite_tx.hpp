#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_pool.hpp"

namespace ragturn::db::sqlite {

/*
  SQLite transaction wrapper.

  Uses BEGIN IMMEDIATE on its own pooled connection:
    - grabs write lock early
    - avoids deadlock-y behavior later
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(const std::shared_ptr<SqlitePool>& pool);
  ~SqliteTransaction();

  sqlite3* Handle() const { return conn_->Handle(); }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<SqliteDB> conn_;
  bool committed_ = false;
  bool finished_ = false;
};

}
