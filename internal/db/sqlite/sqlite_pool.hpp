#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "sqlite_db.hpp"

namespace ragturn::db::sqlite {

/*
  SqlitePool

  Connection factory used by SqliteRepository.

  - Each transaction gets its own connection, so BEGIN IMMEDIATE on one
    connection serializes writers through SQLite's own lock.
  - ":memory:" databases are private to a connection; the pool is capped
    at one connection for them.

  Lifetime:
    Repository owns shared_ptr<SqlitePool>
    Transaction acquires shared_ptr<SqliteDB>
*/

class SqlitePool : public std::enable_shared_from_this<SqlitePool> {
 public:
  explicit SqlitePool(std::string path, bool wal_mode = true, std::size_t max_connections = 8);

  // Acquire a ready-to-use connection; blocks while all are in use.
  std::shared_ptr<SqliteDB> Acquire();

  // Runs each statement on one connection, outside any transaction.
  void ExecAll(const std::vector<std::string>& statements);

 private:
  std::shared_ptr<SqliteDB> Wrap(SqliteDB* conn);
  void                      Release(SqliteDB* conn);

  std::string path_;
  bool        wal_mode_;
  std::size_t max_connections_;

  std::mutex                             mutex_;
  std::condition_variable                cv_;
  std::vector<std::unique_ptr<SqliteDB>> idle_;
  std::size_t                            live_connections_ = 0;
};

} // namespace ragturn::db::sqlite
