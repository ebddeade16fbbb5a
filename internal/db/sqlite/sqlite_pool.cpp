#include "sqlite_pool.hpp"

namespace ragturn::db::sqlite {

SqlitePool::SqlitePool(std::string path, bool wal_mode, std::size_t max_connections)
    : path_(std::move(path)),
      wal_mode_(wal_mode),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
  if (path_ == ":memory:") {
    max_connections_ = 1;
    wal_mode_        = false;
  }
}

std::shared_ptr<SqliteDB> SqlitePool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  try {
    return Wrap(new SqliteDB(path_, wal_mode_));
  } catch (...) {
    std::lock_guard rollback_lock(mutex_);
    --live_connections_;
    cv_.notify_one();
    throw;
  }
}

void SqlitePool::ExecAll(const std::vector<std::string>& statements) {
  auto conn = Acquire();
  for (const auto& sql : statements) {
    conn->Exec(sql);
  }
}

std::shared_ptr<SqliteDB> SqlitePool::Wrap(SqliteDB* conn) {
  std::weak_ptr<SqlitePool> weak_self = shared_from_this();
  return std::shared_ptr<SqliteDB>(conn, [weak_self](SqliteDB* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void SqlitePool::Release(SqliteDB* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace ragturn::db::sqlite
