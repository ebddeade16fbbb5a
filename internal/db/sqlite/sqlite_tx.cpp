#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace ragturn::db::sqlite {

SqliteTransaction::SqliteTransaction(const std::shared_ptr<SqlitePool>& pool) : conn_(pool->Acquire()) {
  conn_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) {
    return;
  }
  // Destructors must not throw; report a failed rollback instead.
  char* err = nullptr;
  if (sqlite3_exec(conn_->Handle(), "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
    RAGTURN_LOG_WARN("sqlite rollback failed", {observability::StringField("error", err ? err : "unknown")});
  }
  sqlite3_free(err);
}

void SqliteTransaction::Commit() {
  conn_->Exec("COMMIT;");
  committed_ = true;
  finished_  = true;
}

void SqliteTransaction::Rollback() {
  if (finished_) {
    return;
  }
  finished_ = true;
  conn_->Exec("ROLLBACK;");
}

} // namespace ragturn::db::sqlite
