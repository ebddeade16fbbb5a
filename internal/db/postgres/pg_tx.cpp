#include "pg_tx.hpp"

namespace ragturn::db::postgres {

PgTransaction::PgTransaction(const std::shared_ptr<PgPool>& pool) : conn_(pool->Acquire()) {
  tx_ = std::make_unique<pqxx::work>(*conn_);
}

// pqxx::work aborts on destruction when neither commit() nor abort() ran.
PgTransaction::~PgTransaction() {
  tx_.reset();
}

void PgTransaction::Commit() {
  tx_->commit();
  committed_ = true;
}

void PgTransaction::Rollback() {
  tx_->abort();
}

}
