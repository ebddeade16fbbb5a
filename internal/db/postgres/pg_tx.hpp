#pragma once

#include <memory>
#include <pqxx/pqxx>
#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace ragturn::db::postgres {

/*
  Postgres transaction on its own pooled connection.

  Balance rows are updated with conditional UPDATEs, so the default
  READ COMMITTED isolation is enough: the row lock taken by the first
  UPDATE makes a concurrent one re-check `balance_cents>=$1`.
*/
class PgTransaction final : public db::Transaction {
public:
  explicit PgTransaction(const std::shared_ptr<PgPool>& pool);
  ~PgTransaction();

  pqxx::work& Work() { return *tx_; }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::work> tx_;
  bool committed_ = false;
};

}
