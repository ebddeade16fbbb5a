#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_pool.hpp"
#include "sqlite_tx.hpp"

namespace ragturn::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqlitePool> pool);

  std::unique_ptr<Transaction> Begin() override;

  std::optional<model::BalanceRecord> GetBalance(Transaction&, const std::string&) override;
  Result GrantBalance(Transaction&, const std::string&, std::int64_t, std::uint64_t) override;
  Result DecrementBalanceIfSufficient(Transaction&, const std::string&, std::int64_t, std::uint64_t) override;
  Result SettleBalance(Transaction&, const std::string&, std::int64_t, std::int64_t, std::uint64_t) override;

  Result AppendLedgerEntry(Transaction&, model::LedgerEntryRecord&) override;
  std::vector<model::LedgerEntryRecord> ListLedgerEntries(Transaction&, const std::string&) override;

  Result InsertThread(Transaction&, const model::ThreadRecord&) override;
  std::optional<model::ThreadRecord> GetThread(Transaction&, const std::string&) override;
  Result AddThreadParticipant(Transaction&, const std::string&, const std::string&) override;
  Result UpdateThreadTitle(Transaction&, const std::string&, const std::string&, std::uint64_t) override;

  Result InsertMessage(Transaction&, model::MessageRecord&) override;
  std::vector<model::MessageRecord> ListRecentMessages(Transaction&, const std::string&, std::size_t) override;
  Result InsertCitations(Transaction&, const std::vector<model::CitationRecord>&) override;
  std::vector<model::CitationRecord> ListCitations(Transaction&, const std::string&) override;

  Result InsertCredential(Transaction&, const model::CredentialRecord&) override;
  std::optional<model::CredentialRecord> GetCredential(Transaction&, const std::string&, const std::string&) override;
  Result UpdateCredentialSecret(Transaction&, const std::string&, const std::string&, const std::string&, std::uint64_t) override;

  Result InsertAuditEvent(Transaction&, model::AuditEventRecord&) override;
  std::vector<model::AuditEventRecord> ListAuditEvents(Transaction&, const std::string&) override;

  Result UpsertRetrievalSignal(Transaction&, const model::RetrievalSignalRecord&) override;
  std::vector<model::RetrievalSignalRecord> ListRetrievalSignals(Transaction&) override;

private:
  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);

  std::shared_ptr<SqlitePool> pool_;
};

}
