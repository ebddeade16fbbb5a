#pragma once

#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace ragturn::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::BalanceRecord> balances;
    std::vector<model::LedgerEntryRecord> ledger;
    std::uint64_t next_ledger_id = 1;

    std::unordered_map<std::string, model::ThreadRecord> threads;
    std::unordered_map<std::string, std::vector<model::MessageRecord>> messages_by_thread;
    std::uint64_t next_message_seq = 1;
    std::unordered_map<std::string, std::vector<model::CitationRecord>> citations_by_message;

    std::unordered_map<std::string, model::CredentialRecord> credentials;

    std::vector<model::AuditEventRecord> audit_events;
    std::uint64_t next_audit_id = 1;

    std::map<std::string, model::RetrievalSignalRecord> signals;
  };

  std::mutex mutex_;
  State committed_;
};

}
