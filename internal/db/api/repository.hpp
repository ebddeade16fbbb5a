#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/audit_event_record.hpp"
#include "internal/db/model/balance_record.hpp"
#include "internal/db/model/citation_record.hpp"
#include "internal/db/model/credential_record.hpp"
#include "internal/db/model/ledger_entry_record.hpp"
#include "internal/db/model/message_record.hpp"
#include "internal/db/model/retrieval_signal_record.hpp"
#include "internal/db/model/thread_record.hpp"

namespace ragturn::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes go through a Transaction
  - Reads inside a transaction see its writes
  - DecrementBalanceIfSufficient is a single conditional update; it is the
    only operation that lowers a balance, so balances never go negative
  - Ledger entries and audit events are append-only

  The DB is the source of truth for:
    balances and the ledger
    threads, messages and citations
    stored credentials
    retrieval signals
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Balances
  // ---------------------------------------------------------------------

  virtual std::optional<model::BalanceRecord> GetBalance(Transaction&, const std::string& owner_id) = 0;

  // Creates the row when missing; adds to balance and lifetime_granted.
  virtual Result GrantBalance(Transaction&, const std::string& owner_id, std::int64_t amount_cents, std::uint64_t now_ms) = 0;

  // balance -= amount only when balance >= amount. Conflict when no row changed.
  virtual Result DecrementBalanceIfSufficient(Transaction&, const std::string& owner_id, std::int64_t amount_cents, std::uint64_t now_ms) = 0;

  // balance += credit, lifetime_spent += spent. NotFound when the row is missing.
  virtual Result SettleBalance(Transaction&, const std::string& owner_id, std::int64_t credit_cents, std::int64_t spent_cents,
                               std::uint64_t now_ms) = 0;

  // ---------------------------------------------------------------------
  // Ledger
  // ---------------------------------------------------------------------

  virtual Result AppendLedgerEntry(Transaction&, model::LedgerEntryRecord&) = 0;

  // Oldest first.
  virtual std::vector<model::LedgerEntryRecord> ListLedgerEntries(Transaction&, const std::string& owner_id) = 0;

  // ---------------------------------------------------------------------
  // Threads
  // ---------------------------------------------------------------------

  virtual Result InsertThread(Transaction&, const model::ThreadRecord&) = 0;

  virtual std::optional<model::ThreadRecord> GetThread(Transaction&, const std::string& thread_id) = 0;

  virtual Result AddThreadParticipant(Transaction&, const std::string& thread_id, const std::string& user_id) = 0;

  virtual Result UpdateThreadTitle(Transaction&, const std::string& thread_id, const std::string& title, std::uint64_t updated_at_ms) = 0;

  // ---------------------------------------------------------------------
  // Messages and citations
  // ---------------------------------------------------------------------

  // Assigns record.seq.
  virtual Result InsertMessage(Transaction&, model::MessageRecord&) = 0;

  // The newest `limit` messages of the thread, returned oldest first.
  virtual std::vector<model::MessageRecord> ListRecentMessages(Transaction&, const std::string& thread_id, std::size_t limit) = 0;

  virtual Result InsertCitations(Transaction&, const std::vector<model::CitationRecord>&) = 0;

  // Ordered by rank.
  virtual std::vector<model::CitationRecord> ListCitations(Transaction&, const std::string& message_id) = 0;

  // ---------------------------------------------------------------------
  // Personal credentials
  // ---------------------------------------------------------------------

  virtual Result InsertCredential(Transaction&, const model::CredentialRecord&) = 0;

  // Scoped to the owner: another user's credential id reads as missing.
  virtual std::optional<model::CredentialRecord> GetCredential(Transaction&, const std::string& credential_id, const std::string& owner_id) = 0;

  virtual Result UpdateCredentialSecret(Transaction&, const std::string& credential_id, const std::string& encrypted_key,
                                        const std::string& key_preview, std::uint64_t updated_at_ms) = 0;

  // ---------------------------------------------------------------------
  // Audit events
  // ---------------------------------------------------------------------

  // Assigns record.id.
  virtual Result InsertAuditEvent(Transaction&, model::AuditEventRecord&) = 0;

  // Oldest first; an empty action lists every event.
  virtual std::vector<model::AuditEventRecord> ListAuditEvents(Transaction&, const std::string& action) = 0;

  // ---------------------------------------------------------------------
  // Retrieval signals
  // ---------------------------------------------------------------------

  virtual Result UpsertRetrievalSignal(Transaction&, const model::RetrievalSignalRecord&) = 0;

  virtual std::vector<model::RetrievalSignalRecord> ListRetrievalSignals(Transaction&) = 0;
};

} // namespace ragturn::db
