#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace ragturn::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Balances
// ------------------------------------------------------------------

std::optional<model::BalanceRecord> MemoryRepository::GetBalance(Transaction& t, const std::string& owner_id) {
  const auto& s  = TX(t).View();
  auto        it = s.balances.find(owner_id);
  if (it == s.balances.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::GrantBalance(Transaction& t, const std::string& owner_id, std::int64_t amount_cents, std::uint64_t now_ms) {
  auto& s      = TX(t).Mutable();
  auto& record = s.balances[owner_id];
  record.owner_id = owner_id;
  record.balance_cents += amount_cents;
  record.lifetime_granted_cents += amount_cents;
  record.updated_at_ms = now_ms;
  return Result::Ok();
}

Result MemoryRepository::DecrementBalanceIfSufficient(Transaction& t, const std::string& owner_id, std::int64_t amount_cents,
                                                      std::uint64_t now_ms) {
  auto& s  = TX(t).Mutable();
  auto  it = s.balances.find(owner_id);
  if (it == s.balances.end() || it->second.balance_cents < amount_cents) {
    return Result::Err(ErrorCode::Conflict, "insufficient balance");
  }
  it->second.balance_cents -= amount_cents;
  it->second.updated_at_ms = now_ms;
  return Result::Ok();
}

Result MemoryRepository::SettleBalance(Transaction& t, const std::string& owner_id, std::int64_t credit_cents, std::int64_t spent_cents,
                                       std::uint64_t now_ms) {
  auto& s  = TX(t).Mutable();
  auto  it = s.balances.find(owner_id);
  if (it == s.balances.end()) return Result::Err(ErrorCode::NotFound, "balance not found");
  it->second.balance_cents += credit_cents;
  it->second.lifetime_spent_cents += spent_cents;
  it->second.updated_at_ms = now_ms;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Ledger
// ------------------------------------------------------------------

Result MemoryRepository::AppendLedgerEntry(Transaction& t, model::LedgerEntryRecord& r) {
  auto& s = TX(t).Mutable();
  r.id    = s.next_ledger_id++;
  s.ledger.push_back(r);
  return Result::Ok();
}

std::vector<model::LedgerEntryRecord> MemoryRepository::ListLedgerEntries(Transaction& t, const std::string& owner_id) {
  std::vector<model::LedgerEntryRecord> out;
  for (const auto& e : TX(t).View().ledger)
    if (e.owner_id == owner_id) out.push_back(e);
  return out;
}

// ------------------------------------------------------------------
// Threads
// ------------------------------------------------------------------

Result MemoryRepository::InsertThread(Transaction& t, const model::ThreadRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.threads.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists);
  auto& stored = s.threads[r.id];
  stored       = r;
  std::sort(stored.participant_ids.begin(), stored.participant_ids.end());
  stored.participant_ids.erase(std::unique(stored.participant_ids.begin(), stored.participant_ids.end()), stored.participant_ids.end());
  return Result::Ok();
}

std::optional<model::ThreadRecord> MemoryRepository::GetThread(Transaction& t, const std::string& thread_id) {
  const auto& s  = TX(t).View();
  auto        it = s.threads.find(thread_id);
  if (it == s.threads.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::AddThreadParticipant(Transaction& t, const std::string& thread_id, const std::string& user_id) {
  auto& s  = TX(t).Mutable();
  auto  it = s.threads.find(thread_id);
  if (it == s.threads.end()) return Result::Err(ErrorCode::NotFound);
  auto& ids = it->second.participant_ids;
  if (std::find(ids.begin(), ids.end(), user_id) == ids.end()) {
    ids.insert(std::upper_bound(ids.begin(), ids.end(), user_id), user_id);
  }
  return Result::Ok();
}

Result MemoryRepository::UpdateThreadTitle(Transaction& t, const std::string& thread_id, const std::string& title, std::uint64_t updated_at_ms) {
  auto& s  = TX(t).Mutable();
  auto  it = s.threads.find(thread_id);
  if (it == s.threads.end()) return Result::Err(ErrorCode::NotFound);
  it->second.title         = title;
  it->second.updated_at_ms = updated_at_ms;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Messages and citations
// ------------------------------------------------------------------

Result MemoryRepository::InsertMessage(Transaction& t, model::MessageRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.threads.contains(r.thread_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown thread");
  r.seq = s.next_message_seq++;
  s.messages_by_thread[r.thread_id].push_back(r);
  return Result::Ok();
}

std::vector<model::MessageRecord> MemoryRepository::ListRecentMessages(Transaction& t, const std::string& thread_id, std::size_t limit) {
  const auto& s  = TX(t).View();
  auto        it = s.messages_by_thread.find(thread_id);
  if (it == s.messages_by_thread.end()) return {};

  const auto& all   = it->second;
  const auto  first = all.size() > limit ? all.size() - limit : 0;
  return std::vector<model::MessageRecord>(all.begin() + static_cast<std::ptrdiff_t>(first), all.end());
}

Result MemoryRepository::InsertCitations(Transaction& t, const std::vector<model::CitationRecord>& citations) {
  auto& s = TX(t).Mutable();
  for (const auto& c : citations) {
    s.citations_by_message[c.message_id].push_back(c);
  }
  return Result::Ok();
}

std::vector<model::CitationRecord> MemoryRepository::ListCitations(Transaction& t, const std::string& message_id) {
  const auto& s  = TX(t).View();
  auto        it = s.citations_by_message.find(message_id);
  if (it == s.citations_by_message.end()) return {};
  auto out = it->second;
  std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.rank < b.rank; });
  return out;
}

// ------------------------------------------------------------------
// Personal credentials
// ------------------------------------------------------------------

Result MemoryRepository::InsertCredential(Transaction& t, const model::CredentialRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.credentials.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists);
  s.credentials[r.id] = r;
  return Result::Ok();
}

std::optional<model::CredentialRecord> MemoryRepository::GetCredential(Transaction& t, const std::string& credential_id,
                                                                       const std::string& owner_id) {
  const auto& s  = TX(t).View();
  auto        it = s.credentials.find(credential_id);
  if (it == s.credentials.end() || it->second.owner_id != owner_id) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateCredentialSecret(Transaction& t, const std::string& credential_id, const std::string& encrypted_key,
                                                const std::string& key_preview, std::uint64_t updated_at_ms) {
  auto& s  = TX(t).Mutable();
  auto  it = s.credentials.find(credential_id);
  if (it == s.credentials.end()) return Result::Err(ErrorCode::NotFound);
  it->second.encrypted_key = encrypted_key;
  it->second.key_preview   = key_preview;
  it->second.updated_at_ms = updated_at_ms;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Audit events
// ------------------------------------------------------------------

Result MemoryRepository::InsertAuditEvent(Transaction& t, model::AuditEventRecord& r) {
  auto& s = TX(t).Mutable();
  r.id    = s.next_audit_id++;
  s.audit_events.push_back(r);
  return Result::Ok();
}

std::vector<model::AuditEventRecord> MemoryRepository::ListAuditEvents(Transaction& t, const std::string& action) {
  std::vector<model::AuditEventRecord> out;
  for (const auto& e : TX(t).View().audit_events)
    if (action.empty() || e.action == action) out.push_back(e);
  return out;
}

// ------------------------------------------------------------------
// Retrieval signals
// ------------------------------------------------------------------

Result MemoryRepository::UpsertRetrievalSignal(Transaction& t, const model::RetrievalSignalRecord& r) {
  TX(t).Mutable().signals[r.chunk_id] = r;
  return Result::Ok();
}

std::vector<model::RetrievalSignalRecord> MemoryRepository::ListRetrievalSignals(Transaction& t) {
  std::vector<model::RetrievalSignalRecord> out;
  for (const auto& [_, signal] : TX(t).View().signals) out.push_back(signal);
  return out;
}

} // namespace ragturn::db::memory
