#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/errors.hpp"

namespace ragturn::db::sqlite {

using ragturn::db::ErrorCode;
using ragturn::db::Result;

namespace {

// Owns one prepared statement for the duration of a call.
class Statement {
 public:
  Statement(sqlite3* db, const char* sql) {
    rc_ = sqlite3_prepare_v2(db, sql, -1, &st_, nullptr);
  }
  ~Statement() {
    sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  bool Ok() const {
    return rc_ == SQLITE_OK && st_ != nullptr;
  }
  sqlite3_stmt* get() const {
    return st_;
  }

 private:
  sqlite3_stmt* st_ = nullptr;
  int           rc_ = SQLITE_ERROR;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

// Empty strings are stored as NULL.
void BindOptionalText(sqlite3_stmt* st, int idx, const std::string& s) {
  if (s.empty()) {
    sqlite3_bind_null(st, idx);
  } else {
    BindText(st, idx, s);
  }
}

void BindI64(sqlite3_stmt* st, int idx, std::int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindU64(sqlite3_stmt* st, int idx, std::uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindDouble(sqlite3_stmt* st, int idx, double v) {
  sqlite3_bind_double(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<std::int64_t>(sqlite3_column_int64(st, col));
}

std::uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<std::uint64_t>(sqlite3_column_int64(st, col));
}

double ColDouble(sqlite3_stmt* st, int col) {
  return sqlite3_column_double(st, col);
}

[[noreturn]] void ThrowRead(sqlite3* db, const char* what) {
  throw util::StorageError("sqlite_error", std::string(what) + ": " + sqlite3_errmsg(db));
}

void CheckReadStep(sqlite3* db, int rc, const char* what) {
  if (rc != SQLITE_ROW && rc != SQLITE_DONE) ThrowRead(db, what);
}

model::LedgerEntryRecord ReadLedgerEntry(sqlite3_stmt* st) {
  model::LedgerEntryRecord r;
  r.id            = ColU64(st, 0);
  r.owner_id      = ColText(st, 1);
  r.type          = model::ParseLedgerEntryType(ColText(st, 2)).value_or(model::LedgerEntryType::kGrant);
  r.amount_cents  = ColI64(st, 3);
  r.request_id    = ColText(st, 4);
  r.thread_id     = ColText(st, 5);
  r.message_id    = ColText(st, 6);
  r.model_id      = ColText(st, 7);
  r.provider      = ColText(st, 8);
  r.metadata_json = ColText(st, 9);
  r.created_at_ms = ColU64(st, 10);
  return r;
}

model::MessageRecord ReadMessage(sqlite3_stmt* st) {
  model::MessageRecord r;
  r.seq           = ColU64(st, 0);
  r.id            = ColText(st, 1);
  r.thread_id     = ColText(st, 2);
  r.user_id       = ColText(st, 3);
  r.role          = ColText(st, 4);
  r.content       = ColText(st, 5);
  r.model_id      = ColText(st, 6);
  r.provider      = ColText(st, 7);
  r.input_tokens  = ColI64(st, 8);
  r.output_tokens = ColI64(st, 9);
  r.total_tokens  = ColI64(st, 10);
  r.cost_cents    = ColI64(st, 11);
  r.billing_mode  = ColText(st, 12);
  r.usage_json    = ColText(st, 13);
  r.created_at_ms = ColU64(st, 14);
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqlitePool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(pool_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Balances
// ------------------------------------------------------------------

std::optional<model::BalanceRecord> SqliteRepository::GetBalance(Transaction& t, const std::string& owner_id) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::SELECT_BALANCE);
  if (!st.Ok()) ThrowRead(db, "select balance");

  BindText(st.get(), 1, owner_id);
  int rc = sqlite3_step(st.get());
  CheckReadStep(db, rc, "select balance");
  if (rc != SQLITE_ROW) return std::nullopt;

  model::BalanceRecord r;
  r.owner_id               = ColText(st.get(), 0);
  r.balance_cents          = ColI64(st.get(), 1);
  r.lifetime_granted_cents = ColI64(st.get(), 2);
  r.lifetime_spent_cents   = ColI64(st.get(), 3);
  r.updated_at_ms          = ColU64(st.get(), 4);
  return r;
}

Result SqliteRepository::GrantBalance(Transaction& t, const std::string& owner_id, std::int64_t amount_cents, std::uint64_t now_ms) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::GRANT_BALANCE);
  if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, owner_id);
  BindI64(st.get(), 2, amount_cents);
  BindU64(st.get(), 3, now_ms);
  return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::DecrementBalanceIfSufficient(Transaction& t, const std::string& owner_id, std::int64_t amount_cents,
                                                      std::uint64_t now_ms) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::DECREMENT_BALANCE_IF_SUFFICIENT);
  if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindI64(st.get(), 1, amount_cents);
  BindU64(st.get(), 2, now_ms);
  BindText(st.get(), 3, owner_id);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (!result) return result;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::Conflict, "insufficient balance");
  return Result::Ok();
}

Result SqliteRepository::SettleBalance(Transaction& t, const std::string& owner_id, std::int64_t credit_cents, std::int64_t spent_cents,
                                       std::uint64_t now_ms) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::SETTLE_BALANCE);
  if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindI64(st.get(), 1, credit_cents);
  BindI64(st.get(), 2, spent_cents);
  BindU64(st.get(), 3, now_ms);
  BindText(st.get(), 4, owner_id);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (!result) return result;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "balance not found");
  return Result::Ok();
}

// ------------------------------------------------------------------
// Ledger
// ------------------------------------------------------------------

Result SqliteRepository::AppendLedgerEntry(Transaction& t, model::LedgerEntryRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::INSERT_LEDGER_ENTRY);
  if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.owner_id);
  BindText(st.get(), 2, model::ToString(r.type));
  BindI64(st.get(), 3, r.amount_cents);
  BindOptionalText(st.get(), 4, r.request_id);
  BindOptionalText(st.get(), 5, r.thread_id);
  BindOptionalText(st.get(), 6, r.message_id);
  BindOptionalText(st.get(), 7, r.model_id);
  BindOptionalText(st.get(), 8, r.provider);
  BindText(st.get(), 9, r.metadata_json.empty() ? "{}" : r.metadata_json);
  BindU64(st.get(), 10, r.created_at_ms);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (result) r.id = static_cast<std::uint64_t>(sqlite3_last_insert_rowid(db));
  return result;
}

std::vector<model::LedgerEntryRecord> SqliteRepository::ListLedgerEntries(Transaction& t, const std::string& owner_id) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::SELECT_LEDGER_ENTRIES);
  if (!st.Ok()) ThrowRead(db, "select ledger entries");

  BindText(st.get(), 1, owner_id);

  std::vector<model::LedgerEntryRecord> out;
  int                                   rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(ReadLedgerEntry(st.get()));
  }
  CheckReadStep(db, rc, "select ledger entries");
  return out;
}

// ------------------------------------------------------------------
// Threads
// ------------------------------------------------------------------

Result SqliteRepository::InsertThread(Transaction& t, const model::ThreadRecord& r) {
  auto* db = TX(t).Handle();
  {
    Statement st(db, sql::INSERT_THREAD);
    if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.id);
    BindText(st.get(), 2, r.title);
    BindText(st.get(), 3, r.visibility);
    BindText(st.get(), 4, r.created_by_user_id);
    BindU64(st.get(), 5, r.created_at_ms);
    BindU64(st.get(), 6, r.updated_at_ms);

    int rc = sqlite3_step(st.get());
    if ((rc & 0xff) == SQLITE_CONSTRAINT) return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
    auto result = Translate(db, rc);
    if (!result) return result;
  }

  for (const auto& user_id : r.participant_ids) {
    auto result = AddThreadParticipant(t, r.id, user_id);
    if (!result) return result;
  }
  return Result::Ok();
}

std::optional<model::ThreadRecord> SqliteRepository::GetThread(Transaction& t, const std::string& thread_id) {
  auto* db = TX(t).Handle();

  model::ThreadRecord r;
  {
    Statement st(db, sql::SELECT_THREAD);
    if (!st.Ok()) ThrowRead(db, "select thread");

    BindText(st.get(), 1, thread_id);
    int rc = sqlite3_step(st.get());
    CheckReadStep(db, rc, "select thread");
    if (rc != SQLITE_ROW) return std::nullopt;

    r.id                 = ColText(st.get(), 0);
    r.title              = ColText(st.get(), 1);
    r.visibility         = ColText(st.get(), 2);
    r.created_by_user_id = ColText(st.get(), 3);
    r.created_at_ms      = ColU64(st.get(), 4);
    r.updated_at_ms      = ColU64(st.get(), 5);
  }

  Statement st(db, sql::SELECT_THREAD_PARTICIPANTS);
  if (!st.Ok()) ThrowRead(db, "select thread participants");
  BindText(st.get(), 1, thread_id);
  int rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    r.participant_ids.push_back(ColText(st.get(), 0));
  }
  CheckReadStep(db, rc, "select thread participants");
  return r;
}

Result SqliteRepository::AddThreadParticipant(Transaction& t, const std::string& thread_id, const std::string& user_id) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::INSERT_THREAD_PARTICIPANT);
  if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, thread_id);
  BindText(st.get(), 2, user_id);
  int rc = sqlite3_step(st.get());
  // the foreign key is the only constraint left once duplicates are ignored
  if ((rc & 0xff) == SQLITE_CONSTRAINT) return Result::Err(ErrorCode::NotFound, sqlite3_errmsg(db));
  return Translate(db, rc);
}

Result SqliteRepository::UpdateThreadTitle(Transaction& t, const std::string& thread_id, const std::string& title, std::uint64_t updated_at_ms) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::UPDATE_THREAD_TITLE);
  if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, title);
  BindU64(st.get(), 2, updated_at_ms);
  BindText(st.get(), 3, thread_id);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (!result) return result;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Messages and citations
// ------------------------------------------------------------------

Result SqliteRepository::InsertMessage(Transaction& t, model::MessageRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::INSERT_MESSAGE);
  if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.thread_id);
  BindOptionalText(st.get(), 3, r.user_id);
  BindText(st.get(), 4, r.role);
  BindText(st.get(), 5, r.content);
  BindOptionalText(st.get(), 6, r.model_id);
  BindOptionalText(st.get(), 7, r.provider);
  BindI64(st.get(), 8, r.input_tokens);
  BindI64(st.get(), 9, r.output_tokens);
  BindI64(st.get(), 10, r.total_tokens);
  BindI64(st.get(), 11, r.cost_cents);
  BindOptionalText(st.get(), 12, r.billing_mode);
  BindOptionalText(st.get(), 13, r.usage_json);
  BindU64(st.get(), 14, r.created_at_ms);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (result) r.seq = static_cast<std::uint64_t>(sqlite3_last_insert_rowid(db));
  return result;
}

std::vector<model::MessageRecord> SqliteRepository::ListRecentMessages(Transaction& t, const std::string& thread_id, std::size_t limit) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::SELECT_RECENT_MESSAGES);
  if (!st.Ok()) ThrowRead(db, "select recent messages");

  BindText(st.get(), 1, thread_id);
  BindU64(st.get(), 2, limit);

  std::vector<model::MessageRecord> out;
  int                               rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(ReadMessage(st.get()));
  }
  CheckReadStep(db, rc, "select recent messages");
  return out;
}

Result SqliteRepository::InsertCitations(Transaction& t, const std::vector<model::CitationRecord>& citations) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::INSERT_CITATION);
  if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  for (const auto& c : citations) {
    sqlite3_reset(st.get());
    sqlite3_clear_bindings(st.get());

    BindText(st.get(), 1, c.message_id);
    BindI64(st.get(), 2, c.rank);
    BindText(st.get(), 3, c.chunk_id);
    BindText(st.get(), 4, c.doc_id);
    BindText(st.get(), 5, c.url);
    BindText(st.get(), 6, c.title);
    BindOptionalText(st.get(), 7, c.section);
    BindDouble(st.get(), 8, c.score);
    BindText(st.get(), 9, c.snippet);
    BindDouble(st.get(), 10, c.multiplier);

    auto result = Translate(db, sqlite3_step(st.get()));
    if (!result) return result;
  }
  return Result::Ok();
}

std::vector<model::CitationRecord> SqliteRepository::ListCitations(Transaction& t, const std::string& message_id) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::SELECT_CITATIONS);
  if (!st.Ok()) ThrowRead(db, "select citations");

  BindText(st.get(), 1, message_id);

  std::vector<model::CitationRecord> out;
  int                                rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    model::CitationRecord c;
    c.message_id = ColText(st.get(), 0);
    c.rank       = static_cast<int>(ColI64(st.get(), 1));
    c.chunk_id   = ColText(st.get(), 2);
    c.doc_id     = ColText(st.get(), 3);
    c.url        = ColText(st.get(), 4);
    c.title      = ColText(st.get(), 5);
    c.section    = ColText(st.get(), 6);
    c.score      = ColDouble(st.get(), 7);
    c.snippet    = ColText(st.get(), 8);
    c.multiplier = ColDouble(st.get(), 9);
    out.push_back(std::move(c));
  }
  CheckReadStep(db, rc, "select citations");
  return out;
}

// ------------------------------------------------------------------
// Personal credentials
// ------------------------------------------------------------------

Result SqliteRepository::InsertCredential(Transaction& t, const model::CredentialRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::INSERT_CREDENTIAL);
  if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.owner_id);
  BindText(st.get(), 3, r.provider);
  BindOptionalText(st.get(), 4, r.label);
  BindText(st.get(), 5, r.encrypted_key);
  BindText(st.get(), 6, r.key_preview);
  BindU64(st.get(), 7, r.created_at_ms);
  BindU64(st.get(), 8, r.updated_at_ms);

  int rc = sqlite3_step(st.get());
  if ((rc & 0xff) == SQLITE_CONSTRAINT) return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
  return Translate(db, rc);
}

std::optional<model::CredentialRecord> SqliteRepository::GetCredential(Transaction& t, const std::string& credential_id,
                                                                       const std::string& owner_id) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::SELECT_CREDENTIAL);
  if (!st.Ok()) ThrowRead(db, "select credential");

  BindText(st.get(), 1, credential_id);
  BindText(st.get(), 2, owner_id);
  int rc = sqlite3_step(st.get());
  CheckReadStep(db, rc, "select credential");
  if (rc != SQLITE_ROW) return std::nullopt;

  model::CredentialRecord r;
  r.id            = ColText(st.get(), 0);
  r.owner_id      = ColText(st.get(), 1);
  r.provider      = ColText(st.get(), 2);
  r.label         = ColText(st.get(), 3);
  r.encrypted_key = ColText(st.get(), 4);
  r.key_preview   = ColText(st.get(), 5);
  r.created_at_ms = ColU64(st.get(), 6);
  r.updated_at_ms = ColU64(st.get(), 7);
  return r;
}

Result SqliteRepository::UpdateCredentialSecret(Transaction& t, const std::string& credential_id, const std::string& encrypted_key,
                                                const std::string& key_preview, std::uint64_t updated_at_ms) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::UPDATE_CREDENTIAL_SECRET);
  if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, encrypted_key);
  BindText(st.get(), 2, key_preview);
  BindU64(st.get(), 3, updated_at_ms);
  BindText(st.get(), 4, credential_id);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (!result) return result;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Audit events
// ------------------------------------------------------------------

Result SqliteRepository::InsertAuditEvent(Transaction& t, model::AuditEventRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::INSERT_AUDIT_EVENT);
  if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.actor_user_id);
  BindText(st.get(), 2, r.action);
  BindText(st.get(), 3, r.target_type);
  BindOptionalText(st.get(), 4, r.target_id);
  BindText(st.get(), 5, r.metadata_json.empty() ? "{}" : r.metadata_json);
  BindU64(st.get(), 6, r.created_at_ms);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (result) r.id = static_cast<std::uint64_t>(sqlite3_last_insert_rowid(db));
  return result;
}

std::vector<model::AuditEventRecord> SqliteRepository::ListAuditEvents(Transaction& t, const std::string& action) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::SELECT_AUDIT_EVENTS);
  if (!st.Ok()) ThrowRead(db, "select audit events");

  BindText(st.get(), 1, action);

  std::vector<model::AuditEventRecord> out;
  int                                  rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    model::AuditEventRecord r;
    r.id            = ColU64(st.get(), 0);
    r.actor_user_id = ColText(st.get(), 1);
    r.action        = ColText(st.get(), 2);
    r.target_type   = ColText(st.get(), 3);
    r.target_id     = ColText(st.get(), 4);
    r.metadata_json = ColText(st.get(), 5);
    r.created_at_ms = ColU64(st.get(), 6);
    out.push_back(std::move(r));
  }
  CheckReadStep(db, rc, "select audit events");
  return out;
}

// ------------------------------------------------------------------
// Retrieval signals
// ------------------------------------------------------------------

Result SqliteRepository::UpsertRetrievalSignal(Transaction& t, const model::RetrievalSignalRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::UPSERT_RETRIEVAL_SIGNAL);
  if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.chunk_id);
  BindText(st.get(), 2, r.doc_id);
  BindI64(st.get(), 3, r.rating_count);
  BindDouble(st.get(), 4, r.avg_rating);
  BindI64(st.get(), 5, r.low_rating_count);
  BindI64(st.get(), 6, r.high_rating_count);
  BindDouble(st.get(), 7, r.confidence);
  BindDouble(st.get(), 8, r.multiplier);
  BindU64(st.get(), 9, r.updated_at_ms);
  return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::RetrievalSignalRecord> SqliteRepository::ListRetrievalSignals(Transaction& t) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::SELECT_RETRIEVAL_SIGNALS);
  if (!st.Ok()) ThrowRead(db, "select retrieval signals");

  std::vector<model::RetrievalSignalRecord> out;
  int                                       rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    model::RetrievalSignalRecord r;
    r.chunk_id          = ColText(st.get(), 0);
    r.doc_id            = ColText(st.get(), 1);
    r.rating_count      = ColI64(st.get(), 2);
    r.avg_rating        = ColDouble(st.get(), 3);
    r.low_rating_count  = ColI64(st.get(), 4);
    r.high_rating_count = ColI64(st.get(), 5);
    r.confidence        = ColDouble(st.get(), 6);
    r.multiplier        = ColDouble(st.get(), 7);
    r.updated_at_ms     = ColU64(st.get(), 8);
    out.push_back(std::move(r));
  }
  CheckReadStep(db, rc, "select retrieval signals");
  return out;
}

} // namespace ragturn::db::sqlite
