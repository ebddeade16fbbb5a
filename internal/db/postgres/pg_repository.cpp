#include "pg_repository.hpp"

#include "internal/util/errors.hpp"

namespace ragturn::db::postgres {

namespace {

model::LedgerEntryRecord ReadLedgerEntry(const pqxx::row& row) {
  model::LedgerEntryRecord r;
  r.id            = row[0].as<std::uint64_t>();
  r.owner_id      = row[1].c_str();
  r.type          = model::ParseLedgerEntryType(row[2].c_str()).value_or(model::LedgerEntryType::kGrant);
  r.amount_cents  = row[3].as<std::int64_t>();
  r.request_id    = row[4].c_str();
  r.thread_id     = row[5].c_str();
  r.message_id    = row[6].c_str();
  r.model_id      = row[7].c_str();
  r.provider      = row[8].c_str();
  r.metadata_json = row[9].c_str();
  r.created_at_ms = row[10].as<std::uint64_t>();
  return r;
}

model::MessageRecord ReadMessage(const pqxx::row& row) {
  model::MessageRecord r;
  r.seq           = row[0].as<std::uint64_t>();
  r.id            = row[1].c_str();
  r.thread_id     = row[2].c_str();
  r.user_id       = row[3].c_str();
  r.role          = row[4].c_str();
  r.content       = row[5].c_str();
  r.model_id      = row[6].c_str();
  r.provider      = row[7].c_str();
  r.input_tokens  = row[8].as<std::int64_t>();
  r.output_tokens = row[9].as<std::int64_t>();
  r.total_tokens  = row[10].as<std::int64_t>();
  r.cost_cents    = row[11].as<std::int64_t>();
  r.billing_mode  = row[12].c_str();
  r.usage_json    = row[13].c_str();
  r.created_at_ms = row[14].as<std::uint64_t>();
  return r;
}

std::string JsonOrEmptyObject(const std::string& json) {
  return json.empty() ? "{}" : json;
}

[[noreturn]] void ThrowRead(const std::exception& e, const char* what) {
  throw util::StorageError("postgres_error", std::string(what) + ": " + e.what());
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) return Result::Err(ErrorCode::AlreadyExists, e.what());
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) return Result::Err(ErrorCode::ConstraintViolation, e.what());
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) return Result::Err(ErrorCode::SerializationFailure, e.what());
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return Result::Err(ErrorCode::IOError, e.what());
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Balances
// ------------------------------------------------------------------

std::optional<model::BalanceRecord> PgRepository::GetBalance(Transaction& t, const std::string& owner_id) {
  try {
    auto res = TX(t).Work().exec_prepared("select_balance", owner_id);
    if (res.empty()) return std::nullopt;

    model::BalanceRecord r;
    r.owner_id               = res[0][0].c_str();
    r.balance_cents          = res[0][1].as<std::int64_t>();
    r.lifetime_granted_cents = res[0][2].as<std::int64_t>();
    r.lifetime_spent_cents   = res[0][3].as<std::int64_t>();
    r.updated_at_ms          = res[0][4].as<std::uint64_t>();
    return r;
  } catch (const pqxx::failure& e) {
    ThrowRead(e, "select balance");
  }
}

Result PgRepository::GrantBalance(Transaction& t, const std::string& owner_id, std::int64_t amount_cents, std::uint64_t now_ms) {
  try {
    TX(t).Work().exec_prepared("grant_balance", owner_id, amount_cents, now_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DecrementBalanceIfSufficient(Transaction& t, const std::string& owner_id, std::int64_t amount_cents, std::uint64_t now_ms) {
  try {
    auto res = TX(t).Work().exec_prepared("decrement_balance_if_sufficient", amount_cents, now_ms, owner_id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::Conflict, "insufficient balance");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::SettleBalance(Transaction& t, const std::string& owner_id, std::int64_t credit_cents, std::int64_t spent_cents,
                                   std::uint64_t now_ms) {
  try {
    auto res = TX(t).Work().exec_prepared("settle_balance", credit_cents, spent_cents, now_ms, owner_id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "balance not found");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Ledger
// ------------------------------------------------------------------

Result PgRepository::AppendLedgerEntry(Transaction& t, model::LedgerEntryRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_ledger_entry", r.owner_id, std::string(model::ToString(r.type)), r.amount_cents, r.request_id,
                                          r.thread_id, r.message_id, r.model_id, r.provider, JsonOrEmptyObject(r.metadata_json), r.created_at_ms);
    r.id = res[0][0].as<std::uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::LedgerEntryRecord> PgRepository::ListLedgerEntries(Transaction& t, const std::string& owner_id) {
  try {
    auto                                  res = TX(t).Work().exec_prepared("select_ledger_entries", owner_id);
    std::vector<model::LedgerEntryRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) out.push_back(ReadLedgerEntry(row));
    return out;
  } catch (const pqxx::failure& e) {
    ThrowRead(e, "select ledger entries");
  }
}

// ------------------------------------------------------------------
// Threads
// ------------------------------------------------------------------

Result PgRepository::InsertThread(Transaction& t, const model::ThreadRecord& r) {
  try {
    auto& work = TX(t).Work();
    work.exec_prepared("insert_thread", r.id, r.title, r.visibility, r.created_by_user_id, r.created_at_ms, r.updated_at_ms);
    for (const auto& user_id : r.participant_ids) {
      work.exec_prepared("insert_thread_participant", r.id, user_id);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ThreadRecord> PgRepository::GetThread(Transaction& t, const std::string& thread_id) {
  try {
    auto& work = TX(t).Work();
    auto  res  = work.exec_prepared("select_thread", thread_id);
    if (res.empty()) return std::nullopt;

    model::ThreadRecord r;
    r.id                 = res[0][0].c_str();
    r.title              = res[0][1].c_str();
    r.visibility         = res[0][2].c_str();
    r.created_by_user_id = res[0][3].c_str();
    r.created_at_ms      = res[0][4].as<std::uint64_t>();
    r.updated_at_ms      = res[0][5].as<std::uint64_t>();

    for (const auto& row : work.exec_prepared("select_thread_participants", thread_id)) {
      r.participant_ids.emplace_back(row[0].c_str());
    }
    return r;
  } catch (const pqxx::failure& e) {
    ThrowRead(e, "select thread");
  }
}

Result PgRepository::AddThreadParticipant(Transaction& t, const std::string& thread_id, const std::string& user_id) {
  try {
    TX(t).Work().exec_prepared("insert_thread_participant", thread_id, user_id);
    return Result::Ok();
  } catch (const pqxx::foreign_key_violation& e) {
    return Result::Err(ErrorCode::NotFound, e.what());
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateThreadTitle(Transaction& t, const std::string& thread_id, const std::string& title, std::uint64_t updated_at_ms) {
  try {
    auto res = TX(t).Work().exec_prepared("update_thread_title", thread_id, title, updated_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Messages and citations
// ------------------------------------------------------------------

Result PgRepository::InsertMessage(Transaction& t, model::MessageRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_message", r.id, r.thread_id, r.user_id, r.role, r.content, r.model_id, r.provider,
                                          r.input_tokens, r.output_tokens, r.total_tokens, r.cost_cents, r.billing_mode, r.usage_json,
                                          r.created_at_ms);
    r.seq = res[0][0].as<std::uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::MessageRecord> PgRepository::ListRecentMessages(Transaction& t, const std::string& thread_id, std::size_t limit) {
  try {
    auto res = TX(t).Work().exec_prepared("select_recent_messages", thread_id, static_cast<std::int64_t>(limit));
    std::vector<model::MessageRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) out.push_back(ReadMessage(row));
    return out;
  } catch (const pqxx::failure& e) {
    ThrowRead(e, "select recent messages");
  }
}

Result PgRepository::InsertCitations(Transaction& t, const std::vector<model::CitationRecord>& citations) {
  try {
    auto& work = TX(t).Work();
    for (const auto& c : citations) {
      work.exec_prepared("insert_citation", c.message_id, c.rank, c.chunk_id, c.doc_id, c.url, c.title, c.section, c.score, c.snippet,
                         c.multiplier);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::CitationRecord> PgRepository::ListCitations(Transaction& t, const std::string& message_id) {
  try {
    auto                               res = TX(t).Work().exec_prepared("select_citations", message_id);
    std::vector<model::CitationRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) {
      model::CitationRecord c;
      c.message_id = row[0].c_str();
      c.rank       = row[1].as<int>();
      c.chunk_id   = row[2].c_str();
      c.doc_id     = row[3].c_str();
      c.url        = row[4].c_str();
      c.title      = row[5].c_str();
      c.section    = row[6].c_str();
      c.score      = row[7].as<double>();
      c.snippet    = row[8].c_str();
      c.multiplier = row[9].as<double>();
      out.push_back(std::move(c));
    }
    return out;
  } catch (const pqxx::failure& e) {
    ThrowRead(e, "select citations");
  }
}

// ------------------------------------------------------------------
// Personal credentials
// ------------------------------------------------------------------

Result PgRepository::InsertCredential(Transaction& t, const model::CredentialRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_credential", r.id, r.owner_id, r.provider, r.label, r.encrypted_key, r.key_preview, r.created_at_ms,
                               r.updated_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::CredentialRecord> PgRepository::GetCredential(Transaction& t, const std::string& credential_id, const std::string& owner_id) {
  try {
    auto res = TX(t).Work().exec_prepared("select_credential", credential_id, owner_id);
    if (res.empty()) return std::nullopt;

    model::CredentialRecord r;
    r.id            = res[0][0].c_str();
    r.owner_id      = res[0][1].c_str();
    r.provider      = res[0][2].c_str();
    r.label         = res[0][3].c_str();
    r.encrypted_key = res[0][4].c_str();
    r.key_preview   = res[0][5].c_str();
    r.created_at_ms = res[0][6].as<std::uint64_t>();
    r.updated_at_ms = res[0][7].as<std::uint64_t>();
    return r;
  } catch (const pqxx::failure& e) {
    ThrowRead(e, "select credential");
  }
}

Result PgRepository::UpdateCredentialSecret(Transaction& t, const std::string& credential_id, const std::string& encrypted_key,
                                            const std::string& key_preview, std::uint64_t updated_at_ms) {
  try {
    auto res = TX(t).Work().exec_prepared("update_credential_secret", credential_id, encrypted_key, key_preview, updated_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Audit events
// ------------------------------------------------------------------

Result PgRepository::InsertAuditEvent(Transaction& t, model::AuditEventRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_audit_event", r.actor_user_id, r.action, r.target_type, r.target_id,
                                          JsonOrEmptyObject(r.metadata_json), r.created_at_ms);
    r.id = res[0][0].as<std::uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::AuditEventRecord> PgRepository::ListAuditEvents(Transaction& t, const std::string& action) {
  try {
    auto                                 res = TX(t).Work().exec_prepared("select_audit_events", action);
    std::vector<model::AuditEventRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) {
      model::AuditEventRecord r;
      r.id            = row[0].as<std::uint64_t>();
      r.actor_user_id = row[1].c_str();
      r.action        = row[2].c_str();
      r.target_type   = row[3].c_str();
      r.target_id     = row[4].c_str();
      r.metadata_json = row[5].c_str();
      r.created_at_ms = row[6].as<std::uint64_t>();
      out.push_back(std::move(r));
    }
    return out;
  } catch (const pqxx::failure& e) {
    ThrowRead(e, "select audit events");
  }
}

// ------------------------------------------------------------------
// Retrieval signals
// ------------------------------------------------------------------

Result PgRepository::UpsertRetrievalSignal(Transaction& t, const model::RetrievalSignalRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_retrieval_signal", r.chunk_id, r.doc_id, r.rating_count, r.avg_rating, r.low_rating_count,
                               r.high_rating_count, r.confidence, r.multiplier, r.updated_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::RetrievalSignalRecord> PgRepository::ListRetrievalSignals(Transaction& t) {
  try {
    auto                                      res = TX(t).Work().exec_prepared("select_retrieval_signals");
    std::vector<model::RetrievalSignalRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) {
      model::RetrievalSignalRecord r;
      r.chunk_id          = row[0].c_str();
      r.doc_id            = row[1].c_str();
      r.rating_count      = row[2].as<std::int64_t>();
      r.avg_rating        = row[3].as<double>();
      r.low_rating_count  = row[4].as<std::int64_t>();
      r.high_rating_count = row[5].as<std::int64_t>();
      r.confidence        = row[6].as<double>();
      r.multiplier        = row[7].as<double>();
      r.updated_at_ms     = row[8].as<std::uint64_t>();
      out.push_back(std::move(r));
    }
    return out;
  } catch (const pqxx::failure& e) {
    ThrowRead(e, "select retrieval signals");
  }
}

} // namespace ragturn::db::postgres
