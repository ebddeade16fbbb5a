#include "balance_ledger.hpp"

#include <algorithm>

#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace ragturn::ledger {

using db::model::LedgerEntryType;

namespace {

std::uint64_t NowMs() {
  return static_cast<std::uint64_t>(util::NowMillis());
}

std::int64_t ReadBalanceCents(db::Repository& repo, db::Transaction& tx, const std::string& owner_id) {
  const auto balance = repo.GetBalance(tx, owner_id);
  return balance ? balance->balance_cents : 0;
}

void RecordOutcome(std::string_view op, bool success) {
  observability::Metrics::Instance().RecordLedgerOperation(op, success);
}

} // namespace

BalanceLedger::BalanceLedger(std::shared_ptr<db::Repository> repo) : repo_(std::move(repo)) {
}

db::model::LedgerEntryRecord BalanceLedger::MakeEntry(const std::string& owner_id, LedgerEntryType type, std::int64_t amount_cents,
                                                      const Correlation& correlation, const util::JsonObject& metadata,
                                                      std::uint64_t now_ms) const {
  db::model::LedgerEntryRecord entry;
  entry.owner_id      = owner_id;
  entry.type          = type;
  entry.amount_cents  = amount_cents;
  entry.request_id    = correlation.request_id;
  entry.thread_id     = correlation.thread_id;
  entry.message_id    = correlation.message_id;
  entry.model_id      = correlation.model_id;
  entry.provider      = correlation.provider;
  entry.metadata_json = metadata.fields().empty() ? std::string{} : util::ToJson(metadata);
  entry.created_at_ms = now_ms;
  return entry;
}

std::int64_t BalanceLedger::Grant(const std::string& owner_id, std::int64_t amount_cents, const std::string& actor_user_id,
                                  const std::optional<std::string>& reason) {
  observability::SpanScope span("ledger.grant");
  if (amount_cents <= 0) {
    throw util::InvalidArgument("invalid_credit_amount", "Credit amount must be positive.");
  }

  util::JsonObject metadata;
  if (reason) {
    util::SetString(metadata, "reason", *reason);
  } else {
    util::SetNull(metadata, "reason");
  }
  util::SetString(metadata, "grantedByUserId", actor_user_id);

  const auto now = NowMs();
  auto       tx  = repo_->Begin();
  db::ThrowIfDbError(repo_->GrantBalance(*tx, owner_id, amount_cents, now), "grant balance");
  auto entry = MakeEntry(owner_id, LedgerEntryType::kGrant, amount_cents, Correlation{}, metadata, now);
  db::ThrowIfDbError(repo_->AppendLedgerEntry(*tx, entry), "append grant entry");
  const auto remaining = ReadBalanceCents(*repo_, *tx, owner_id);
  tx->Commit();

  RecordOutcome("grant", true);
  RAGTURN_LOG_INFO("credit granted", {observability::StringField("owner_id", owner_id), observability::IntField("amount_cents", amount_cents),
                                      observability::StringField("actor_user_id", actor_user_id),
                                      observability::IntField("balance_cents", remaining)});
  return remaining;
}

std::int64_t BalanceLedger::Reserve(const std::string& owner_id, std::int64_t amount_cents, const Correlation& correlation,
                                    const util::JsonObject& metadata) {
  observability::SpanScope span("ledger.reserve");
  span.SetAttribute("ledger.amount_cents", amount_cents);
  if (amount_cents <= 0) {
    throw util::InvalidArgument("invalid_reservation", "Reservation amount must be positive.");
  }

  const auto now = NowMs();
  auto       tx  = repo_->Begin();

  const auto decremented = repo_->DecrementBalanceIfSufficient(*tx, owner_id, amount_cents, now);
  if (decremented.code == db::ErrorCode::Conflict) {
    const auto remaining = ReadBalanceCents(*repo_, *tx, owner_id);
    tx->Rollback();
    RecordOutcome("reserve", false);
    RAGTURN_LOG_WARN("reservation refused", {observability::StringField("owner_id", owner_id),
                                             observability::StringField("request_id", correlation.request_id),
                                             observability::IntField("amount_cents", amount_cents),
                                             observability::IntField("balance_cents", remaining)});
    throw util::InsufficientBalance(remaining);
  }
  db::ThrowIfDbError(decremented, "reserve balance");

  auto entry = MakeEntry(owner_id, LedgerEntryType::kReserve, amount_cents, correlation, metadata, now);
  db::ThrowIfDbError(repo_->AppendLedgerEntry(*tx, entry), "append reserve entry");
  const auto remaining = ReadBalanceCents(*repo_, *tx, owner_id);
  tx->Commit();

  RecordOutcome("reserve", true);
  RAGTURN_LOG_INFO("balance reserved", {observability::StringField("owner_id", owner_id),
                                        observability::StringField("request_id", correlation.request_id),
                                        observability::IntField("amount_cents", amount_cents),
                                        observability::IntField("balance_cents", remaining)});
  return remaining;
}

SettlementResult BalanceLedger::Finalize(const std::string& owner_id, std::int64_t reserved_cents, std::int64_t actual_cost_cents,
                                         const Correlation& correlation, const util::JsonObject& metadata) {
  observability::SpanScope span("ledger.finalize");

  SettlementResult result;
  const auto       reserved = std::max<std::int64_t>(0, reserved_cents);
  const auto       actual   = std::max<std::int64_t>(0, actual_cost_cents);
  result.debited_cents      = std::min(actual, reserved);
  result.released_cents     = reserved - result.debited_cents;
  result.overrun_cents      = actual - result.debited_cents;

  util::JsonObject entry_metadata = metadata;
  util::SetInt(entry_metadata, "rawActualCostCents", actual);
  util::SetInt(entry_metadata, "debitedCents", result.debited_cents);
  if (result.overrun_cents > 0) {
    util::SetInt(entry_metadata, "overrun_cents", result.overrun_cents);
  }

  const auto now = NowMs();
  auto       tx  = repo_->Begin();
  db::ThrowIfDbError(repo_->SettleBalance(*tx, owner_id, result.released_cents, result.debited_cents, now), "settle balance");

  if (result.debited_cents > 0) {
    auto debit = MakeEntry(owner_id, LedgerEntryType::kDebit, result.debited_cents, correlation, entry_metadata, now);
    db::ThrowIfDbError(repo_->AppendLedgerEntry(*tx, debit), "append debit entry");
  }
  if (result.released_cents > 0) {
    auto release = MakeEntry(owner_id, LedgerEntryType::kRelease, result.released_cents, correlation, entry_metadata, now);
    db::ThrowIfDbError(repo_->AppendLedgerEntry(*tx, release), "append release entry");
  }
  result.remaining_balance_cents = ReadBalanceCents(*repo_, *tx, owner_id);
  tx->Commit();

  RecordOutcome("finalize", true);
  if (result.overrun_cents > 0) {
    // The estimate is supposed to bound the actual cost; the difference is absorbed, not charged.
    observability::Metrics::Instance().RecordSettlementOverrun(result.overrun_cents);
    RAGTURN_LOG_ERROR("settlement exceeded reservation", {observability::StringField("owner_id", owner_id),
                                                          observability::StringField("request_id", correlation.request_id),
                                                          observability::StringField("model_id", correlation.model_id),
                                                          observability::IntField("reserved_cents", reserved),
                                                          observability::IntField("actual_cost_cents", actual),
                                                          observability::IntField("overrun_cents", result.overrun_cents)});
  } else {
    RAGTURN_LOG_INFO("reservation settled", {observability::StringField("owner_id", owner_id),
                                             observability::StringField("request_id", correlation.request_id),
                                             observability::IntField("debited_cents", result.debited_cents),
                                             observability::IntField("released_cents", result.released_cents)});
  }
  return result;
}

std::int64_t BalanceLedger::Release(const std::string& owner_id, std::int64_t reserved_cents, const Correlation& correlation,
                                    const std::string& reason, const std::string& error_code) {
  if (reserved_cents <= 0) {
    return 0;
  }
  observability::SpanScope span("ledger.release");

  util::JsonObject metadata;
  util::SetString(metadata, "reason", reason);
  if (!error_code.empty()) {
    util::SetString(metadata, "code", error_code);
  }

  const auto now = NowMs();
  auto       tx  = repo_->Begin();
  db::ThrowIfDbError(repo_->SettleBalance(*tx, owner_id, reserved_cents, 0, now), "release balance");
  auto entry = MakeEntry(owner_id, LedgerEntryType::kRelease, reserved_cents, correlation, metadata, now);
  db::ThrowIfDbError(repo_->AppendLedgerEntry(*tx, entry), "append release entry");
  const auto remaining = ReadBalanceCents(*repo_, *tx, owner_id);
  tx->Commit();

  RecordOutcome("release", true);
  RAGTURN_LOG_WARN("reservation released", {observability::StringField("owner_id", owner_id),
                                            observability::StringField("request_id", correlation.request_id),
                                            observability::IntField("released_cents", reserved_cents),
                                            observability::StringField("reason", reason), observability::StringField("code", error_code)});
  return remaining;
}

db::model::BalanceRecord BalanceLedger::Balance(const std::string& owner_id) {
  auto tx      = repo_->Begin();
  auto balance = repo_->GetBalance(*tx, owner_id);
  tx->Commit();
  if (balance) return *balance;

  db::model::BalanceRecord empty;
  empty.owner_id = owner_id;
  return empty;
}

std::vector<db::model::LedgerEntryRecord> BalanceLedger::History(const std::string& owner_id) {
  auto tx      = repo_->Begin();
  auto entries = repo_->ListLedgerEntries(*tx, owner_id);
  tx->Commit();
  return entries;
}

} // namespace ragturn::ledger
