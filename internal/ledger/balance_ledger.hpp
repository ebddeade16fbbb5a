#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/balance_record.hpp"
#include "internal/db/model/ledger_entry_record.hpp"
#include "internal/util/json.hpp"

namespace ragturn::db {
class Repository;
}

namespace ragturn::ledger {

// Identifiers copied onto every ledger entry a call writes.
struct Correlation {
  std::string request_id;
  std::string thread_id;
  std::string message_id;
  std::string model_id;
  std::string provider;
};

struct SettlementResult {
  std::int64_t debited_cents           = 0;
  std::int64_t released_cents          = 0;
  std::int64_t remaining_balance_cents = 0;

  // actual cost above the reservation; never debited
  std::int64_t overrun_cents = 0;
};

/*
  BalanceLedger

  Prepaid balances in integer cents.

  Every operation runs in a single repository transaction and relies on the
  store for atomicity; there is no in-process locking. Reserve is the only
  path that lowers a balance, through the conditional decrement, so
  concurrent reservations can never overdraw.

  Finalize conserves the reservation: debited + released == reserved.
*/
class BalanceLedger {
 public:
  explicit BalanceLedger(std::shared_ptr<db::Repository> repo);

  // Returns the balance after the grant.
  std::int64_t Grant(const std::string& owner_id, std::int64_t amount_cents, const std::string& actor_user_id,
                     const std::optional<std::string>& reason);

  /*
    Holds `amount_cents` against the balance. Throws util::InsufficientBalance
    carrying the balance observed inside the same transaction when the
    conditional decrement changes nothing; no entry is written then.
    Returns the remaining balance.
  */
  std::int64_t Reserve(const std::string& owner_id, std::int64_t amount_cents, const Correlation& correlation,
                       const util::JsonObject& metadata = {});

  SettlementResult Finalize(const std::string& owner_id, std::int64_t reserved_cents, std::int64_t actual_cost_cents,
                            const Correlation& correlation, const util::JsonObject& metadata = {});

  // Full refund of a reservation whose call never completed. No-op for <= 0.
  std::int64_t Release(const std::string& owner_id, std::int64_t reserved_cents, const Correlation& correlation, const std::string& reason,
                       const std::string& error_code);

  // Zero balance when the owner was never funded.
  db::model::BalanceRecord Balance(const std::string& owner_id);

  std::vector<db::model::LedgerEntryRecord> History(const std::string& owner_id);

 private:
  db::model::LedgerEntryRecord MakeEntry(const std::string& owner_id, db::model::LedgerEntryType type, std::int64_t amount_cents,
                                         const Correlation& correlation, const util::JsonObject& metadata, std::uint64_t now_ms) const;

  std::shared_ptr<db::Repository> repo_;
};

} // namespace ragturn::ledger
