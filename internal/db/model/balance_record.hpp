#pragma once

#include <cstdint>
#include <string>

namespace ragturn::db::model {

/*
  Prepaid balance of one owner, in integer cents.

  balance_cents never goes negative: the only decrement is the conditional
  one in Repository::DecrementBalanceIfSufficient.
*/
struct BalanceRecord {
  std::string owner_id;

  std::int64_t balance_cents          = 0;
  std::int64_t lifetime_granted_cents = 0;
  std::int64_t lifetime_spent_cents   = 0;

  std::uint64_t updated_at_ms = 0;
};

} // namespace ragturn::db::model
