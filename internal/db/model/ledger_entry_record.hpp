#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ragturn::db::model {

enum class LedgerEntryType {
  kGrant,
  kReserve,
  kDebit,
  kRelease,
};

inline const char* ToString(LedgerEntryType type) {
  switch (type) {
    case LedgerEntryType::kGrant: return "grant";
    case LedgerEntryType::kReserve: return "reserve";
    case LedgerEntryType::kDebit: return "debit";
    case LedgerEntryType::kRelease: return "release";
  }
  return "grant";
}

inline std::optional<LedgerEntryType> ParseLedgerEntryType(std::string_view value) {
  if (value == "grant") return LedgerEntryType::kGrant;
  if (value == "reserve") return LedgerEntryType::kReserve;
  if (value == "debit") return LedgerEntryType::kDebit;
  if (value == "release") return LedgerEntryType::kRelease;
  return std::nullopt;
}

/*
  Append-only audit row. Amounts are always positive; the type carries
  the direction.
*/
struct LedgerEntryRecord {
  std::uint64_t id = 0; // assigned on append

  std::string     owner_id;
  LedgerEntryType type         = LedgerEntryType::kGrant;
  std::int64_t    amount_cents = 0;

  // correlation, empty when unknown
  std::string request_id;
  std::string thread_id;
  std::string message_id;
  std::string model_id;
  std::string provider;

  std::string   metadata_json;
  std::uint64_t created_at_ms = 0;
};

} // namespace ragturn::db::model
