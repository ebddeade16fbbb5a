#pragma once

#include <cstdint>
#include <string>

namespace ragturn::db::model {

inline constexpr const char* kRoleUser      = "user";
inline constexpr const char* kRoleAssistant = "assistant";

inline constexpr const char* kBillingHouseKey    = "house_key";
inline constexpr const char* kBillingPersonalKey = "personal_key";

struct MessageRecord {
  std::string id;
  std::string thread_id;
  std::string user_id; // empty for assistant messages
  std::string role;
  std::string content;

  // assistant only
  std::string  model_id;
  std::string  provider;
  std::int64_t input_tokens  = 0;
  std::int64_t output_tokens = 0;
  std::int64_t total_tokens  = 0;
  std::int64_t cost_cents    = 0;
  std::string  billing_mode;
  std::string  usage_json;

  std::uint64_t created_at_ms = 0;

  // Insertion order within the store; assigned by InsertMessage.
  std::uint64_t seq = 0;
};

} // namespace ragturn::db::model
