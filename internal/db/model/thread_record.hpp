#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace ragturn::db::model {

inline constexpr const char* kDefaultThreadTitle = "New thread";
inline constexpr const char* kVisibilityOrg      = "org";
inline constexpr const char* kVisibilityPrivate  = "private";

struct ThreadRecord {
  std::string id;
  std::string title      = kDefaultThreadTitle;
  std::string visibility = kVisibilityOrg;
  std::string created_by_user_id;

  std::uint64_t created_at_ms = 0;
  std::uint64_t updated_at_ms = 0;

  // Filled by GetThread; InsertThread stores them as participant rows.
  std::vector<std::string> participant_ids;
};

} // namespace ragturn::db::model
