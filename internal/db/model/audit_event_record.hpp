#pragma once

#include <cstdint>
#include <string>

namespace ragturn::db::model {

struct AuditEventRecord {
  std::uint64_t id = 0; // assigned on insert

  std::string actor_user_id;
  std::string action;
  std::string target_type;
  std::string target_id;
  std::string metadata_json;

  std::uint64_t created_at_ms = 0;
};

} // namespace ragturn::db::model
