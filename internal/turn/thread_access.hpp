#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/db/model/thread_record.hpp"

namespace ragturn::db {
class Repository;
}

namespace ragturn::turn {

// org threads are open; otherwise only the creator and participants.
// Throws util::PermissionDenied("forbidden").
void CheckThreadAccess(const db::model::ThreadRecord& thread, const std::string& user_id);

// Whitespace-compacted content, shortened to 69 characters plus "..." past 72.
std::string DeriveThreadTitle(const std::string& content);

struct NewThread {
  std::string              created_by_user_id;
  std::string              title;      // blank means the default title
  std::string              visibility; // blank means org
  std::vector<std::string> participant_ids;
};

db::model::ThreadRecord CreateThread(db::Repository& repo, const NewThread& request);

} // namespace ragturn::turn
