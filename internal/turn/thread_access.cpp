#include "thread_access.hpp"

#include <algorithm>

#include "internal/db/api/repository.hpp"
#include "internal/retrieval/text.hpp"
#include "internal/turn/turn_types.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace ragturn::turn {

namespace {

constexpr std::size_t kTitleTruncatedAt = 69;

} // namespace

void CheckThreadAccess(const db::model::ThreadRecord& thread, const std::string& user_id) {
  if (thread.visibility == db::model::kVisibilityOrg) return;
  if (thread.created_by_user_id == user_id) return;

  const auto& participants = thread.participant_ids;
  if (std::find(participants.begin(), participants.end(), user_id) != participants.end()) return;

  throw util::PermissionDenied("forbidden", "Forbidden");
}

std::string DeriveThreadTitle(const std::string& content) {
  auto normalized = retrieval::CompactWhitespace(content);
  if (normalized.empty()) return db::model::kDefaultThreadTitle;
  if (retrieval::CodePointCount(normalized) <= kMaxThreadTitleLength) return normalized;

  auto head = retrieval::TruncateCodePoints(normalized, kTitleTruncatedAt);
  while (!head.empty() && head.back() == ' ') head.pop_back();
  return head + "...";
}

db::model::ThreadRecord CreateThread(db::Repository& repo, const NewThread& request) {
  if (util::IsBlank(request.created_by_user_id)) {
    throw util::InvalidArgument("missing_user_id", "user_id is required");
  }

  db::model::ThreadRecord thread;
  thread.id                 = util::NewId();
  thread.created_by_user_id = request.created_by_user_id;

  auto title = util::Trim(request.title);
  if (!title.empty()) thread.title = title;

  auto visibility = util::ToLowerAscii(util::Trim(request.visibility));
  if (!visibility.empty()) {
    if (visibility != db::model::kVisibilityOrg && visibility != db::model::kVisibilityPrivate) {
      throw util::InvalidArgument("invalid_visibility", "visibility must be 'org' or 'private'");
    }
    thread.visibility = visibility;
  }

  thread.created_at_ms   = static_cast<std::uint64_t>(util::NowMillis());
  thread.updated_at_ms   = thread.created_at_ms;
  thread.participant_ids = request.participant_ids;

  auto tx = repo.Begin();
  db::ThrowIfDbError(repo.InsertThread(*tx, thread), "insert thread");
  tx->Commit();
  return thread;
}

} // namespace ragturn::turn
