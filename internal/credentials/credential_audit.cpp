#include "credential_audit.hpp"

#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/json.hpp"
#include "internal/util/strings.hpp"
#include "internal/util/time.hpp"

namespace ragturn::credentials {

namespace {

constexpr const char* kTargetType = "user_api_key";

bool IsSafeTokenChar(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '.' || c == '_' || c == ':' || c == '-';
}

bool IsReasonChar(char c) {
  return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '.' || c == '_' || c == ':' || c == '-';
}

void SetOptional(util::JsonObject& object, std::string_view key, const std::optional<std::string>& value) {
  if (value) {
    util::SetString(object, key, *value);
  } else {
    util::SetNull(object, key);
  }
}

} // namespace

const char* ToString(AuditAction action) {
  switch (action) {
    case AuditAction::kCreate: return "user_api_key.create";
    case AuditAction::kUpdate: return "user_api_key.update";
    case AuditAction::kDelete: return "user_api_key.delete";
    case AuditAction::kUse: return "user_api_key.use";
  }
  return "user_api_key.use";
}

bool ContainsSensitiveFragment(std::string_view value) {
  const auto lower = util::ToLowerAscii(value);
  for (std::size_t pos = lower.find("sk-"); pos != std::string::npos; pos = lower.find("sk-", pos + 1)) {
    if (pos + 3 < lower.size()) {
      const char next = lower[pos + 3];
      if ((next >= 'a' && next <= 'z') || (next >= '0' && next <= '9')) return true;
    }
  }
  for (const char* fragment : {"apikey", "api-key", "api_key", "bearer", "token", "aiza"}) {
    if (lower.find(fragment) != std::string::npos) return true;
  }
  return false;
}

std::optional<std::string> SanitizeAuditToken(std::optional<std::string_view> value, std::optional<std::string> fallback) {
  if (!value || value->empty()) return fallback;

  auto trimmed = util::Trim(*value);
  if (trimmed.empty() || trimmed.size() > 128) return fallback;
  for (char c : trimmed) {
    if (!IsSafeTokenChar(c)) return fallback;
  }
  if (ContainsSensitiveFragment(trimmed)) return fallback;
  return trimmed;
}

std::optional<std::string> NormalizeReasonCode(std::optional<std::string_view> value) {
  if (!value || value->empty()) return std::nullopt;

  auto code = util::ToLowerAscii(util::Trim(*value));
  if (code.empty() || code.size() > 80) return std::string("redacted_reason");
  for (char c : code) {
    if (!IsReasonChar(c)) return std::string("redacted_reason");
  }
  if (ContainsSensitiveFragment(code)) return std::string("redacted_reason");
  return code;
}

CredentialAuditLog::CredentialAuditLog(std::shared_ptr<db::Repository> repo) : repo_(std::move(repo)) {
}

void CredentialAuditLog::Record(const CredentialAuditEvent& event) {
  const auto target_id  = SanitizeAuditToken(event.target_id, std::string("redacted"));
  const auto request_id = event.request_id ? SanitizeAuditToken(*event.request_id, std::nullopt) : std::nullopt;
  const auto reason     = event.reason_code ? NormalizeReasonCode(*event.reason_code) : std::nullopt;
  const auto now        = static_cast<std::uint64_t>(util::NowMillis());
  const auto result     = event.success ? "success" : "failure";

  util::JsonObject payload;
  util::SetString(payload, "actorUserId", event.actor_user_id);
  util::SetString(payload, "action", ToString(event.action));
  SetOptional(payload, "targetId", target_id);
  SetOptional(payload, "provider", event.provider);
  util::SetString(payload, "result", result);
  SetOptional(payload, "requestId", request_id);
  SetOptional(payload, "reasonCode", reason);
  util::SetInt(payload, "timestampMs", static_cast<std::int64_t>(now));

  RAGTURN_LOG_INFO("user_api_key_audit", {observability::StringField("actor_user_id", event.actor_user_id),
                                          observability::StringField("action", ToString(event.action)),
                                          observability::StringField("target_id", target_id.value_or("")),
                                          observability::StringField("provider", event.provider.value_or("")),
                                          observability::StringField("result", result),
                                          observability::StringField("request_id", request_id.value_or("")),
                                          observability::StringField("reason_code", reason.value_or(""))});

  db::model::AuditEventRecord record;
  record.actor_user_id = event.actor_user_id;
  record.action        = ToString(event.action);
  record.target_type   = kTargetType;
  record.target_id     = target_id.value_or("redacted");
  record.metadata_json = util::ToJson(payload);
  record.created_at_ms = now;

  try {
    auto       tx       = repo_->Begin();
    const auto inserted = repo_->InsertAuditEvent(*tx, record);
    if (!inserted) {
      tx->Rollback();
      RAGTURN_LOG_WARN("audit event not stored", {observability::StringField("action", record.action),
                                                  observability::StringField("error", db::ToString(inserted.code))});
      return;
    }
    tx->Commit();
  } catch (const std::exception& e) {
    RAGTURN_LOG_WARN("audit event not stored",
                     {observability::StringField("action", record.action), observability::StringField("error", e.what())});
  }
}

} // namespace ragturn::credentials
