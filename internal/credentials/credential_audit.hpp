#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace ragturn::db {
class Repository;
}

namespace ragturn::credentials {

enum class AuditAction {
  kCreate,
  kUpdate,
  kDelete,
  kUse,
};

const char* ToString(AuditAction action);

struct CredentialAuditEvent {
  std::string                actor_user_id;
  AuditAction                action = AuditAction::kUse;
  std::string                target_id; // credential id
  std::optional<std::string> provider;
  bool                       success = true;
  std::optional<std::string> request_id;
  std::optional<std::string> reason_code;
};

// Trimmed value when it is a safe token with no secret-looking fragment, else `fallback`.
std::optional<std::string> SanitizeAuditToken(std::optional<std::string_view> value, std::optional<std::string> fallback);

// Lowercased reason code, or "redacted_reason" when it does not look like one.
std::optional<std::string> NormalizeReasonCode(std::optional<std::string_view> value);

bool ContainsSensitiveFragment(std::string_view value);

/*
  CredentialAuditLog

  Records personal credential use and management. Each event is logged as
  a structured line and stored as an audit_events row in its own
  transaction. Storage failures are logged and never reach the caller.
*/
class CredentialAuditLog {
 public:
  explicit CredentialAuditLog(std::shared_ptr<db::Repository> repo);

  void Record(const CredentialAuditEvent& event);

 private:
  std::shared_ptr<db::Repository> repo_;
};

} // namespace ragturn::credentials
