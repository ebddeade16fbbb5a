#include "internal/credentials/credential_audit.hpp"

#include <cassert>
#include <iostream>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/json.hpp"

namespace {

using namespace ragturn::credentials;

std::vector<ragturn::db::model::AuditEventRecord> Events(ragturn::db::Repository& repo, const std::string& action) {
  auto tx     = repo.Begin();
  auto events = repo.ListAuditEvents(*tx, action);
  tx->Commit();
  return events;
}

void TestSanitizeAuditToken() {
  assert(SanitizeAuditToken("  cred-123 ", std::string("redacted")) == std::string("cred-123"));
  assert(SanitizeAuditToken("sk-live123", std::string("redacted")) == std::string("redacted"));
  assert(SanitizeAuditToken("has space", std::string("redacted")) == std::string("redacted"));
  assert(SanitizeAuditToken(std::string(129, 'a'), std::nullopt) == std::nullopt);
  assert(SanitizeAuditToken(std::nullopt, std::string("fallback")) == std::string("fallback"));
}

void TestNormalizeReasonCode() {
  assert(NormalizeReasonCode("  Provider_Request_Failed ") == std::string("provider_request_failed"));
  assert(NormalizeReasonCode("bad reason!") == std::string("redacted_reason"));
  assert(NormalizeReasonCode("token_expired") == std::string("redacted_reason"));
  assert(NormalizeReasonCode(std::nullopt) == std::nullopt);
}

void TestSensitiveFragments() {
  assert(ContainsSensitiveFragment("xx-SK-abc"));
  assert(ContainsSensitiveFragment("Bearer"));
  assert(ContainsSensitiveFragment("AIzaSy"));
  assert(!ContainsSensitiveFragment("cred-42"));
  assert(!ContainsSensitiveFragment("desk-"));
}

void TestRecordStoresSanitizedEvent() {
  auto               repo = std::make_shared<ragturn::db::memory::MemoryRepository>();
  CredentialAuditLog audit(repo);

  CredentialAuditEvent event;
  event.actor_user_id = "user-1";
  event.action        = AuditAction::kUse;
  event.target_id     = "cred-1";
  event.provider      = "openai";
  event.success       = false;
  event.request_id    = "req-1";
  event.reason_code   = "Provider_Request_Failed";
  audit.Record(event);

  const auto events = Events(*repo, "user_api_key.use");
  assert(events.size() == 1);
  assert(events[0].actor_user_id == "user-1");
  assert(events[0].target_type == "user_api_key");
  assert(events[0].target_id == "cred-1");

  const auto metadata = ragturn::util::ParseJsonObject(events[0].metadata_json);
  assert(metadata.fields().at("result").string_value() == "failure");
  assert(metadata.fields().at("reasonCode").string_value() == "provider_request_failed");
  assert(metadata.fields().at("requestId").string_value() == "req-1");
  assert(metadata.fields().at("provider").string_value() == "openai");
}

void TestRecordRedactsSecretLookingTarget() {
  auto               repo = std::make_shared<ragturn::db::memory::MemoryRepository>();
  CredentialAuditLog audit(repo);

  CredentialAuditEvent event;
  event.actor_user_id = "user-1";
  event.action        = AuditAction::kCreate;
  event.target_id     = "sk-live-abcdef";
  audit.Record(event);

  const auto events = Events(*repo, "user_api_key.create");
  assert(events.size() == 1);
  assert(events[0].target_id == "redacted");
  assert(events[0].metadata_json.find("sk-live") == std::string::npos);
  assert(Events(*repo, "").size() == 1);
  assert(Events(*repo, "user_api_key.use").empty());
}

void TestActionNames() {
  assert(std::string(ToString(AuditAction::kCreate)) == "user_api_key.create");
  assert(std::string(ToString(AuditAction::kUpdate)) == "user_api_key.update");
  assert(std::string(ToString(AuditAction::kDelete)) == "user_api_key.delete");
  assert(std::string(ToString(AuditAction::kUse)) == "user_api_key.use");
}

} // namespace

int main() {
  TestSanitizeAuditToken();
  TestNormalizeReasonCode();
  TestSensitiveFragments();
  TestRecordStoresSanitizedEvent();
  TestRecordRedactsSecretLookingTarget();
  TestActionNames();

  std::cout << "ragturn_unit_credential_audit: pass\n";
  return 0;
}
