#include "credential_store.hpp"

#include "internal/catalog/pricing.hpp"
#include "internal/credentials/credential_audit.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace ragturn::credentials {

CredentialStore::CredentialStore(std::shared_ptr<db::Repository> repo, std::shared_ptr<const CredentialCipher> cipher,
                                 std::shared_ptr<CredentialAuditLog> audit)
    : repo_(std::move(repo)), cipher_(std::move(cipher)), audit_(std::move(audit)) {
}

db::model::CredentialRecord CredentialStore::Register(const std::string& owner_id, const std::string& provider, const std::string& label,
                                                      const std::string& api_key) {
  const auto normalized_provider = util::ToLowerAscii(util::Trim(provider));
  if (!catalog::IsKnownProvider(normalized_provider)) {
    throw util::InvalidArgument("invalid_provider", "Unsupported provider: " + provider);
  }

  db::model::CredentialRecord record;
  record.id            = util::NewId();
  record.owner_id      = owner_id;
  record.provider      = normalized_provider;
  record.label         = util::IsBlank(label) ? normalized_provider + " key" : util::Trim(label);
  record.encrypted_key = cipher_->Encrypt(api_key);
  record.key_preview   = MaskCredential(api_key);
  record.created_at_ms = static_cast<std::uint64_t>(util::NowMillis());
  record.updated_at_ms = record.created_at_ms;

  auto tx = repo_->Begin();
  db::ThrowIfDbError(repo_->InsertCredential(*tx, record), "insert credential");
  tx->Commit();

  CredentialAuditEvent event;
  event.actor_user_id = owner_id;
  event.action        = AuditAction::kCreate;
  event.target_id     = record.id;
  event.provider      = record.provider;
  event.success       = true;
  audit_->Record(event);
  return record;
}

std::optional<db::model::CredentialRecord> CredentialStore::Find(const std::string& credential_id, const std::string& owner_id) {
  auto tx     = repo_->Begin();
  auto record = repo_->GetCredential(*tx, credential_id, owner_id);
  tx->Commit();
  return record;
}

DecryptedCredential CredentialStore::Decrypt(const db::model::CredentialRecord& record) const {
  return cipher_->Decrypt(record.encrypted_key);
}

void CredentialStore::Reencrypt(const db::model::CredentialRecord& record, const std::string& api_key) {
  const auto envelope = cipher_->Encrypt(api_key);
  const auto preview  = MaskCredential(api_key);

  auto tx = repo_->Begin();
  db::ThrowIfDbError(repo_->UpdateCredentialSecret(*tx, record.id, envelope, preview, static_cast<std::uint64_t>(util::NowMillis())),
                     "re-encrypt credential");
  tx->Commit();

  RAGTURN_LOG_INFO("credential re-encrypted", {observability::StringField("credential_id", record.id),
                                               observability::StringField("key_id", cipher_->current_key_id())});
}

} // namespace ragturn::credentials
