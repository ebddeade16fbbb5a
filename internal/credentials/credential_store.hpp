#pragma once

#include <memory>
#include <optional>
#include <string>

#include "internal/credentials/credential_cipher.hpp"
#include "internal/db/model/credential_record.hpp"

namespace ragturn::db {
class Repository;
}

namespace ragturn::credentials {

class CredentialAuditLog;

/*
  CredentialStore

  Personal provider keys at rest. Plaintext exists only in the return
  value of Decrypt and the argument of Register.
*/
class CredentialStore {
 public:
  CredentialStore(std::shared_ptr<db::Repository> repo, std::shared_ptr<const CredentialCipher> cipher,
                  std::shared_ptr<CredentialAuditLog> audit);

  // Encrypts and stores a new key; audited as user_api_key.create.
  db::model::CredentialRecord Register(const std::string& owner_id, const std::string& provider, const std::string& label,
                                       const std::string& api_key);

  // Owner-scoped lookup.
  std::optional<db::model::CredentialRecord> Find(const std::string& credential_id, const std::string& owner_id);

  // Throws util::CredentialError("api_key_decrypt_failed").
  DecryptedCredential Decrypt(const db::model::CredentialRecord& record) const;

  // Rewrites the stored envelope under the current key.
  void Reencrypt(const db::model::CredentialRecord& record, const std::string& api_key);

 private:
  std::shared_ptr<db::Repository>         repo_;
  std::shared_ptr<const CredentialCipher> cipher_;
  std::shared_ptr<CredentialAuditLog>     audit_;
};

} // namespace ragturn::credentials
