#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ragturn::runtime::config {
class CredentialsConfig;
}

namespace ragturn::credentials {

using AesKey = std::array<std::uint8_t, 32>;

inline constexpr const char* kDevKeyId  = "local-dev";
inline constexpr const char* kDevSecret = "chat-support-dev-user-api-keys-only";

struct CipherKeys {
  std::string current_key_id;
  AesKey      current_key{};

  // key id -> key, decrypt only
  std::map<std::string, AesKey> keyring;

  // keys tried for the unversioned legacy format
  std::vector<AesKey> legacy_keys;
};

struct DecryptedCredential {
  std::string                api_key;
  std::string                key_version; // "v2" | "v1"
  std::optional<std::string> key_id;

  // stored under a retired key or the legacy format
  bool should_reencrypt = false;
};

/*
  CredentialCipher

  AES-256-GCM envelope for personal provider keys:

    v2:<key_id>:<iv_b64>:<tag_b64>:<ciphertext_b64>   current format
    v1:<iv_b64>:<tag_b64>:<ciphertext_b64>            legacy, key unknown

  Encryption always uses the current key. v2 values decrypt with the key
  named by their id (current or keyring); v1 values try the current key,
  the keyring, then the SHA-256 of each legacy secret.

  Every decryption failure throws util::CredentialError
  ("api_key_decrypt_failed") without detail.
*/
class CredentialCipher {
 public:
  explicit CredentialCipher(CipherKeys keys);

  /*
    Builds the key set from configuration. Key material is 64 hex chars or
    base64/base64url of exactly 32 bytes. Without configured material the
    development key (SHA-256 of a fixed secret, id "local-dev") is used.
    Throws util::ConfigurationError for malformed ids or material.
  */
  static CredentialCipher FromConfig(const ragturn::runtime::config::CredentialsConfig& config);

  std::string         Encrypt(std::string_view plaintext) const;
  DecryptedCredential Decrypt(std::string_view serialized) const;

  const std::string& current_key_id() const {
    return keys_.current_key_id;
  }

 private:
  CipherKeys keys_;
};

// "********" plus the last four characters; fully masked when 4 or fewer.
std::string MaskCredential(std::string_view api_key);

bool   IsValidKeyId(std::string_view key_id);
AesKey ParseKeyMaterial(std::string_view value);
AesKey Sha256Key(std::string_view secret);

} // namespace ragturn::credentials
