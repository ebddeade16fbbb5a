#include "credential_cipher.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <algorithm>
#include <cstdlib>
#include <memory>

#include "config/config.pb.h"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace ragturn::credentials {

namespace {

constexpr std::size_t kIvBytes  = 12;
constexpr std::size_t kTagBytes = 16;

constexpr const char* kCurrentVersion = "v2";
constexpr const char* kLegacyVersion  = "v1";

using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;
using Bytes     = std::vector<std::uint8_t>;

[[noreturn]] void ThrowDecryptFailed() {
  throw util::CredentialError("api_key_decrypt_failed", "Unable to decrypt stored API key.");
}

CipherCtx NewCipherCtx() {
  CipherCtx ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
  if (!ctx) throw std::runtime_error("OpenSSL: EVP_CIPHER_CTX_new failed");
  return ctx;
}

std::string EncodeBase64(const std::uint8_t* data, std::size_t len) {
  std::string out(4 * ((len + 2) / 3), '\0');
  const int   n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), data, static_cast<int>(len));
  out.resize(static_cast<std::size_t>(n));
  return out;
}

// Accepts base64 and base64url, padded or not.
std::optional<std::string> NormalizeBase64(std::string_view input) {
  std::string value = util::Trim(input);
  for (auto& c : value) {
    if (c == '-') c = '+';
    if (c == '_') c = '/';
  }
  if (value.empty()) return std::nullopt;
  while (value.size() % 4 != 0) value.push_back('=');

  const auto first_pad = value.find('=');
  const auto body_end  = first_pad == std::string::npos ? value.size() : first_pad;
  if (value.size() - body_end > 2 || body_end == 0) return std::nullopt;
  for (std::size_t i = 0; i < value.size(); ++i) {
    const char c = value[i];
    if (i >= body_end) {
      if (c != '=') return std::nullopt;
      continue;
    }
    const bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '+' || c == '/';
    if (!ok) return std::nullopt;
  }
  return value;
}

std::optional<Bytes> DecodeBase64(std::string_view input) {
  const auto normalized = NormalizeBase64(input);
  if (!normalized) return std::nullopt;

  Bytes     out((normalized->size() / 4) * 3);
  const int n = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(normalized->data()), static_cast<int>(normalized->size()));
  if (n < 0) return std::nullopt;
  out.resize(static_cast<std::size_t>(n));

  // EVP_DecodeBlock counts padding as zero bytes
  std::size_t pad = 0;
  if (normalized->back() == '=') ++pad;
  if ((*normalized)[normalized->size() - 2] == '=') ++pad;
  out.resize(out.size() - pad);
  return out;
}

bool IsHex64(std::string_view value) {
  if (value.size() != 64) return false;
  for (char c : value) {
    if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F'))) return false;
  }
  return true;
}

std::uint8_t HexNibble(char c) {
  if (c >= '0' && c <= '9') return static_cast<std::uint8_t>(c - '0');
  if (c >= 'a' && c <= 'f') return static_cast<std::uint8_t>(c - 'a' + 10);
  return static_cast<std::uint8_t>(c - 'A' + 10);
}

std::optional<std::string> AesGcmDecrypt(const AesKey& key, const Bytes& iv, const Bytes& tag, const Bytes& ciphertext) {
  if (iv.size() != kIvBytes || tag.size() != kTagBytes || ciphertext.empty()) return std::nullopt;

  auto ctx = NewCipherCtx();
  if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kIvBytes), nullptr) != 1 ||
      EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv.data()) != 1) {
    return std::nullopt;
  }

  std::string plain(ciphertext.size(), '\0');
  int         len = 0;
  if (EVP_DecryptUpdate(ctx.get(), reinterpret_cast<unsigned char*>(plain.data()), &len, ciphertext.data(),
                        static_cast<int>(ciphertext.size())) != 1) {
    return std::nullopt;
  }
  int total = len;

  Bytes tag_copy = tag;
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(kTagBytes), tag_copy.data()) != 1) {
    return std::nullopt;
  }
  if (EVP_DecryptFinal_ex(ctx.get(), reinterpret_cast<unsigned char*>(plain.data()) + total, &len) <= 0) {
    return std::nullopt;
  }
  total += len;
  plain.resize(static_cast<std::size_t>(total));

  auto value = util::Trim(plain);
  if (value.empty()) return std::nullopt;
  return value;
}

std::optional<std::string> ConfiguredCurrentKey(const ragturn::runtime::config::CredentialsConfig& config) {
  if (!util::IsBlank(config.current_key())) return util::Trim(config.current_key());
  if (!config.current_key_env().empty()) {
    if (const char* value = std::getenv(config.current_key_env().c_str())) {
      if (!util::IsBlank(value)) return util::Trim(value);
    }
  }
  return std::nullopt;
}

} // namespace

bool IsValidKeyId(std::string_view key_id) {
  if (key_id.size() < 2 || key_id.size() > 64) return false;
  for (char c : key_id) {
    const bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '.' || c == '_' || c == '-';
    if (!ok) return false;
  }
  return true;
}

AesKey ParseKeyMaterial(std::string_view value) {
  const auto trimmed = util::Trim(value);
  if (trimmed.empty()) {
    throw util::ConfigurationError("invalid_key_material", "encryption key material must not be empty");
  }

  AesKey key{};
  if (IsHex64(trimmed)) {
    for (std::size_t i = 0; i < key.size(); ++i) {
      key[i] = static_cast<std::uint8_t>((HexNibble(trimmed[2 * i]) << 4) | HexNibble(trimmed[2 * i + 1]));
    }
    return key;
  }

  const auto decoded = DecodeBase64(trimmed);
  if (!decoded || decoded->size() != key.size()) {
    throw util::ConfigurationError("invalid_key_material", "encryption key must be a 32-byte key encoded as base64/base64url or 64-char hex");
  }
  std::copy(decoded->begin(), decoded->end(), key.begin());
  return key;
}

AesKey Sha256Key(std::string_view secret) {
  AesKey       out{};
  unsigned int out_len = 0;

  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 || EVP_DigestUpdate(ctx.get(), secret.data(), secret.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), out.data(), &out_len) != 1 || out_len != out.size()) {
    throw std::runtime_error("OpenSSL: EVP sha256 digest failed");
  }
  return out;
}

std::string MaskCredential(std::string_view api_key) {
  const auto trimmed = util::Trim(api_key);
  if (trimmed.size() <= 4) return "********";
  return "********" + trimmed.substr(trimmed.size() - 4);
}

CredentialCipher::CredentialCipher(CipherKeys keys) : keys_(std::move(keys)) {
  if (!IsValidKeyId(keys_.current_key_id)) {
    throw util::ConfigurationError("invalid_key_id", "encryption key id must match [A-Za-z0-9._-]{2,64}");
  }
  keys_.keyring[keys_.current_key_id] = keys_.current_key;
}

CredentialCipher CredentialCipher::FromConfig(const ragturn::runtime::config::CredentialsConfig& config) {
  CipherKeys keys;
  keys.current_key_id = util::IsBlank(config.current_key_id()) ? std::string(kDevKeyId) : util::Trim(config.current_key_id());

  const auto material = ConfiguredCurrentKey(config);
  keys.current_key    = material ? ParseKeyMaterial(*material) : Sha256Key(kDevSecret);

  for (const auto& [raw_id, raw_material] : config.keyring()) {
    const auto key_id = util::Trim(raw_id);
    if (!IsValidKeyId(key_id)) {
      throw util::ConfigurationError("invalid_key_id", "keyring entry id must match [A-Za-z0-9._-]{2,64}: " + key_id);
    }
    if (key_id == keys.current_key_id) continue;
    keys.keyring[key_id] = ParseKeyMaterial(raw_material);
  }

  for (const auto& secret : config.legacy_secrets()) {
    const auto trimmed = util::Trim(secret);
    if (!trimmed.empty()) keys.legacy_keys.push_back(Sha256Key(trimmed));
  }
  return CredentialCipher(std::move(keys));
}

std::string CredentialCipher::Encrypt(std::string_view plaintext) const {
  const auto value = util::Trim(plaintext);
  if (value.empty()) {
    throw util::InvalidArgument("missing_api_key", "API key is required.");
  }

  std::array<std::uint8_t, kIvBytes> iv{};
  if (RAND_bytes(iv.data(), static_cast<int>(iv.size())) != 1) {
    throw std::runtime_error("OpenSSL: RAND_bytes failed");
  }

  auto ctx = NewCipherCtx();
  if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kIvBytes), nullptr) != 1 ||
      EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, keys_.current_key.data(), iv.data()) != 1) {
    throw std::runtime_error("OpenSSL: AES-256-GCM init failed");
  }

  Bytes ciphertext(value.size() + EVP_MAX_BLOCK_LENGTH);
  int   len = 0;
  if (EVP_EncryptUpdate(ctx.get(), ciphertext.data(), &len, reinterpret_cast<const unsigned char*>(value.data()),
                        static_cast<int>(value.size())) != 1) {
    throw std::runtime_error("OpenSSL: AES-256-GCM update failed");
  }
  int total = len;
  if (EVP_EncryptFinal_ex(ctx.get(), ciphertext.data() + total, &len) != 1) {
    throw std::runtime_error("OpenSSL: AES-256-GCM final failed");
  }
  total += len;
  ciphertext.resize(static_cast<std::size_t>(total));

  std::array<std::uint8_t, kTagBytes> tag{};
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(kTagBytes), tag.data()) != 1) {
    throw std::runtime_error("OpenSSL: AES-256-GCM tag failed");
  }

  return std::string(kCurrentVersion) + ":" + keys_.current_key_id + ":" + EncodeBase64(iv.data(), iv.size()) + ":" +
         EncodeBase64(tag.data(), tag.size()) + ":" + EncodeBase64(ciphertext.data(), ciphertext.size());
}

DecryptedCredential CredentialCipher::Decrypt(std::string_view serialized) const {
  const auto parts = util::Split(serialized, ':');

  if (parts.size() == 5 && parts[0] == kCurrentVersion) {
    const auto key_id = util::Trim(parts[1]);
    if (!IsValidKeyId(key_id)) ThrowDecryptFailed();
    const auto key = keys_.keyring.find(key_id);
    if (key == keys_.keyring.end()) ThrowDecryptFailed();

    const auto iv         = DecodeBase64(parts[2]);
    const auto tag        = DecodeBase64(parts[3]);
    const auto ciphertext = DecodeBase64(parts[4]);
    if (!iv || !tag || !ciphertext) ThrowDecryptFailed();

    auto plain = AesGcmDecrypt(key->second, *iv, *tag, *ciphertext);
    if (!plain) ThrowDecryptFailed();

    DecryptedCredential result;
    result.api_key          = std::move(*plain);
    result.key_version      = kCurrentVersion;
    result.key_id           = key_id;
    result.should_reencrypt = key_id != keys_.current_key_id;
    return result;
  }

  if (parts.size() == 4 && parts[0] == kLegacyVersion) {
    const auto iv         = DecodeBase64(parts[1]);
    const auto tag        = DecodeBase64(parts[2]);
    const auto ciphertext = DecodeBase64(parts[3]);
    if (!iv || !tag || !ciphertext) ThrowDecryptFailed();

    std::vector<const AesKey*> candidates = {&keys_.current_key};
    for (const auto& [key_id, key] : keys_.keyring) {
      if (key_id != keys_.current_key_id) candidates.push_back(&key);
    }
    for (const auto& key : keys_.legacy_keys) candidates.push_back(&key);

    for (const auto* key : candidates) {
      auto plain = AesGcmDecrypt(*key, *iv, *tag, *ciphertext);
      if (!plain) continue;

      DecryptedCredential result;
      result.api_key          = std::move(*plain);
      result.key_version      = kLegacyVersion;
      result.should_reencrypt = true;
      return result;
    }
  }

  ThrowDecryptFailed();
}

} // namespace ragturn::credentials
