#include "internal/credentials/credential_cipher.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "config/config.pb.h"
#include "internal/util/errors.hpp"

namespace {

using namespace ragturn::credentials;

CredentialCipher MakeCipher(const std::string& key_id, const std::string& secret) {
  CipherKeys keys;
  keys.current_key_id = key_id;
  keys.current_key    = Sha256Key(secret);
  return CredentialCipher(std::move(keys));
}

// v2:<id>:<iv>:<tag>:<ct> -> v1:<iv>:<tag>:<ct>
std::string ToLegacyEnvelope(const std::string& envelope) {
  const auto after_version = envelope.find(':');
  const auto after_id      = envelope.find(':', after_version + 1);
  return "v1" + envelope.substr(after_id);
}

template <typename Fn>
bool ThrowsDecryptFailed(Fn&& fn) {
  try {
    fn();
  } catch (const ragturn::util::CredentialError& e) {
    return e.code() == "api_key_decrypt_failed";
  }
  return false;
}

void TestDevKeyRoundTrip() {
  const auto cipher   = CredentialCipher::FromConfig(ragturn::runtime::config::CredentialsConfig{});
  const auto envelope = cipher.Encrypt("  sk-abc123  ");
  assert(envelope.rfind("v2:local-dev:", 0) == 0);
  assert(envelope.find("sk-abc123") == std::string::npos);

  const auto decrypted = cipher.Decrypt(envelope);
  assert(decrypted.api_key == "sk-abc123");
  assert(decrypted.key_version == "v2");
  assert(decrypted.key_id == std::string("local-dev"));
  assert(!decrypted.should_reencrypt);
}

void TestEncryptionIsRandomized() {
  const auto cipher = MakeCipher("primary", "secret");
  assert(cipher.Encrypt("sk-same") != cipher.Encrypt("sk-same"));
}

void TestRetiredKeyStillDecryptsAndFlagsReencrypt() {
  const auto old_cipher = MakeCipher("old-key", "old secret");
  const auto envelope   = old_cipher.Encrypt("sk-rotated");

  CipherKeys keys;
  keys.current_key_id     = "new-key";
  keys.current_key        = Sha256Key("new secret");
  keys.keyring["old-key"] = Sha256Key("old secret");
  const CredentialCipher rotated(std::move(keys));

  const auto decrypted = rotated.Decrypt(envelope);
  assert(decrypted.api_key == "sk-rotated");
  assert(decrypted.key_id == std::string("old-key"));
  assert(decrypted.should_reencrypt);

  // a cipher that never knew the old key refuses it
  const auto stranger = MakeCipher("new-key", "new secret");
  assert(ThrowsDecryptFailed([&] { (void)stranger.Decrypt(envelope); }));
}

void TestLegacyFormatWithLegacySecret() {
  const auto legacy_writer = MakeCipher("unused", "legacy secret");
  const auto legacy        = ToLegacyEnvelope(legacy_writer.Encrypt("sk-legacy"));
  assert(legacy.rfind("v1:", 0) == 0);

  ragturn::runtime::config::CredentialsConfig config;
  config.set_current_key_id("current");
  config.set_current_key(std::string(64, 'a'));
  config.add_legacy_secrets("legacy secret");
  const auto cipher = CredentialCipher::FromConfig(config);

  const auto decrypted = cipher.Decrypt(legacy);
  assert(decrypted.api_key == "sk-legacy");
  assert(decrypted.key_version == "v1");
  assert(!decrypted.key_id.has_value());
  assert(decrypted.should_reencrypt);
}

void TestMalformedEnvelopesFail() {
  const auto cipher   = MakeCipher("primary", "secret");
  const auto envelope = cipher.Encrypt("sk-value");

  assert(ThrowsDecryptFailed([&] { (void)cipher.Decrypt("plaintext"); }));
  assert(ThrowsDecryptFailed([&] { (void)cipher.Decrypt("v2:primary:!!:??:**"); }));
  assert(ThrowsDecryptFailed([&] { (void)cipher.Decrypt("v3" + envelope.substr(2)); }));

  // flip one character of the ciphertext
  auto tampered = envelope;
  auto& last    = tampered[tampered.size() - 3];
  last          = last == 'A' ? 'B' : 'A';
  assert(ThrowsDecryptFailed([&] { (void)cipher.Decrypt(tampered); }));
}

void TestKeyMaterialFormats() {
  const auto hex = ParseKeyMaterial(std::string(64, 'f'));
  assert(hex[0] == 0xff && hex[31] == 0xff);

  // 32 zero bytes, padded base64 and unpadded base64url
  const auto padded   = ParseKeyMaterial(std::string(43, 'A') + "=");
  const auto unpadded = ParseKeyMaterial(std::string(43, 'A'));
  assert(padded == unpadded);
  assert(padded[0] == 0 && padded[31] == 0);

  bool threw = false;
  try {
    (void)ParseKeyMaterial("c2hvcnQ=");
  } catch (const ragturn::util::ConfigurationError&) {
    threw = true;
  }
  assert(threw);
}

void TestInvalidKeyIdIsRejected() {
  assert(IsValidKeyId("key-2024.v1_a"));
  assert(!IsValidKeyId("x"));
  assert(!IsValidKeyId("has space"));

  ragturn::runtime::config::CredentialsConfig config;
  config.set_current_key_id("x");
  bool threw = false;
  try {
    (void)CredentialCipher::FromConfig(config);
  } catch (const ragturn::util::ConfigurationError& e) {
    threw = e.code() == "invalid_key_id";
  }
  assert(threw);
}

void TestMasking() {
  assert(MaskCredential("sk-abcdef") == "********cdef");
  assert(MaskCredential(" abcd ") == "********");
}

void TestEncryptRequiresValue() {
  const auto cipher = MakeCipher("primary", "secret");
  bool       threw  = false;
  try {
    (void)cipher.Encrypt("   ");
  } catch (const ragturn::util::InvalidArgument& e) {
    threw = e.code() == "missing_api_key";
  }
  assert(threw);
}

} // namespace

int main() {
  TestDevKeyRoundTrip();
  TestEncryptionIsRandomized();
  TestRetiredKeyStillDecryptsAndFlagsReencrypt();
  TestLegacyFormatWithLegacySecret();
  TestMalformedEnvelopesFail();
  TestKeyMaterialFormats();
  TestInvalidKeyIdIsRejected();
  TestMasking();
  TestEncryptRequiresValue();

  std::cout << "ragturn_unit_credential_cipher: pass\n";
  return 0;
}
