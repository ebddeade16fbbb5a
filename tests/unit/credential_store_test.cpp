#include "internal/credentials/credential_store.hpp"

#include <cassert>
#include <iostream>
#include <map>

#include "internal/credentials/credential_audit.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace ragturn::credentials;

std::shared_ptr<const CredentialCipher> MakeCipher(const std::string& key_id, const std::string& secret,
                                                   const std::map<std::string, std::string>& retired = {}) {
  CipherKeys keys;
  keys.current_key_id = key_id;
  keys.current_key    = Sha256Key(secret);
  for (const auto& [id, retired_secret] : retired) keys.keyring[id] = Sha256Key(retired_secret);
  return std::make_shared<const CredentialCipher>(std::move(keys));
}

CredentialStore MakeStore(const std::shared_ptr<ragturn::db::Repository>& repo, std::shared_ptr<const CredentialCipher> cipher) {
  return CredentialStore(repo, std::move(cipher), std::make_shared<CredentialAuditLog>(repo));
}

void TestRegisterEncryptsAndAudits() {
  auto repo  = std::make_shared<ragturn::db::memory::MemoryRepository>();
  auto store = MakeStore(repo, MakeCipher("primary", "secret"));

  const auto record = store.Register("user-1", " OpenAI ", "", "sk-personal-1234");
  assert(record.provider == "openai");
  assert(record.label == "openai key");
  assert(record.key_preview == "********1234");
  assert(record.encrypted_key.find("sk-personal") == std::string::npos);

  const auto found = store.Find(record.id, "user-1");
  assert(found.has_value());
  assert(store.Decrypt(*found).api_key == "sk-personal-1234");

  auto tx     = repo->Begin();
  auto events = repo->ListAuditEvents(*tx, "user_api_key.create");
  tx->Commit();
  assert(events.size() == 1);
  assert(events[0].target_id == record.id);
}

void TestFindIsOwnerScoped() {
  auto repo  = std::make_shared<ragturn::db::memory::MemoryRepository>();
  auto store = MakeStore(repo, MakeCipher("primary", "secret"));

  const auto record = store.Register("user-1", "anthropic", "work", "sk-ant-9999");
  assert(record.label == "work");
  assert(!store.Find(record.id, "user-2").has_value());
  assert(!store.Find("missing", "user-1").has_value());
}

void TestRegisterRejectsUnknownProvider() {
  auto repo  = std::make_shared<ragturn::db::memory::MemoryRepository>();
  auto store = MakeStore(repo, MakeCipher("primary", "secret"));

  bool threw = false;
  try {
    (void)store.Register("user-1", "mistral", "", "key-1234");
  } catch (const ragturn::util::InvalidArgument& e) {
    threw = e.code() == "invalid_provider";
  }
  assert(threw);
}

void TestReencryptMovesToCurrentKey() {
  auto repo      = std::make_shared<ragturn::db::memory::MemoryRepository>();
  auto old_store = MakeStore(repo, MakeCipher("old-key", "old secret"));
  const auto id  = old_store.Register("user-1", "gemini", "", "AIza-personal-5678").id;

  auto rotated = MakeStore(repo, MakeCipher("new-key", "new secret", {{"old-key", "old secret"}}));
  auto record  = rotated.Find(id, "user-1");
  assert(record.has_value());

  const auto decrypted = rotated.Decrypt(*record);
  assert(decrypted.should_reencrypt);
  rotated.Reencrypt(*record, decrypted.api_key);

  const auto updated = rotated.Find(id, "user-1");
  assert(updated.has_value());
  assert(updated->encrypted_key.rfind("v2:new-key:", 0) == 0);
  const auto again = rotated.Decrypt(*updated);
  assert(again.api_key == "AIza-personal-5678");
  assert(!again.should_reencrypt);
}

} // namespace

int main() {
  TestRegisterEncryptsAndAudits();
  TestFindIsOwnerScoped();
  TestRegisterRejectsUnknownProvider();
  TestReencryptMovesToCurrentKey();

  std::cout << "ragturn_unit_credential_store: pass\n";
  return 0;
}
