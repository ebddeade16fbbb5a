#pragma once

#include <cstdint>
#include <string>

namespace ragturn::db::model {

/*
  A user's own provider API key. encrypted_key is the cipher envelope,
  never the plaintext; key_preview is the masked form shown back to users.
*/
struct CredentialRecord {
  std::string id;
  std::string owner_id;
  std::string provider;
  std::string label;
  std::string encrypted_key;
  std::string key_preview;

  std::uint64_t created_at_ms = 0;
  std::uint64_t updated_at_ms = 0;
};

} // namespace ragturn::db::model
