#include "internal/config/config_loader.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "internal/catalog/pricing.hpp"
#include "internal/util/errors.hpp"

namespace {

using ragturn::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "ragturn_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void ClearEnvironment() {
  unsetenv("RAGTURN_BIND_ADDRESS");
  unsetenv("RAGTURN_CHUNKS_PATH");
}

std::string LoadErrorCode(const std::string& yaml) {
  try {
    (void)ConfigLoader::LoadFromString(yaml);
  } catch (const ragturn::util::ConfigurationError& e) {
    return e.code();
  }
  return "no error";
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  ClearEnvironment();
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(server:
  bind_address: "0.0.0.0:50051"
database:
  sqlite:
    path: "C:\\ragturn\\\"quoted\"\\db.sqlite"
    wal_mode: true
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "C:\\ragturn\\\"quoted\"\\db.sqlite");
  assert(config.database().sqlite().wal_mode());
}

void TestQuotedScalarsStayStrings() {
  ClearEnvironment();
  auto config = ConfigLoader::LoadFromString(R"(providers:
  openai:
    api_key: "12345"
  anthropic:
    api_key: "true"
credentials:
  current_key_id: "2026"
)");
  assert(config.providers().openai().api_key() == "12345");
  assert(config.providers().anthropic().api_key() == "true");
  assert(config.credentials().current_key_id() == "2026");
}

void TestDefaultsForEmptyDocument() {
  ClearEnvironment();
  auto config = ConfigLoader::LoadFromString("");
  assert(config.server().bind_address() == "0.0.0.0:50051");
  assert(config.corpus().chunks_path() == "data/chunks.jsonl");
  assert(config.corpus().signal_cache_ttl_ms() == 30000);
  assert(config.turn().default_model_id() == ragturn::catalog::kDefaultModelId);
  assert(config.turn().history_window() == 24);
  assert(config.turn().max_history_messages() == 12);
  assert(config.turn().reservation_safety_multiplier() == ragturn::catalog::kReservationSafetyMultiplier);
  assert(!config.providers().allow_personal_override());
  assert(config.database().backend_case() == ragturn::runtime::config::DatabaseConfig::BACKEND_NOT_SET);
}

void TestFullDocument() {
  ClearEnvironment();
  auto config = ConfigLoader::LoadFromString(R"(server:
  bind_address: "127.0.0.1:6000"
database:
  postgres:
    connection_uri: "postgresql://ragturn@localhost/ragturn"
    max_connections: 8
logging:
  level: debug
observability:
  metrics_enabled: true
  transport: OTLP_TRANSPORT_HTTP
corpus:
  chunks_path: /srv/chunks.jsonl
  warm_on_start: true
turn:
  default_model_id: "anthropic:claude-haiku-4-5"
  history_window: 30
  reservation_safety_multiplier: 1.5
providers:
  allow_personal_override: true
  openai:
    api_key_env: [OPENAI_API_KEY, OPENAI_KEY]
models:
  - id: "openai:gpt-5"
    label: GPT-5
    input_per_million_usd: 1.25
    output_per_million_usd: 10
credentials:
  current_key_id: primary
  current_key_env: RAGTURN_CREDENTIAL_KEY
  keyring:
    retired: "00112233445566778899aabbccddeeff00112233445566778899aabbccddeeff"
  legacy_secrets: [old-secret]
)");

  assert(config.server().bind_address() == "127.0.0.1:6000");
  assert(config.database().has_postgres());
  assert(config.database().postgres().max_connections() == 8);
  assert(config.logging().level() == "debug");
  assert(config.observability().transport() == ragturn::runtime::config::OTLP_TRANSPORT_HTTP);
  assert(config.corpus().chunks_path() == "/srv/chunks.jsonl");
  assert(config.corpus().warm_on_start());
  assert(config.turn().default_model_id() == "anthropic:claude-haiku-4-5");
  assert(config.turn().history_window() == 30);
  assert(config.turn().max_history_messages() == 12);
  assert(config.turn().reservation_safety_multiplier() == 1.5);
  assert(config.providers().allow_personal_override());
  assert(config.providers().openai().api_key_env_size() == 2);
  assert(config.providers().openai().api_key_env(1) == "OPENAI_KEY");
  assert(config.models_size() == 1);
  assert(config.models(0).output_per_million_usd() == 10.0);
  assert(config.credentials().keyring().at("retired").size() == 64);
  assert(config.credentials().legacy_secrets(0) == "old-secret");
}

void TestEnvironmentOverridesFile() {
  ClearEnvironment();
  setenv("RAGTURN_BIND_ADDRESS", "0.0.0.0:7000", 1);
  setenv("RAGTURN_CHUNKS_PATH", "/data/override.jsonl", 1);

  auto config = ConfigLoader::LoadFromString(R"(server:
  bind_address: "127.0.0.1:6000"
corpus:
  chunks_path: /srv/chunks.jsonl
)");
  assert(config.server().bind_address() == "0.0.0.0:7000");
  assert(config.corpus().chunks_path() == "/data/override.jsonl");

  // empty values are ignored
  setenv("RAGTURN_CHUNKS_PATH", "", 1);
  config = ConfigLoader::LoadFromString("corpus:\n  chunks_path: /srv/chunks.jsonl\n");
  assert(config.corpus().chunks_path() == "/srv/chunks.jsonl");
  ClearEnvironment();
}

void TestInvalidDocumentsAreRejected() {
  ClearEnvironment();
  assert(LoadErrorCode("corpus:\n  chunk_path: /srv/chunks.jsonl\n") == "invalid_config");
  assert(LoadErrorCode("turn:\n  history_window: many\n") == "invalid_config");
  assert(LoadErrorCode("turn:\n  reservation_safety_multiplier: 0.5\n") == "invalid_config");
  assert(LoadErrorCode("server: [unclosed\n") == "invalid_config");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/ragturn.yaml");
  } catch (const ragturn::util::ConfigurationError& e) {
    threw = e.code() == "invalid_config";
  }
  assert(threw);
}

} // namespace

int main() {
  TestScalarEscapingForQuotedAndBackslashValues();
  TestQuotedScalarsStayStrings();
  TestDefaultsForEmptyDocument();
  TestFullDocument();
  TestEnvironmentOverridesFile();
  TestInvalidDocumentsAreRejected();

  std::cout << "ragturn_unit_config_loader: pass\n";
  return 0;
}
