#include "factory.hpp"

#include <iterator>
#include <memory>
#include <string>
#include <vector>

#include "internal/catalog/model_catalog.hpp"
#include "internal/credentials/credential_audit.hpp"
#include "internal/credentials/credential_cipher.hpp"
#include "internal/credentials/credential_store.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/ledger/balance_ledger.hpp"
#include "internal/observability/logging.hpp"
#include "internal/provider/house_credentials.hpp"
#include "internal/retrieval/index_cache.hpp"
#include "internal/retrieval/weighting.hpp"
#include "internal/turn/turn_orchestrator.hpp"
#include "internal/util/errors.hpp"
#if RAGTURN_DB_SQLITE
#include "internal/db/sqlite/sqlite_pool.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if RAGTURN_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace ragturn::factory {

using namespace ragturn;

namespace {

#if RAGTURN_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqlitePool>& pool) {
  pool->ExecAll(std::vector<std::string>(std::begin(db::sql::SQLITE_SCHEMA_STATEMENTS), std::end(db::sql::SQLITE_SCHEMA_STATEMENTS)));
}
#endif

#if RAGTURN_DB_POSTGRES
void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);
  for (const char* sql : db::sql::POSTGRES_SCHEMA) {
    tx.exec(sql);
  }
  tx.commit();
}
#endif

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const ragturn::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if RAGTURN_DB_SQLITE
    auto pool = std::make_shared<db::sqlite::SqlitePool>(database.sqlite().path(), database.sqlite().wal_mode());
    BootstrapSqliteSchema(pool);
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(pool));
#else
    throw util::ConfigurationError("backend_disabled", "sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if RAGTURN_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() > 0 ? database.postgres().max_connections() : 16u;
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    BootstrapPostgresSchema(pool);
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw util::ConfigurationError("backend_disabled", "postgres backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

std::vector<catalog::ModelSpec> StaticModels(const ragturn::runtime::config::RuntimeConfig& config) {
  if (config.models_size() == 0) {
    return catalog::PresetModels();
  }

  std::vector<catalog::ModelSpec> models;
  for (const auto& entry : config.models()) {
    const auto parsed = catalog::ParseModelId(entry.id());
    if (!parsed) {
      throw util::ConfigurationError("invalid_model_id", "models: invalid model id '" + entry.id() + "'");
    }

    catalog::ModelSpec spec;
    spec.id                     = entry.id();
    spec.provider               = parsed->provider;
    spec.api_model              = parsed->api_model;
    spec.label                  = entry.label().empty() ? entry.id() : entry.label();
    spec.input_per_million_usd  = entry.input_per_million_usd();
    spec.output_per_million_usd = entry.output_per_million_usd();
    if (entry.long_context_threshold_tokens() > 0) {
      spec.long_context_threshold_tokens       = entry.long_context_threshold_tokens();
      spec.long_context_input_per_million_usd  = entry.long_context_input_per_million_usd();
      spec.long_context_output_per_million_usd = entry.long_context_output_per_million_usd();
    }
    models.push_back(std::move(spec));
  }
  return models;
}

/*
    Build full application dependency graph
*/
Application Build(const ragturn::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Storage
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);

  // ------------------------------------------------------------------
  // Retrieval
  // ------------------------------------------------------------------
  auto index_cache = std::make_shared<retrieval::CorpusIndexCache>(config.corpus().chunks_path());
  auto weights     = std::make_shared<retrieval::RetrievalWeights>(app.repository, config.corpus().signal_cache_ttl_ms());

  if (config.corpus().warm_on_start()) {
    index_cache->Get();
  }

  // ------------------------------------------------------------------
  // Credentials, catalog and providers
  // ------------------------------------------------------------------
  auto house   = std::make_shared<const provider::HouseCredentials>(config.providers());
  auto catalog = std::make_shared<const catalog::ModelCatalog>(StaticModels(config), house);
  auto cipher  = std::make_shared<const credentials::CredentialCipher>(credentials::CredentialCipher::FromConfig(config.credentials()));
  auto audit   = std::make_shared<credentials::CredentialAuditLog>(app.repository);
  auto store   = std::make_shared<credentials::CredentialStore>(app.repository, cipher, audit);

  app.providers = std::make_shared<provider::ProviderRegistry>(house);

  // ------------------------------------------------------------------
  // Ledger and turns
  // ------------------------------------------------------------------
  auto ledger = std::make_shared<ledger::BalanceLedger>(app.repository);

  turn::TurnDependencies deps;
  deps.repo                                   = app.repository;
  deps.catalog                                = catalog;
  deps.house_credentials                      = house;
  deps.credential_store                       = store;
  deps.audit                                  = audit;
  deps.index_cache                            = index_cache;
  deps.weights                                = weights;
  deps.ledger                                 = ledger;
  deps.provider                               = app.providers;
  deps.settings.default_model_id              = config.turn().default_model_id();
  deps.settings.history_window                = config.turn().history_window();
  deps.settings.max_history_messages          = config.turn().max_history_messages();
  deps.settings.reservation_safety_multiplier = config.turn().reservation_safety_multiplier();

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  app.context.repository  = app.repository;
  app.context.ledger      = ledger;
  app.context.credentials = store;
  app.context.index_cache = index_cache;
  app.context.weights     = weights;
  app.context.turns       = std::make_shared<turn::TurnOrchestrator>(std::move(deps));

  RAGTURN_LOG_INFO("runtime built", {observability::StringField("chunks_path", config.corpus().chunks_path()),
                                     observability::StringField("default_model_id", config.turn().default_model_id()),
                                     observability::BoolField("warm_on_start", config.corpus().warm_on_start())});
  return app;
}

} // namespace ragturn::factory
