#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/turn/turn_types.hpp"

namespace ragturn::db {
class Repository;
}
namespace ragturn::catalog {
class ModelCatalog;
}
namespace ragturn::credentials {
class CredentialStore;
class CredentialAuditLog;
} // namespace ragturn::credentials
namespace ragturn::provider {
class HouseCredentials;
}
namespace ragturn::retrieval {
class CorpusIndexCache;
class RetrievalWeights;
} // namespace ragturn::retrieval

namespace ragturn::turn {

struct TurnDependencies {
  std::shared_ptr<db::Repository>                   repo;
  std::shared_ptr<const catalog::ModelCatalog>      catalog;
  std::shared_ptr<const provider::HouseCredentials> house_credentials;
  std::shared_ptr<credentials::CredentialStore>     credential_store;
  std::shared_ptr<credentials::CredentialAuditLog>  audit;
  std::shared_ptr<retrieval::CorpusIndexCache>      index_cache;
  std::shared_ptr<retrieval::RetrievalWeights>      weights;
  std::shared_ptr<ledger::BalanceLedger>            ledger;
  std::shared_ptr<provider::ProviderClient>         provider;
  TurnSettings                                      settings;
};

/*
  TurnOrchestrator

  One chat turn as three stages:

    Prepare   validate, persist the user message, pick model and credential
    Execute   retrieve, build the prompt, reserve, call the provider
    Finalize  persist the answer and citations, settle the reservation

  A failure in Execute releases whatever it reserved (tagged provider_error)
  and records a failed personal credential use before the error propagates.
  Prepare reserves nothing and Finalize runs after the provider answered, so
  neither is compensated.

  Balance is charged to the thread creator.
*/
class TurnOrchestrator {
 public:
  explicit TurnOrchestrator(TurnDependencies deps);

  TurnResult Run(const TurnRequest& request);

  PreparedTurn  Prepare(const TurnRequest& request);
  TurnExecution Execute(const PreparedTurn& prepared, const std::optional<std::vector<std::string>>& sources,
                        ReservationState& reservation);
  TurnResult    Finalize(const PreparedTurn& prepared, const TurnExecution& execution);

  const TurnDependencies& deps() const {
    return deps_;
  }

 private:
  void AuditCredentialUse(const PreparedTurn& prepared, bool success, const std::optional<std::string>& reason_code);
  void Compensate(const PreparedTurn& prepared, const ReservationState& reservation, const std::string& error_code);

  TurnDependencies deps_;
};

} // namespace ragturn::turn
