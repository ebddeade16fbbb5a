#pragma once

#include <chrono>
#include <memory>
#include <string_view>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace ragturn::db {
class Repository;
}
namespace ragturn::ledger {
class BalanceLedger;
}
namespace ragturn::credentials {
class CredentialStore;
}
namespace ragturn::retrieval {
class CorpusIndexCache;
class RetrievalWeights;
} // namespace ragturn::retrieval
namespace ragturn::turn {
class TurnOrchestrator;
}

namespace ragturn::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<ragturn::db::Repository>                repository;
  std::shared_ptr<ragturn::ledger::BalanceLedger>         ledger;
  std::shared_ptr<ragturn::credentials::CredentialStore>  credentials;
  std::shared_ptr<ragturn::retrieval::CorpusIndexCache>   index_cache;
  std::shared_ptr<ragturn::retrieval::RetrievalWeights>   weights;
  std::shared_ptr<ragturn::turn::TurnOrchestrator>        turns;
};

// Span, request metrics and an error log line around one RPC body.
template <typename Fn>
auto ObserveRpc(std::string_view route, Fn&& fn) {
  ragturn::observability::SpanScope span(route);
  const auto                        started_at = std::chrono::steady_clock::now();
  auto&                             metrics    = ragturn::observability::Metrics::Instance();

  try {
    auto result = fn();
    metrics.RecordRequest(route, true);
    metrics.ObserveRequestLatencyMs(route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
    return result;
  } catch (const std::exception& ex) {
    span.RecordException(ex);
    RAGTURN_LOG_ERROR("RPC failed",
                      {ragturn::observability::StringField("route", route), ragturn::observability::StringField("error", ex.what())});
    metrics.RecordRequest(route, false);
    metrics.ObserveRequestLatencyMs(route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
    throw;
  }
}

} // namespace ragturn::service
