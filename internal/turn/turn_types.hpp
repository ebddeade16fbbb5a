#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/catalog/pricing.hpp"
#include "internal/db/model/thread_record.hpp"
#include "internal/ledger/balance_ledger.hpp"
#include "internal/provider/provider_client.hpp"
#include "internal/retrieval/index_cache.hpp"
#include "internal/retrieval/passage.hpp"
#include "internal/retrieval/retrieval_engine.hpp"

namespace ragturn::turn {

inline constexpr std::size_t kHistoryWindow      = 24;
inline constexpr std::size_t kMaxHistoryMessages = 12;

inline constexpr double kMinTopK = 2, kMaxTopK = 10, kDefaultTopK = 6;
inline constexpr double kMinTemperature = 0, kMaxTemperature = 1.2, kDefaultTemperature = 0.2;
inline constexpr double kMinOutputTokens = 128, kMaxOutputTokens = 4096, kDefaultOutputTokens = 1200;

inline constexpr std::size_t kMaxThreadTitleLength = 72;

struct TurnRequest {
  std::string user_id;
  std::string thread_id;
  std::string content;

  std::optional<std::vector<std::string>> sources;
  std::optional<std::string>              model_id;
  std::optional<double>                   top_k;
  std::optional<double>                   temperature;
  std::optional<double>                   max_output_tokens;
  std::optional<std::string>              user_credential_id;
};

struct TurnSettings {
  std::string default_model_id              = catalog::kDefaultModelId;
  std::size_t history_window                = kHistoryWindow;
  std::size_t max_history_messages          = kMaxHistoryMessages;
  double      reservation_safety_multiplier = catalog::kReservationSafetyMultiplier;
};

struct CreatedMessage {
  std::string   id;
  std::string   content;
  std::uint64_t created_at_ms = 0;
};

// Output of Prepare. Nothing in it needs compensation.
struct PreparedTurn {
  std::string             user_id; // the caller; the thread creator pays
  db::model::ThreadRecord thread;
  CreatedMessage          user_message;
  std::string             request_id;

  std::string        model_id;
  catalog::ModelSpec model;

  // personal credential, when the caller selected one
  bool                       using_personal_key = false;
  std::string                personal_api_key;
  std::optional<std::string> credential_id;
  std::optional<std::string> credential_provider;
  bool                       credential_use_audited = false;

  std::size_t top_k             = 6;
  double      temperature       = 0.2;
  int         max_output_tokens = 1200;

  double prepare_ms = 0.0;
};

/*
  Written by Execute as soon as a reservation succeeds, so the orchestrator
  can release exactly that amount when a later step fails.
*/
struct ReservationState {
  std::string         owner_id;
  std::int64_t        reserved_cents = 0;
  ledger::Correlation correlation;
};

struct TurnExecution {
  provider::ProviderResponse response;
  catalog::CostBreakdown     measured_cost;
  std::int64_t               actual_cost_cents = 0;
  std::int64_t               reserved_cents    = 0;

  // `retrieval` points into `index`
  std::shared_ptr<const retrieval::CorpusIndex> index;
  std::vector<retrieval::RetrievalResult>       retrieval;

  std::string                        system_prompt;
  std::vector<provider::ChatMessage> trimmed_messages;

  double retrieval_ms = 0.0;
  double provider_ms  = 0.0;
};

struct TurnCitation {
  std::uint32_t              index = 0; // 1-based
  std::string                chunk_id;
  std::string                doc_id;
  std::string                title;
  std::string                url;
  std::optional<std::string> section;
  double                     score = 0.0;
  std::string                snippet;
  double                     multiplier_applied = 1.0;
};

struct AssistantSummary {
  std::string               id;
  std::string               content;
  std::uint64_t             created_at_ms = 0;
  catalog::Usage            usage;
  catalog::CostBreakdown    cost;
  std::int64_t              cost_cents = 0;
  std::string               model_id;
  std::string               provider;
  std::string               billing_mode;
  std::vector<TurnCitation> citations;
};

struct BudgetSummary {
  std::int64_t reserved_cents          = 0;
  std::int64_t charged_cents           = 0;
  std::int64_t released_cents          = 0;
  std::int64_t remaining_balance_cents = 0;
};

struct StageTimings {
  double prepare_ms   = 0.0;
  double retrieval_ms = 0.0;
  double provider_ms  = 0.0;
  double finalize_ms  = 0.0;
};

struct TurnResult {
  std::string      thread_id;
  std::string      request_id;
  CreatedMessage   user_message;
  AssistantSummary assistant;
  BudgetSummary    budget;
  std::uint32_t    retrieval_count = 0;
  std::uint32_t    top_k           = 0;
  StageTimings     timings;

  retrieval::IndexDiagnostics index;
};

} // namespace ragturn::turn
