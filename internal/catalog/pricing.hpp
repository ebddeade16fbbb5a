#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ragturn::catalog {

inline constexpr const char* kProviderOpenAi    = "openai";
inline constexpr const char* kProviderAnthropic = "anthropic";
inline constexpr const char* kProviderGemini    = "gemini";

// Catalog order; also the order live discovery is attempted in.
inline const std::vector<std::string>& ProviderOrder() {
  static const std::vector<std::string> order = {kProviderOpenAi, kProviderAnthropic, kProviderGemini};
  return order;
}

bool IsKnownProvider(std::string_view provider);

inline constexpr const char* kDefaultModelId = "openai:gpt-5-mini";

// Reserve this much more than the computed estimate.
inline constexpr double kReservationSafetyMultiplier = 1.25;
inline constexpr int    kCharsPerTokenEstimate       = 4;

struct ModelSpec {
  std::string id; // "<provider>:<api_model>"
  std::string provider;
  std::string api_model;
  std::string label;

  double input_per_million_usd  = 0.0;
  double output_per_million_usd = 0.0;

  std::optional<std::uint64_t> long_context_threshold_tokens;
  std::optional<double>        long_context_input_per_million_usd;
  std::optional<double>        long_context_output_per_million_usd;

  // false for discovered models with no known rates
  bool priced = true;
};

struct ParsedModelId {
  std::string provider;
  std::string api_model;
};

// "<known provider>:<non-empty model>", else nullopt.
std::optional<ParsedModelId> ParseModelId(std::string_view model_id);

const std::vector<ModelSpec>& PresetModels();
const ModelSpec*              FindPresetModel(std::string_view model_id);

struct Usage {
  std::int64_t input_tokens  = 0;
  std::int64_t output_tokens = 0;
  std::int64_t total_tokens  = 0;
};

enum class PricingTier {
  kStandard,
  kLongContext,
  kUnknown,
};

const char* ToString(PricingTier tier);

struct CostBreakdown {
  double      input_cost_usd  = 0.0;
  double      output_cost_usd = 0.0;
  double      total_cost_usd  = 0.0;
  double      input_rate_usd_per_million  = 0.0;
  double      output_rate_usd_per_million = 0.0;
  PricingTier tier        = PricingTier::kUnknown;
  bool        has_pricing = false;
};

// Long-context rates apply when input exceeds the threshold and both long rates exist.
// A null or unpriced spec has no pricing.
CostBreakdown CalculateCost(const Usage& usage, const ModelSpec* spec);

// ceil(trimmed length / 4), 0 for blank text.
std::int64_t EstimateTokens(std::string_view text);

// 0 for non-finite or non-positive amounts.
std::int64_t UsdToCentsCeil(double usd);

struct CostEstimate {
  std::int64_t input_tokens_estimate  = 0;
  std::int64_t output_tokens_estimate = 0;
  std::int64_t estimated_cost_cents   = 0;
  PricingTier  tier                   = PricingTier::kUnknown;
};

/*
  Upper bound for one turn: the system prompt and every message count as
  input, max_output_tokens as output, scaled by the safety multiplier and
  rounded up to at least one cent. Throws util::InvalidArgument
  ("pricing_unavailable") when the model has no pricing.
*/
CostEstimate EstimateMaxTurnCostCents(const ModelSpec* spec, const std::string& system_prompt, const std::vector<std::string>& messages,
                                      double max_output_tokens, double safety_multiplier = kReservationSafetyMultiplier);

} // namespace ragturn::catalog
