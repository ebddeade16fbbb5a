#include "pricing.hpp"

#include <algorithm>
#include <cmath>

#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace ragturn::catalog {

namespace {

ModelSpec Preset(std::string provider, std::string api_model, std::string label, double input, double output) {
  ModelSpec spec;
  spec.id                     = provider + ":" + api_model;
  spec.provider               = std::move(provider);
  spec.api_model              = std::move(api_model);
  spec.label                  = std::move(label);
  spec.input_per_million_usd  = input;
  spec.output_per_million_usd = output;
  return spec;
}

ModelSpec WithLongContext(ModelSpec spec, std::uint64_t threshold, double input, double output) {
  spec.long_context_threshold_tokens       = threshold;
  spec.long_context_input_per_million_usd  = input;
  spec.long_context_output_per_million_usd = output;
  return spec;
}

} // namespace

bool IsKnownProvider(std::string_view provider) {
  const auto& order = ProviderOrder();
  return std::find(order.begin(), order.end(), provider) != order.end();
}

std::optional<ParsedModelId> ParseModelId(std::string_view model_id) {
  const auto colon = model_id.find(':');
  if (colon == std::string_view::npos) return std::nullopt;

  ParsedModelId parsed;
  parsed.provider  = std::string(model_id.substr(0, colon));
  parsed.api_model = util::Trim(model_id.substr(colon + 1));
  if (!IsKnownProvider(parsed.provider) || parsed.api_model.empty()) return std::nullopt;
  return parsed;
}

const std::vector<ModelSpec>& PresetModels() {
  static const std::vector<ModelSpec> presets = {
      Preset(kProviderOpenAi, "gpt-5", "GPT-5", 1.25, 10),
      Preset(kProviderOpenAi, "gpt-5-mini", "GPT-5 mini", 0.25, 2),
      Preset(kProviderOpenAi, "gpt-5-nano", "GPT-5 nano", 0.05, 0.4),
      WithLongContext(Preset(kProviderAnthropic, "claude-opus-4-6", "Claude Opus 4.6", 5, 25), 200000, 10, 37.5),
      WithLongContext(Preset(kProviderAnthropic, "claude-sonnet-4-5", "Claude Sonnet 4.5", 3, 15), 200000, 6, 22.5),
      Preset(kProviderAnthropic, "claude-haiku-4-5", "Claude Haiku 4.5", 1, 5),
      WithLongContext(Preset(kProviderGemini, "gemini-2.5-pro", "Gemini 2.5 Pro", 1.25, 10), 200000, 2.5, 15),
      Preset(kProviderGemini, "gemini-2.5-flash", "Gemini 2.5 Flash", 0.3, 2.5),
      Preset(kProviderGemini, "gemini-2.5-flash-lite", "Gemini 2.5 Flash-Lite", 0.1, 0.4),
  };
  return presets;
}

const ModelSpec* FindPresetModel(std::string_view model_id) {
  for (const auto& spec : PresetModels()) {
    if (spec.id == model_id) return &spec;
  }
  return nullptr;
}

const char* ToString(PricingTier tier) {
  switch (tier) {
    case PricingTier::kStandard: return "standard";
    case PricingTier::kLongContext: return "long-context";
    case PricingTier::kUnknown: return "unknown";
  }
  return "unknown";
}

CostBreakdown CalculateCost(const Usage& usage, const ModelSpec* spec) {
  CostBreakdown cost;
  if (!spec || !spec->priced) return cost;

  const bool long_context = spec->long_context_threshold_tokens && spec->long_context_input_per_million_usd &&
                            spec->long_context_output_per_million_usd &&
                            usage.input_tokens > static_cast<std::int64_t>(*spec->long_context_threshold_tokens);

  cost.input_rate_usd_per_million  = long_context ? *spec->long_context_input_per_million_usd : spec->input_per_million_usd;
  cost.output_rate_usd_per_million = long_context ? *spec->long_context_output_per_million_usd : spec->output_per_million_usd;
  cost.input_cost_usd              = (static_cast<double>(usage.input_tokens) / 1000000.0) * cost.input_rate_usd_per_million;
  cost.output_cost_usd             = (static_cast<double>(usage.output_tokens) / 1000000.0) * cost.output_rate_usd_per_million;
  cost.total_cost_usd              = cost.input_cost_usd + cost.output_cost_usd;
  cost.tier                        = long_context ? PricingTier::kLongContext : PricingTier::kStandard;
  cost.has_pricing                 = true;
  return cost;
}

std::int64_t EstimateTokens(std::string_view text) {
  const auto cleaned = util::Trim(text);
  if (cleaned.empty()) return 0;
  const auto length = static_cast<std::int64_t>(cleaned.size());
  return std::max<std::int64_t>(1, (length + kCharsPerTokenEstimate - 1) / kCharsPerTokenEstimate);
}

std::int64_t UsdToCentsCeil(double usd) {
  if (!std::isfinite(usd) || usd <= 0.0) return 0;
  return static_cast<std::int64_t>(std::ceil(usd * 100.0));
}

CostEstimate EstimateMaxTurnCostCents(const ModelSpec* spec, const std::string& system_prompt, const std::vector<std::string>& messages,
                                      double max_output_tokens, double safety_multiplier) {
  std::string prompt = system_prompt;
  for (const auto& message : messages) {
    prompt += "\n";
    prompt += message;
  }

  CostEstimate estimate;
  estimate.input_tokens_estimate  = std::max<std::int64_t>(1, EstimateTokens(prompt));
  estimate.output_tokens_estimate = std::max<std::int64_t>(1, static_cast<std::int64_t>(std::llround(max_output_tokens)));

  Usage usage;
  usage.input_tokens  = estimate.input_tokens_estimate;
  usage.output_tokens = estimate.output_tokens_estimate;
  usage.total_tokens  = usage.input_tokens + usage.output_tokens;

  const auto cost = CalculateCost(usage, spec);
  if (!cost.has_pricing) {
    throw util::InvalidArgument("pricing_unavailable", "Selected model pricing is unavailable for budget enforcement.");
  }

  estimate.estimated_cost_cents = std::max<std::int64_t>(1, static_cast<std::int64_t>(std::ceil(cost.total_cost_usd * 100.0 * safety_multiplier)));
  estimate.tier                 = cost.tier;
  return estimate;
}

} // namespace ragturn::catalog
