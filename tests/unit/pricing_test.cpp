#include "internal/catalog/pricing.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>

#include "internal/util/errors.hpp"

namespace {

using namespace ragturn::catalog;

bool Near(double a, double b) {
  return std::fabs(a - b) < 1e-9;
}

void TestParseModelId() {
  const auto parsed = ParseModelId("openai: gpt-5 ");
  assert(parsed.has_value());
  assert(parsed->provider == "openai");
  assert(parsed->api_model == "gpt-5");

  assert(!ParseModelId("gpt-5").has_value());
  assert(!ParseModelId("openai:").has_value());
  assert(!ParseModelId("mistral:large").has_value());
}

void TestPresetsAreKnownAndPriced() {
  const auto* spec = FindPresetModel(kDefaultModelId);
  assert(spec != nullptr);
  assert(spec->priced);
  assert(FindPresetModel("openai:unknown") == nullptr);
  for (const auto& preset : PresetModels()) {
    assert(IsKnownProvider(preset.provider));
    assert(ParseModelId(preset.id).has_value());
  }
}

void TestStandardRates() {
  Usage usage;
  usage.input_tokens  = 1000000;
  usage.output_tokens = 1000000;

  const auto cost = CalculateCost(usage, FindPresetModel("openai:gpt-5-mini"));
  assert(cost.has_pricing);
  assert(cost.tier == PricingTier::kStandard);
  assert(Near(cost.input_cost_usd, 0.25));
  assert(Near(cost.output_cost_usd, 2.0));
  assert(Near(cost.total_cost_usd, 2.25));
}

void TestLongContextRatesAboveThreshold() {
  const auto* sonnet = FindPresetModel("anthropic:claude-sonnet-4-5");
  assert(sonnet != nullptr);

  Usage at_threshold;
  at_threshold.input_tokens = 200000;
  assert(CalculateCost(at_threshold, sonnet).tier == PricingTier::kStandard);

  Usage above;
  above.input_tokens  = 300000;
  above.output_tokens = 1000;
  const auto cost     = CalculateCost(above, sonnet);
  assert(cost.tier == PricingTier::kLongContext);
  assert(Near(cost.input_rate_usd_per_million, 6.0));
  assert(Near(cost.input_cost_usd, 1.8));
  assert(std::string(ToString(cost.tier)) == "long-context");
}

void TestUnpricedModelsHaveNoCost() {
  ModelSpec unpriced;
  unpriced.id     = "openai:custom";
  unpriced.priced = false;

  Usage usage;
  usage.input_tokens = 10;
  assert(!CalculateCost(usage, &unpriced).has_pricing);
  assert(!CalculateCost(usage, nullptr).has_pricing);
  assert(CalculateCost(usage, nullptr).tier == PricingTier::kUnknown);
}

void TestTokenAndCentRounding() {
  assert(EstimateTokens("   ") == 0);
  assert(EstimateTokens("  abcde ") == 2);
  assert(EstimateTokens("abcd") == 1);

  assert(UsdToCentsCeil(0.5) == 50);
  assert(UsdToCentsCeil(0.011) == 2);
  assert(UsdToCentsCeil(0.0) == 0);
  assert(UsdToCentsCeil(-1.0) == 0);
  assert(UsdToCentsCeil(std::numeric_limits<double>::quiet_NaN()) == 0);
}

void TestTurnEstimateAppliesSafetyMultiplier() {
  // "system\nhi" is 9 chars -> 3 input tokens; output dominates
  const auto estimate = EstimateMaxTurnCostCents(FindPresetModel("openai:gpt-5"), "system", {"hi"}, 100000, 1.25);
  assert(estimate.input_tokens_estimate == 3);
  assert(estimate.output_tokens_estimate == 100000);
  assert(estimate.estimated_cost_cents == 126);
  assert(estimate.tier == PricingTier::kStandard);
}

void TestTurnEstimateIsAtLeastOneCent() {
  const auto estimate = EstimateMaxTurnCostCents(FindPresetModel("gemini:gemini-2.5-flash-lite"), "", {}, 1);
  assert(estimate.input_tokens_estimate == 1);
  assert(estimate.estimated_cost_cents == 1);
}

void TestTurnEstimateRequiresPricing() {
  ModelSpec unpriced;
  unpriced.priced = false;

  bool threw = false;
  try {
    (void)EstimateMaxTurnCostCents(&unpriced, "system", {"hi"}, 100);
  } catch (const ragturn::util::InvalidArgument& e) {
    threw = e.code() == "pricing_unavailable";
  }
  assert(threw);
}

} // namespace

int main() {
  TestParseModelId();
  TestPresetsAreKnownAndPriced();
  TestStandardRates();
  TestLongContextRatesAboveThreshold();
  TestUnpricedModelsHaveNoCost();
  TestTokenAndCentRounding();
  TestTurnEstimateAppliesSafetyMultiplier();
  TestTurnEstimateIsAtLeastOneCent();
  TestTurnEstimateRequiresPricing();

  std::cout << "ragturn_unit_pricing: pass\n";
  return 0;
}
