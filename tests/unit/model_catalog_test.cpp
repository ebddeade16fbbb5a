#include "internal/catalog/model_catalog.hpp"

#include <cassert>
#include <iostream>
#include <map>
#include <stdexcept>

#include "config/config.pb.h"
#include "internal/provider/house_credentials.hpp"
#include "internal/provider/provider_registry.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace ragturn::catalog;
using ragturn::provider::HouseCredentials;

class FakeDiscovery final : public ModelDiscovery {
 public:
  std::vector<std::string> ListModels(const std::string& provider, const std::string& api_key) override {
    last_key = api_key;
    if (fail) throw std::runtime_error("listing unavailable");
    if (provider == kProviderOpenAi) return {"gpt-5", "custom-model", "gpt-5"};
    return {};
  }

  bool        fail = false;
  std::string last_key;
};

class EchoClient final : public ragturn::provider::ProviderClient {
 public:
  ragturn::provider::ProviderResponse Complete(const ragturn::provider::ProviderRequest& request) override {
    ragturn::provider::ProviderResponse response;
    response.text      = request.api_key;
    response.provider  = request.provider;
    response.api_model = request.api_model;
    return response;
  }
};

std::size_t CountProvider(const std::vector<ModelSpec>& models, const std::string& provider) {
  std::size_t count = 0;
  for (const auto& model : models) {
    if (model.provider == provider) ++count;
  }
  return count;
}

void TestOnlyProvidersWithHouseKeys() {
  auto         credentials = std::make_shared<HouseCredentials>(std::map<std::string, std::string>{{"openai", "sk-house"}}, false);
  ModelCatalog catalog(PresetModels(), credentials);

  const auto models = catalog.Available();
  assert(models.size() == CountProvider(PresetModels(), kProviderOpenAi));
  assert(CountProvider(models, kProviderAnthropic) == 0);
}

void TestPersonalOverrideOffersEveryProvider() {
  auto         credentials = std::make_shared<HouseCredentials>(std::map<std::string, std::string>{}, true);
  ModelCatalog catalog(PresetModels(), credentials);
  assert(catalog.Available().size() == PresetModels().size());
}

void TestNoKeysFallsBackToStaticTable() {
  auto         credentials = std::make_shared<HouseCredentials>(std::map<std::string, std::string>{}, false);
  ModelCatalog catalog(PresetModels(), credentials);
  assert(catalog.Available().size() == PresetModels().size());

  ModelCatalog empty({}, credentials);
  bool         threw = false;
  try {
    (void)empty.Available();
  } catch (const ragturn::util::ConfigurationError& e) {
    threw = e.code() == "no_models";
  }
  assert(threw);
}

void TestDiscoveredModelsReplaceStaticEntries() {
  auto credentials = std::make_shared<HouseCredentials>(std::map<std::string, std::string>{{"openai", " sk-house "}}, false);
  auto discovery   = std::make_shared<FakeDiscovery>();
  ModelCatalog catalog(PresetModels(), credentials, discovery);

  const auto models = catalog.Available();
  assert(models.size() == 2);
  assert(discovery->last_key == "sk-house");
  assert(models[0].id == "openai:custom-model");
  assert(!models[0].priced);
  assert(models[1].id == "openai:gpt-5");
  assert(models[1].priced);
}

void TestDiscoveryFailureUsesStaticEntries() {
  auto credentials = std::make_shared<HouseCredentials>(std::map<std::string, std::string>{{"openai", "sk"}, {"gemini", "g"}}, false);
  auto discovery   = std::make_shared<FakeDiscovery>();
  discovery->fail  = true;
  ModelCatalog catalog(PresetModels(), credentials, discovery);

  const auto models = catalog.Available();
  assert(CountProvider(models, kProviderOpenAi) == CountProvider(PresetModels(), kProviderOpenAi));
  assert(CountProvider(models, kProviderGemini) == CountProvider(PresetModels(), kProviderGemini));
  // provider order is fixed
  assert(models.front().provider == kProviderOpenAi);
  assert(models.back().provider == kProviderGemini);
}

void TestResolveModelId() {
  const auto& presets = PresetModels();
  assert(ResolveModelId(std::string("gemini:gemini-2.5-pro"), presets, kDefaultModelId) == std::string("gemini:gemini-2.5-pro"));
  assert(ResolveModelId(std::string("openai:nope"), presets, kDefaultModelId) == std::string(kDefaultModelId));
  assert(ResolveModelId(std::nullopt, presets, "missing:default") == presets.front().id);
  assert(!ResolveModelId(std::nullopt, {}, kDefaultModelId).has_value());
  assert(FindModel(presets, "openai:gpt-5") != nullptr);
  assert(FindModel(presets, "openai:gpt-4") == nullptr);
}

void TestHouseCredentialsFromConfig() {
  ragturn::runtime::config::ProvidersConfig config;
  config.mutable_openai()->set_api_key("  sk-literal ");
  config.mutable_anthropic()->add_api_key_env("CUSTOM_ANTHROPIC");

  const std::map<std::string, std::string> env = {
      {"OPENAI_API_KEY", "ignored"}, {"CUSTOM_ANTHROPIC", "sk-ant"}, {"GEMINI_API_KEY", "  "}, {"GOOGLE_API_KEY", "sk-google"}};
  HouseCredentials credentials(config, [&](const std::string& name) -> std::optional<std::string> {
    const auto it = env.find(name);
    if (it == env.end()) return std::nullopt;
    return it->second;
  });

  assert(credentials.Key("openai") == std::string("sk-literal"));
  assert(credentials.Key("anthropic") == std::string("sk-ant"));
  // blank GEMINI_API_KEY falls through to GOOGLE_API_KEY
  assert(credentials.Key("gemini") == std::string("sk-google"));
  assert(!credentials.allow_personal_override());
}

void TestRegistryFillsHouseKey() {
  auto credentials = std::make_shared<HouseCredentials>(std::map<std::string, std::string>{{"openai", "sk-house"}}, false);
  ragturn::provider::ProviderRegistry registry(credentials);
  registry.Register("openai", std::make_shared<EchoClient>());
  registry.Register("anthropic", std::make_shared<EchoClient>());
  assert(registry.Has("openai"));
  assert(!registry.Has("gemini"));

  ragturn::provider::ProviderRequest request;
  request.provider = "openai";
  assert(registry.Complete(request).text == "sk-house");

  request.api_key = "sk-personal";
  assert(registry.Complete(request).text == "sk-personal");

  request.provider = "anthropic";
  request.api_key.clear();
  bool missing_key = false;
  try {
    (void)registry.Complete(request);
  } catch (const ragturn::util::UpstreamFailure& e) {
    missing_key = e.code() == "missing_provider_key";
  }
  assert(missing_key);

  request.provider = "gemini";
  bool unregistered = false;
  try {
    (void)registry.Complete(request);
  } catch (const ragturn::util::UpstreamFailure& e) {
    unregistered = e.code() == "provider_not_registered";
  }
  assert(unregistered);
}

} // namespace

int main() {
  TestOnlyProvidersWithHouseKeys();
  TestPersonalOverrideOffersEveryProvider();
  TestNoKeysFallsBackToStaticTable();
  TestDiscoveredModelsReplaceStaticEntries();
  TestDiscoveryFailureUsesStaticEntries();
  TestResolveModelId();
  TestHouseCredentialsFromConfig();
  TestRegistryFillsHouseKey();

  std::cout << "ragturn_unit_model_catalog: pass\n";
  return 0;
}
