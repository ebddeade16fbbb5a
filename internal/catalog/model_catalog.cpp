#include "model_catalog.hpp"

#include <algorithm>
#include <iterator>
#include <unordered_set>

#include "internal/observability/logging.hpp"
#include "internal/provider/house_credentials.hpp"
#include "internal/util/errors.hpp"

namespace ragturn::catalog {

namespace {

ModelSpec DiscoveredModel(const std::string& provider, const std::string& api_model, const std::vector<ModelSpec>& static_models) {
  const auto id = provider + ":" + api_model;
  for (const auto& spec : static_models) {
    if (spec.id == id) return spec;
  }

  ModelSpec spec;
  spec.id        = id;
  spec.provider  = provider;
  spec.api_model = api_model;
  spec.label     = api_model;
  spec.priced    = false;
  return spec;
}

} // namespace

ModelCatalog::ModelCatalog(std::vector<ModelSpec> static_models, std::shared_ptr<const provider::HouseCredentials> credentials,
                           std::shared_ptr<ModelDiscovery> discovery)
    : static_models_(std::move(static_models)), credentials_(std::move(credentials)), discovery_(std::move(discovery)) {
}

std::vector<ModelSpec> ModelCatalog::ProviderModels(const std::string& provider) const {
  std::vector<ModelSpec> fallback;
  std::copy_if(static_models_.begin(), static_models_.end(), std::back_inserter(fallback),
               [&](const ModelSpec& spec) { return spec.provider == provider; });

  const auto key = credentials_->Key(provider);
  if (!discovery_ || !key) return fallback;

  try {
    auto names = discovery_->ListModels(provider, *key);
    std::sort(names.begin(), names.end());
    names.erase(std::unique(names.begin(), names.end()), names.end());
    if (names.empty()) return fallback;

    std::vector<ModelSpec> discovered;
    for (const auto& name : names) {
      if (!name.empty()) discovered.push_back(DiscoveredModel(provider, name, static_models_));
    }
    return discovered.empty() ? fallback : discovered;
  } catch (const std::exception& e) {
    RAGTURN_LOG_WARN("model discovery failed, using static models",
                     {observability::StringField("provider", provider), observability::StringField("error", e.what())});
    return fallback;
  }
}

std::vector<ModelSpec> ModelCatalog::Available() const {
  std::vector<ModelSpec>          catalog;
  std::unordered_set<std::string> seen;
  for (const auto& provider : ProviderOrder()) {
    if (!credentials_->allow_personal_override() && !credentials_->Has(provider)) continue;
    for (auto& spec : ProviderModels(provider)) {
      if (seen.insert(spec.id).second) catalog.push_back(std::move(spec));
    }
  }

  if (catalog.empty()) catalog = static_models_;
  if (catalog.empty()) {
    throw util::ConfigurationError("no_models", "No models are configured on the server.");
  }
  return catalog;
}

std::optional<std::string> ResolveModelId(const std::optional<std::string>& requested, const std::vector<ModelSpec>& catalog,
                                          const std::string& default_model_id) {
  if (catalog.empty()) return std::nullopt;
  if (requested && FindModel(catalog, *requested)) return *requested;
  if (FindModel(catalog, default_model_id)) return default_model_id;
  return catalog.front().id;
}

const ModelSpec* FindModel(const std::vector<ModelSpec>& catalog, const std::string& model_id) {
  const auto it = std::find_if(catalog.begin(), catalog.end(), [&](const ModelSpec& spec) { return spec.id == model_id; });
  return it == catalog.end() ? nullptr : &*it;
}

} // namespace ragturn::catalog
