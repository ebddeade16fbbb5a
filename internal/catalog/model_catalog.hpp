#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/catalog/pricing.hpp"

namespace ragturn::provider {
class HouseCredentials;
}

namespace ragturn::catalog {

// Live model listing for one provider. Implementations may cache.
class ModelDiscovery {
 public:
  virtual ~ModelDiscovery() = default;

  // API model names (without the provider prefix). Throws on transport failure.
  virtual std::vector<std::string> ListModels(const std::string& provider, const std::string& api_key) = 0;
};

/*
  ModelCatalog

  The models a turn may use right now. Providers are visited in fixed
  order; only providers with a house key take part unless personal keys
  may override. Each provider contributes its discovered models when
  discovery succeeds and returns something, else its static entries.
  When that leaves nothing, the whole static table is offered.
*/
class ModelCatalog {
 public:
  ModelCatalog(std::vector<ModelSpec> static_models, std::shared_ptr<const provider::HouseCredentials> credentials,
               std::shared_ptr<ModelDiscovery> discovery = nullptr);

  // Throws util::ConfigurationError("no_models") when empty.
  std::vector<ModelSpec> Available() const;

  const std::vector<ModelSpec>& static_models() const {
    return static_models_;
  }

 private:
  std::vector<ModelSpec> ProviderModels(const std::string& provider) const;

  std::vector<ModelSpec>                            static_models_;
  std::shared_ptr<const provider::HouseCredentials> credentials_;
  std::shared_ptr<ModelDiscovery>                   discovery_;
};

// Requested id when listed, else the default when listed, else the first entry.
std::optional<std::string> ResolveModelId(const std::optional<std::string>& requested, const std::vector<ModelSpec>& catalog,
                                          const std::string& default_model_id);

const ModelSpec* FindModel(const std::vector<ModelSpec>& catalog, const std::string& model_id);

} // namespace ragturn::catalog
