#include "provider_registry.hpp"

#include "internal/provider/house_credentials.hpp"
#include "internal/util/errors.hpp"

namespace ragturn::provider {

ProviderRegistry::ProviderRegistry(std::shared_ptr<const HouseCredentials> credentials) : credentials_(std::move(credentials)) {
}

void ProviderRegistry::Register(const std::string& provider, std::shared_ptr<ProviderClient> client) {
  std::lock_guard lock(mutex_);
  clients_[provider] = std::move(client);
}

bool ProviderRegistry::Has(const std::string& provider) const {
  std::lock_guard lock(mutex_);
  return clients_.count(provider) > 0;
}

ProviderResponse ProviderRegistry::Complete(const ProviderRequest& request) {
  std::shared_ptr<ProviderClient> client;
  {
    std::lock_guard lock(mutex_);
    const auto      it = clients_.find(request.provider);
    if (it != clients_.end()) client = it->second;
  }
  if (!client) {
    throw util::UpstreamFailure("provider_not_registered", "No client is registered for provider " + request.provider + ".");
  }

  if (!request.api_key.empty()) {
    return client->Complete(request);
  }

  const auto key = credentials_ ? credentials_->Key(request.provider) : std::nullopt;
  if (!key) {
    throw util::UpstreamFailure("missing_provider_key", "No server API key is configured for " + request.provider + ".");
  }
  ProviderRequest routed  = request;
  routed.api_key          = *key;
  return client->Complete(routed);
}

} // namespace ragturn::provider
