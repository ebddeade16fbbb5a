#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "internal/provider/provider_client.hpp"

namespace ragturn::provider {

class HouseCredentials;

/*
  Routes a request to the client registered for its provider and fills in
  the house key when no personal key was supplied.
*/
class ProviderRegistry final : public ProviderClient {
 public:
  explicit ProviderRegistry(std::shared_ptr<const HouseCredentials> credentials);

  void Register(const std::string& provider, std::shared_ptr<ProviderClient> client);
  bool Has(const std::string& provider) const;

  ProviderResponse Complete(const ProviderRequest& request) override;

 private:
  std::shared_ptr<const HouseCredentials> credentials_;

  mutable std::mutex                                     mutex_;
  std::map<std::string, std::shared_ptr<ProviderClient>> clients_;
};

} // namespace ragturn::provider
