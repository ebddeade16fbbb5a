#pragma once

#include <string>
#include <vector>

#include "internal/catalog/pricing.hpp"

namespace ragturn::provider {

struct ChatMessage {
  std::string role; // "user" | "assistant"
  std::string content;
};

struct ProviderRequest {
  std::string              model_id; // "<provider>:<api_model>"
  std::string              provider;
  std::string              api_model;
  std::vector<ChatMessage> messages;
  std::string              system_prompt;
  double                   temperature       = 0.2;
  int                      max_output_tokens = 1200;

  // Personal key; ProviderRegistry fills in the house key when empty.
  std::string api_key;
};

struct ProviderResponse {
  std::string    text;
  std::string    provider;
  std::string    api_model;
  catalog::Usage usage;
};

/*
  One upstream model family. Wire format, retries and timeouts belong to
  the implementation; any failure is reported by throwing.
*/
class ProviderClient {
 public:
  virtual ~ProviderClient() = default;

  virtual ProviderResponse Complete(const ProviderRequest& request) = 0;
};

} // namespace ragturn::provider
