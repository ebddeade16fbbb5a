#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ragturn::runtime::config {
class ProvidersConfig;
}

namespace ragturn::provider {

/*
  HouseCredentials

  Server-owned provider keys. A provider's key is the configured literal
  when set, else the first non-blank environment variable from its list
  (configured names, or the defaults: OPENAI_API_KEY, ANTHROPIC_API_KEY,
  GEMINI_API_KEY then GOOGLE_API_KEY). Resolved once at construction.
*/
class HouseCredentials {
 public:
  using EnvLookup = std::function<std::optional<std::string>(const std::string& name)>;

  explicit HouseCredentials(const ragturn::runtime::config::ProvidersConfig& config);
  HouseCredentials(const ragturn::runtime::config::ProvidersConfig& config, const EnvLookup& env);

  // Explicit keys, for tests and embedding.
  HouseCredentials(std::map<std::string, std::string> keys, bool allow_personal_override);

  bool                       Has(const std::string& provider) const;
  std::optional<std::string> Key(const std::string& provider) const;

  bool allow_personal_override() const {
    return allow_personal_override_;
  }

  static std::vector<std::string> DefaultEnvNames(const std::string& provider);

 private:
  std::map<std::string, std::string> keys_;
  bool                               allow_personal_override_ = false;
};

} // namespace ragturn::provider
