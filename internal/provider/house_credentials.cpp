#include "house_credentials.hpp"

#include <cstdlib>

#include "config/config.pb.h"
#include "internal/catalog/pricing.hpp"
#include "internal/util/strings.hpp"

namespace ragturn::provider {

namespace {

std::optional<std::string> ProcessEnv(const std::string& name) {
  if (const char* value = std::getenv(name.c_str())) {
    return std::string(value);
  }
  return std::nullopt;
}

const ragturn::runtime::config::ProviderConfig& SectionFor(const ragturn::runtime::config::ProvidersConfig& config,
                                                           const std::string&                              provider) {
  if (provider == catalog::kProviderAnthropic) return config.anthropic();
  if (provider == catalog::kProviderGemini) return config.gemini();
  return config.openai();
}

} // namespace

std::vector<std::string> HouseCredentials::DefaultEnvNames(const std::string& provider) {
  if (provider == catalog::kProviderOpenAi) return {"OPENAI_API_KEY"};
  if (provider == catalog::kProviderAnthropic) return {"ANTHROPIC_API_KEY"};
  if (provider == catalog::kProviderGemini) return {"GEMINI_API_KEY", "GOOGLE_API_KEY"};
  return {};
}

HouseCredentials::HouseCredentials(const ragturn::runtime::config::ProvidersConfig& config) : HouseCredentials(config, ProcessEnv) {
}

HouseCredentials::HouseCredentials(const ragturn::runtime::config::ProvidersConfig& config, const EnvLookup& env)
    : allow_personal_override_(config.allow_personal_override()) {
  for (const auto& provider : catalog::ProviderOrder()) {
    const auto& section = SectionFor(config, provider);

    auto literal = util::Trim(section.api_key());
    if (!literal.empty()) {
      keys_[provider] = std::move(literal);
      continue;
    }

    std::vector<std::string> names(section.api_key_env().begin(), section.api_key_env().end());
    if (names.empty()) names = DefaultEnvNames(provider);
    for (const auto& name : names) {
      const auto value = env(name);
      if (value && !util::IsBlank(*value)) {
        keys_[provider] = util::Trim(*value);
        break;
      }
    }
  }
}

HouseCredentials::HouseCredentials(std::map<std::string, std::string> keys, bool allow_personal_override)
    : allow_personal_override_(allow_personal_override) {
  for (auto& [provider, key] : keys) {
    if (!util::IsBlank(key)) keys_[provider] = util::Trim(key);
  }
}

bool HouseCredentials::Has(const std::string& provider) const {
  return keys_.count(provider) > 0;
}

std::optional<std::string> HouseCredentials::Key(const std::string& provider) const {
  const auto it = keys_.find(provider);
  if (it == keys_.end()) return std::nullopt;
  return it->second;
}

} // namespace ragturn::provider
