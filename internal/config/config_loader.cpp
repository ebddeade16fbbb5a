#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <string>

#include "internal/catalog/pricing.hpp"
#include "internal/retrieval/weighting.hpp"
#include "internal/turn/turn_types.hpp"
#include "internal/util/errors.hpp"

namespace ragturn::config {

namespace {

constexpr const char* kDefaultBindAddress = "0.0.0.0:50051";
constexpr const char* kDefaultChunksPath  = "data/chunks.jsonl";

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings ("123", "true")
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw ragturn::util::ConfigurationError("invalid_config", "Unsupported YAML node");
  }
}

ragturn::runtime::config::RuntimeConfig Parse(const YAML::Node& yaml) {
  ragturn::runtime::config::RuntimeConfig config;
  if (!yaml || yaml.IsNull()) {
    return config;
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw ragturn::util::ConfigurationError("invalid_config", "Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw ragturn::util::ConfigurationError("invalid_config", "Invalid configuration: " + std::string(status.message()));
  }

  return config;
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

ragturn::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw ragturn::util::ConfigurationError("invalid_config", "Failed to load YAML config: " + std::string(e.what()));
  }

  auto config = Parse(yaml);
  ApplyEnvironment(config);
  ApplyDefaults(config);
  return config;
}

ragturn::runtime::config::RuntimeConfig ConfigLoader::LoadFromString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw ragturn::util::ConfigurationError("invalid_config", "Failed to parse YAML config: " + std::string(e.what()));
  }

  auto config = Parse(yaml);
  ApplyEnvironment(config);
  ApplyDefaults(config);
  return config;
}

void ConfigLoader::ApplyEnvironment(ragturn::runtime::config::RuntimeConfig& config) {
  if (const char* bind = std::getenv("RAGTURN_BIND_ADDRESS"); bind && *bind) {
    config.mutable_server()->set_bind_address(bind);
  }
  if (const char* chunks = std::getenv("RAGTURN_CHUNKS_PATH"); chunks && *chunks) {
    config.mutable_corpus()->set_chunks_path(chunks);
  }
}

void ConfigLoader::ApplyDefaults(ragturn::runtime::config::RuntimeConfig& config) {
  if (config.server().bind_address().empty()) {
    config.mutable_server()->set_bind_address(kDefaultBindAddress);
  }

  auto* corpus = config.mutable_corpus();
  if (corpus->chunks_path().empty()) corpus->set_chunks_path(kDefaultChunksPath);
  if (corpus->signal_cache_ttl_ms() == 0) corpus->set_signal_cache_ttl_ms(static_cast<uint32_t>(ragturn::retrieval::kDefaultSignalCacheTtlMs));

  auto* turn = config.mutable_turn();
  if (turn->default_model_id().empty()) turn->set_default_model_id(ragturn::catalog::kDefaultModelId);
  if (turn->history_window() == 0) turn->set_history_window(static_cast<uint32_t>(ragturn::turn::kHistoryWindow));
  if (turn->max_history_messages() == 0) turn->set_max_history_messages(static_cast<uint32_t>(ragturn::turn::kMaxHistoryMessages));
  if (turn->reservation_safety_multiplier() <= 0.0) {
    turn->set_reservation_safety_multiplier(ragturn::catalog::kReservationSafetyMultiplier);
  } else if (turn->reservation_safety_multiplier() < 1.0) {
    throw ragturn::util::ConfigurationError("invalid_config", "turn.reservation_safety_multiplier must be at least 1.0");
  }
}

} // namespace ragturn::config
