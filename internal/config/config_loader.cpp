#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <cstdlib>
#include <stdexcept>

namespace purchase::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars ("123") stay strings
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

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
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
      throw std::runtime_error("Unsupported YAML node");
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

purchase::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  purchase::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ApplyDefaults(config);
  Validate(config);
  return config;
}

namespace {

void DefaultDuration(google::protobuf::Duration* d, std::int64_t seconds) {
  if (d->seconds() == 0 && d->nanos() == 0) d->set_seconds(seconds);
}

bool IsNegative(const google::protobuf::Duration& d) {
  return d.seconds() < 0 || d.nanos() < 0;
}

} // namespace

void ConfigLoader::ApplyDefaults(purchase::runtime::config::RuntimeConfig& config) {
  auto* remote = config.mutable_remote();
  if (remote->api_prefix().empty()) remote->set_api_prefix("/connector/api");
  DefaultDuration(remote->mutable_connect_timeout(), 30);
  DefaultDuration(remote->mutable_request_timeout(), 30);
  if (remote->per_page() == 0) remote->set_per_page(20);

  constexpr std::int64_t kDay = 24 * 60 * 60;
  auto*                  cache = config.mutable_cache();
  DefaultDuration(cache->mutable_supplier_max_age(), kDay);
  DefaultDuration(cache->mutable_product_max_age(), kDay);
  DefaultDuration(cache->mutable_location_max_age(), kDay);

  DefaultDuration(config.mutable_sync()->mutable_interval(), 300);
  DefaultDuration(config.mutable_connectivity()->mutable_probe_timeout(), 5);
}

void ConfigLoader::Validate(const purchase::runtime::config::RuntimeConfig& config) {
  auto fail = [](const std::string& what) { throw std::runtime_error("Invalid configuration: " + what); };

  const auto& base_url = config.remote().base_url();
  if (base_url.empty()) fail("remote.base_url is required");
  if (base_url.rfind("http://", 0) != 0 && base_url.rfind("https://", 0) != 0) fail("remote.base_url must start with http:// or https://");

  if (config.database().sqlite().path().empty()) fail("database.sqlite.path is required");

  if (IsNegative(config.remote().connect_timeout()) || IsNegative(config.remote().request_timeout())) {
    fail("remote timeouts must not be negative");
  }
  if (IsNegative(config.cache().supplier_max_age()) || IsNegative(config.cache().product_max_age()) ||
      IsNegative(config.cache().location_max_age())) {
    fail("cache max ages must not be negative");
  }
  if (IsNegative(config.sync().interval())) fail("sync.interval must not be negative");
}

} // namespace purchase::config
