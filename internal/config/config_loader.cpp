#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/time_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <filesystem>
#include <stdexcept>

namespace swarm::config {

using swarm::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

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
// Defaults
// ------------------------------------------------------------

namespace {

constexpr uint32_t kDefaultMaxWorkers  = 4;
constexpr uint32_t kDefaultMaxRetries  = 3;
constexpr int64_t  kDefaultBaseDelayS  = 5;
constexpr int64_t  kDefaultMaxDelayS   = 30;
constexpr int64_t  kDefaultProgressS   = 10;
constexpr int64_t  kDefaultRefreshSkew = 60;

google::protobuf::Duration Seconds(int64_t seconds) {
  return google::protobuf::util::TimeUtil::SecondsToDuration(seconds);
}

} // namespace

void ApplyDefaults(RuntimeConfig& config) {
  auto* transfer = config.mutable_transfer();
  if (transfer->destination().empty()) transfer->set_destination("./s3_downloads");
  if (transfer->buckets_file().empty()) transfer->set_buckets_file("buckets.txt");
  if (transfer->manifest().empty()) transfer->set_manifest("download_manifest.json");
  if (transfer->max_workers() == 0) transfer->set_max_workers(kDefaultMaxWorkers);
  if (!transfer->has_max_retries()) transfer->set_max_retries(kDefaultMaxRetries);
  if (!transfer->has_base_delay()) *transfer->mutable_base_delay() = Seconds(kDefaultBaseDelayS);
  if (!transfer->has_max_delay()) *transfer->mutable_max_delay() = Seconds(kDefaultMaxDelayS);
  if (!transfer->has_progress_interval()) *transfer->mutable_progress_interval() = Seconds(kDefaultProgressS);
  if (transfer->requeue_policy() == swarm::runtime::config::REQUEUE_POLICY_UNSPECIFIED) {
    transfer->set_requeue_policy(swarm::runtime::config::REQUEUE_POLICY_RESET_ATTEMPTS);
  }

  if (config.manifest().flush_every_transitions() == 0) {
    config.mutable_manifest()->set_flush_every_transitions(1);
  }

  if (config.leases().directory().empty()) {
    config.mutable_leases()->set_directory((std::filesystem::path(transfer->destination()) / ".swarm" / "leases").string());
  }

  auto* credentials = config.mutable_credentials();
  if (credentials->profile().empty()) credentials->set_profile("default");
  if (credentials->authenticate_command().empty()) {
    credentials->set_authenticate_command("aws configure export-credentials --profile {profile} --format process");
  }
  if (credentials->renew_command().empty()) {
    credentials->set_renew_command("aws sso login --profile {profile}");
  }
  if (!credentials->has_refresh_skew()) *credentials->mutable_refresh_skew() = Seconds(kDefaultRefreshSkew);

  auto* object_store = config.mutable_object_store();
  if (object_store->scheme().empty()) object_store->set_scheme("https");
  if (object_store->connect_timeout_seconds() <= 0) object_store->set_connect_timeout_seconds(10);
  if (object_store->request_timeout_seconds() <= 0) object_store->set_request_timeout_seconds(30);
}

RuntimeConfig DefaultConfig() {
  RuntimeConfig config;
  ApplyDefaults(config);
  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  auto config = ParseYaml(path);
  ApplyDefaults(config);
  return config;
}

RuntimeConfig ConfigLoader::ParseYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  RuntimeConfig config;
  if (yaml.IsNull()) {
    return config;
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  return config;
}

} // namespace swarm::config
