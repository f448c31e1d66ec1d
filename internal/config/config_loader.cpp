#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace stowage::config {

using stowage::runtime::config::RuntimeConfig;

namespace {

constexpr uint64_t kMiB = 1024ull * 1024ull;

constexpr uint64_t kDefaultMinPartSizeBytes   = 5 * kMiB;
constexpr uint64_t kDefaultChunkSizeBytes     = 8 * kMiB;
constexpr uint32_t kDefaultMaxParts           = 10000;
constexpr uint64_t kDefaultDirectThreshold    = 5 * kMiB;
constexpr uint64_t kDefaultMultipartThreshold = 64 * kMiB;
constexpr uint32_t kDefaultMaxPartAttempts    = 3;
constexpr uint32_t kDefaultInitialBackoffMs   = 100;
constexpr uint32_t kDefaultMaxBackoffMs       = 5000;
constexpr double   kDefaultBackoffMultiplier  = 2.0;
constexpr uint32_t kDefaultStoreTimeoutMs     = 30000;
constexpr uint32_t kDefaultCacheTtlMs         = 60000;
constexpr uint32_t kDefaultComputeWaitMs      = 30000;
constexpr uint32_t kDefaultLockTtlMs          = 30000;
constexpr uint32_t kDefaultLockWaitMs         = 10000;
constexpr uint32_t kDefaultLockPollMs         = 5;
constexpr uint32_t kDefaultWorkerThreads      = 4;

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

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
      throw std::runtime_error("Unsupported YAML node");
  }
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
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

  RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ApplyDefaults(&config);
  Validate(config);
  return config;
}

RuntimeConfig ConfigLoader::Defaults() {
  RuntimeConfig config;
  ApplyDefaults(&config);
  return config;
}

void ConfigLoader::ApplyDefaults(RuntimeConfig* config) {
  auto* upload = config->mutable_upload();
  if (upload->min_part_size_bytes() == 0) upload->set_min_part_size_bytes(kDefaultMinPartSizeBytes);
  if (upload->chunk_size_bytes() == 0) upload->set_chunk_size_bytes(kDefaultChunkSizeBytes);
  if (upload->max_parts() == 0) upload->set_max_parts(kDefaultMaxParts);
  if (upload->direct_upload_threshold_bytes() == 0) upload->set_direct_upload_threshold_bytes(kDefaultDirectThreshold);
  if (upload->multipart_threshold_bytes() == 0) upload->set_multipart_threshold_bytes(kDefaultMultipartThreshold);
  if (upload->max_part_attempts() == 0) upload->set_max_part_attempts(kDefaultMaxPartAttempts);
  if (upload->initial_backoff_ms() == 0) upload->set_initial_backoff_ms(kDefaultInitialBackoffMs);
  if (upload->max_backoff_ms() == 0) upload->set_max_backoff_ms(kDefaultMaxBackoffMs);
  if (upload->backoff_multiplier() <= 0.0) upload->set_backoff_multiplier(kDefaultBackoffMultiplier);
  if (upload->store_call_timeout_ms() == 0) upload->set_store_call_timeout_ms(kDefaultStoreTimeoutMs);
  if (upload->default_content_type().empty()) upload->set_default_content_type("application/octet-stream");

  auto* cache = config->mutable_cache();
  if (cache->default_ttl_ms() == 0) cache->set_default_ttl_ms(kDefaultCacheTtlMs);
  if (cache->compute_wait_ms() == 0) cache->set_compute_wait_ms(kDefaultComputeWaitMs);

  auto* locks = config->mutable_locks();
  if (locks->default_ttl_ms() == 0) locks->set_default_ttl_ms(kDefaultLockTtlMs);
  if (locks->default_max_wait_ms() == 0) locks->set_default_max_wait_ms(kDefaultLockWaitMs);
  if (locks->poll_interval_ms() == 0) locks->set_poll_interval_ms(kDefaultLockPollMs);

  if (config->workers().threads() == 0) config->mutable_workers()->set_threads(kDefaultWorkerThreads);

  if (config->object_store().backend_case() == stowage::runtime::config::ObjectStoreConfig::BACKEND_NOT_SET) {
    config->mutable_object_store()->mutable_memory();
  }
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto& upload = config.upload();
  if (upload.chunk_size_bytes() < upload.min_part_size_bytes()) {
    throw std::runtime_error("Invalid configuration: upload.chunk_size_bytes is below upload.min_part_size_bytes");
  }
  if (upload.direct_upload_threshold_bytes() > upload.multipart_threshold_bytes()) {
    throw std::runtime_error("Invalid configuration: upload.direct_upload_threshold_bytes exceeds upload.multipart_threshold_bytes");
  }
  if (upload.max_backoff_ms() < upload.initial_backoff_ms()) {
    throw std::runtime_error("Invalid configuration: upload.max_backoff_ms is below upload.initial_backoff_ms");
  }
  if (config.object_store().has_filesystem() && config.object_store().filesystem().root_path().empty()) {
    throw std::runtime_error("Invalid configuration: object_store.filesystem.root_path must not be empty");
  }
}

} // namespace stowage::config
