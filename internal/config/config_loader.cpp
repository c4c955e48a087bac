#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

#include "internal/model/channel_kind.hpp"
#include "internal/util/errors.hpp"

namespace vigil::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings
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
  if (endptr && *endptr == '\0') {
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
      throw util::InvalidArgument("Unsupported YAML node");
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

vigil::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw util::InvalidArgument("Failed to load YAML config: " + std::string(e.what()));
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  vigil::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw util::InvalidArgument("Invalid configuration: " + std::string(status.message()));
  }

  return config;
}

vigil::runtime::config::RuntimeConfig ConfigLoader::Load(const std::string& path) {
  auto config = LoadFromYaml(path);
  ApplyDefaults(config);
  Validate(config);
  return config;
}

void ConfigLoader::ApplyDefaults(vigil::runtime::config::RuntimeConfig& config) {
  auto* server = config.mutable_server();
  if (server->bind_address().empty()) server->set_bind_address("127.0.0.1:50051");

  auto* database = config.mutable_database();
  if (database->path().empty()) database->set_path("vigil.db");
  if (database->synchronous().empty()) database->set_synchronous("NORMAL");
  if (database->wal_size_limit_bytes() == 0) database->set_wal_size_limit_bytes(64ull << 20);
  if (database->checkpoint_interval_ms() == 0) database->set_checkpoint_interval_ms(30000);
  if (database->retention_ttl_seconds() == 0) database->set_retention_ttl_seconds(7 * 24 * 3600);
  if (database->retention_interval_ms() == 0) database->set_retention_interval_ms(60000);
  if (database->busy_timeout_ms() == 0) database->set_busy_timeout_ms(5000);
  if (database->max_forced_checkpoint_failures() == 0) database->set_max_forced_checkpoint_failures(5);

  auto* pipeline = config.mutable_pipeline();
  if (pipeline->flush_interval_ms() == 0) pipeline->set_flush_interval_ms(1000);
  if (pipeline->batch_size() == 0) pipeline->set_batch_size(500);
  if (pipeline->max_queued_events() == 0) pipeline->set_max_queued_events(100000);
  if (pipeline->write_retry_attempts() == 0) pipeline->set_write_retry_attempts(5);
  if (pipeline->write_retry_backoff_ms() == 0) pipeline->set_write_retry_backoff_ms(50);
  if (pipeline->drain_timeout_ms() == 0) pipeline->set_drain_timeout_ms(2000);
  if (pipeline->poll_backoff_max_ms() == 0) pipeline->set_poll_backoff_max_ms(10);

  auto* channels = config.mutable_channels();
  if (channels->name_prefix().empty()) channels->set_name_prefix("vigil");
  if (channels->size_bytes() == 0) channels->set_size_bytes(4u << 20);
  if (channels->kinds().empty()) {
    for (auto kind : model::kAllChannelKinds) {
      channels->add_kinds(std::string(model::ToString(kind)));
    }
  }

  auto* logging = config.mutable_logging();
  if (logging->level().empty()) logging->set_level("info");

  auto* observability = config.mutable_observability();
  if (observability->collection_interval_ms() == 0) observability->set_collection_interval_ms(1000);
}

void ConfigLoader::Validate(const vigil::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  const auto& pipeline = config.pipeline();
  const auto& channels = config.channels();

  if (database.path().empty()) {
    throw util::InvalidArgument("database.path is required");
  }
  const auto& sync = database.synchronous();
  if (sync != "OFF" && sync != "NORMAL" && sync != "FULL" && sync != "EXTRA") {
    throw util::InvalidArgument("database.synchronous must be OFF, NORMAL, FULL or EXTRA");
  }
  if (database.wal_size_limit_bytes() == 0) {
    throw util::InvalidArgument("database.wal_size_limit_bytes must be positive");
  }
  if (database.checkpoint_interval_ms() == 0 || database.retention_interval_ms() == 0) {
    throw util::InvalidArgument("database checkpoint and retention intervals must be positive");
  }

  if (pipeline.batch_size() == 0) {
    throw util::InvalidArgument("pipeline.batch_size must be positive");
  }
  if (pipeline.flush_interval_ms() == 0) {
    throw util::InvalidArgument("pipeline.flush_interval_ms must be positive");
  }
  if (pipeline.max_queued_events() < pipeline.batch_size()) {
    throw util::InvalidArgument("pipeline.max_queued_events must be at least pipeline.batch_size");
  }
  if (pipeline.write_retry_attempts() == 0) {
    throw util::InvalidArgument("pipeline.write_retry_attempts must be positive");
  }

  if (channels.name_prefix().empty() || channels.name_prefix().find('/') != std::string::npos) {
    throw util::InvalidArgument("channels.name_prefix must be a non-empty name without '/'");
  }
  if (channels.size_bytes() < 64) {
    throw util::InvalidArgument("channels.size_bytes must be at least 64");
  }
  for (const auto& kind : channels.kinds()) {
    if (!model::ParseChannelKind(kind)) {
      throw util::InvalidArgument("unknown channel kind: " + kind);
    }
  }

  if (config.server().bind_address().empty()) {
    throw util::InvalidArgument("server.bind_address is required");
  }

  for (const auto& group : config.scanner()) {
    std::string risk = group.risk();
    std::transform(risk.begin(), risk.end(), risk.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (risk != "low" && risk != "medium" && risk != "high" && risk != "special") {
      throw util::InvalidArgument("unknown scanner risk tier: " + risk);
    }
    for (const auto& dir : group.dirs()) {
      if (dir.empty()) {
        throw util::InvalidArgument("scanner." + risk + " contains an empty directory");
      }
    }
  }
}

} // namespace vigil::config
