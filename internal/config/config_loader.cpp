#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>
#include <unordered_set>

#include "internal/util/errors.hpp"

namespace warehouse::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars are always strings ("007" stays a tracking id, not a number)
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

void ConfigLoader::LoadMessage(const std::string& path, google::protobuf::Message* message) {
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

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, message, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }
}

// ------------------------------------------------------------
// Public loaders
// ------------------------------------------------------------

warehouse::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  warehouse::runtime::config::RuntimeConfig config;
  LoadMessage(path, &config);
  Validate(config);
  return config;
}

warehouse::runtime::manifest::Manifest ConfigLoader::LoadManifestFromYaml(const std::string& path) {
  warehouse::runtime::manifest::Manifest manifest;
  LoadMessage(path, &manifest);
  Validate(manifest);
  return manifest;
}

// ------------------------------------------------------------
// Validation
// ------------------------------------------------------------

void ConfigLoader::Validate(const warehouse::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite() && database.sqlite().path().empty()) {
    throw util::InvalidArgument("database.sqlite.path must not be empty");
  }
  if (database.has_postgres() && database.postgres().connection_uri().empty()) {
    throw util::InvalidArgument("database.postgres.connection_uri must not be empty");
  }

  std::unordered_set<int64_t> seen;
  for (const auto& bin : config.bootstrap().seed_bins()) {
    const auto id = std::to_string(bin.bin_id());
    if (bin.capacity() <= 0) {
      throw util::InvalidArgument("seed bin " + id + ": capacity must be positive");
    }
    if (bin.current_usage() < 0 || bin.current_usage() > bin.capacity()) {
      throw util::InvalidArgument("seed bin " + id + ": current_usage must be within [0, capacity]");
    }
    if (!seen.insert(bin.bin_id()).second) {
      throw util::AlreadyExists("seed bin " + id + " declared twice");
    }
  }
}

void ConfigLoader::Validate(const warehouse::runtime::manifest::Manifest& manifest) {
  std::unordered_set<std::string> inbound_ids;
  for (const auto& pkg : manifest.inbound()) {
    if (pkg.tracking_id().empty()) {
      throw util::InvalidArgument("inbound package without tracking_id");
    }
    if (pkg.size() <= 0) {
      throw util::InvalidArgument("package " + pkg.tracking_id() + ": size must be positive");
    }
    if (!inbound_ids.insert(pkg.tracking_id()).second) {
      throw util::AlreadyExists("package " + pkg.tracking_id() + " listed twice in inbound");
    }
  }

  std::unordered_set<std::string> candidate_ids;
  for (const auto& pkg : manifest.truck().candidates()) {
    if (pkg.tracking_id().empty()) {
      throw util::InvalidArgument("truck candidate without tracking_id");
    }
    if (pkg.size() <= 0) {
      throw util::InvalidArgument("package " + pkg.tracking_id() + ": size must be positive");
    }
    if (!candidate_ids.insert(pkg.tracking_id()).second) {
      throw util::AlreadyExists("package " + pkg.tracking_id() + " listed twice in truck candidates");
    }
  }

  if (manifest.truck().capacity() < 0) {
    throw util::InvalidArgument("truck.capacity must not be negative");
  }
}

} // namespace warehouse::config
