#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace imgvar::config {

using imgvar::runtime::config::RuntimeConfig;

namespace {

// YAML scalars carry no type. Plain true/false and anything strtod consumes
// whole become bool/number; quoted scalars ("!" tag) stay strings.
void ConvertScalar(const YAML::Node& node, google::protobuf::Value* out) {
  const std::string& text = node.Scalar();

  if (node.Tag() == "!" || text.empty()) {
    out->set_string_value(text);
  } else if (text == "true" || text == "false") {
    out->set_bool_value(text == "true");
  } else {
    char*        end    = nullptr;
    const double number = std::strtod(text.c_str(), &end);
    if (end != nullptr && *end == '\0') {
      out->set_number_value(number);
    } else {
      out->set_string_value(text);
    }
  }
}

void ConvertNode(const YAML::Node& node, google::protobuf::Value* out) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      out->set_null_value(google::protobuf::NULL_VALUE);
      return;

    case YAML::NodeType::Scalar:
      ConvertScalar(node, out);
      return;

    case YAML::NodeType::Sequence: {
      auto* items = out->mutable_list_value();
      for (const auto& item : node) {
        ConvertNode(item, items->add_values());
      }
      return;
    }

    case YAML::NodeType::Map: {
      auto& fields = *out->mutable_struct_value()->mutable_fields();
      for (const auto& entry : node) {
        ConvertNode(entry.second, &fields[entry.first.Scalar()]);
      }
      return;
    }
  }
  throw std::runtime_error("unsupported YAML node type");
}

RuntimeConfig FromYamlNode(const YAML::Node& root) {
  RuntimeConfig config;

  // An empty document is a valid, all-defaults config.
  if (root.IsDefined() && !root.IsNull()) {
    google::protobuf::Value tree;
    ConvertNode(root, &tree);

    std::string json;
    if (auto st = google::protobuf::util::MessageToJsonString(tree, &json); !st.ok()) {
      throw std::runtime_error("config: cannot re-encode YAML as JSON: " + std::string(st.message()));
    }

    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;
    if (auto st = google::protobuf::util::JsonStringToMessage(json, &config, options); !st.ok()) {
      throw std::runtime_error("config: " + std::string(st.message()));
    }
  }

  ConfigLoader::ApplyDefaults(config);
  ConfigLoader::Validate(config);
  return config;
}

} // namespace

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("config: cannot read " + path + ": " + e.what());
  }
  return FromYamlNode(root);
}

RuntimeConfig ConfigLoader::LoadFromString(const std::string& yaml) {
  YAML::Node root;
  try {
    root = YAML::Load(yaml);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(std::string("config: malformed YAML: ") + e.what());
  }
  return FromYamlNode(root);
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* storage = config.mutable_storage();
  if (storage->uploads_root().empty()) storage->set_uploads_root(kDefaultUploadsRoot);
  if (storage->public_prefix().empty()) storage->set_public_prefix(kDefaultPublicPrefix);

  auto* variants = config.mutable_variants();
  if (variants->inline_threshold_px() == 0) variants->set_inline_threshold_px(kDefaultInlineThreshold);
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite() && database.sqlite().path().empty()) {
    throw std::runtime_error("config: database.sqlite.path must be set");
  }
  if (database.has_postgres() && database.postgres().connection_uri().empty()) {
    throw std::runtime_error("config: database.postgres.connection_uri must be set");
  }
}

} // namespace imgvar::config
