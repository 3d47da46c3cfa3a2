#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

#include "internal/codec/frame_codec.hpp"
#include "internal/util/errors.hpp"

namespace courier::config {

using courier::runtime::config::RuntimeConfig;

namespace {

// Plain scalars are typed by content; anything quoted in the document stays
// a string, so an all-digit topic or peer id is not turned into a number.
void ScalarToValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& text = node.Scalar();

  if (node.Tag() == "!") {
    value->set_string_value(text);
  } else if (text == "true" || text == "false") {
    value->set_bool_value(text == "true");
  } else {
    char*        end    = nullptr;
    const double number = std::strtod(text.c_str(), &end);
    if (!text.empty() && end != nullptr && *end == '\0') {
      value->set_number_value(number);
    } else {
      value->set_string_value(text);
    }
  }
}

void NodeToValue(const YAML::Node& node, google::protobuf::Value* value) {
  if (node.IsNull()) {
    value->set_null_value(google::protobuf::NULL_VALUE);
  } else if (node.IsScalar()) {
    ScalarToValue(node, value);
  } else if (node.IsSequence()) {
    auto* list = value->mutable_list_value();
    for (const auto& item : node) {
      NodeToValue(item, list->add_values());
    }
  } else if (node.IsMap()) {
    auto& fields = *value->mutable_struct_value()->mutable_fields();
    for (const auto& entry : node) {
      NodeToValue(entry.second, &fields[entry.first.Scalar()]);
    }
  } else {
    throw std::runtime_error("config: unsupported YAML node at line " + std::to_string(node.Mark().line + 1));
  }
}

RuntimeConfig FromYaml(const YAML::Node& root) {
  RuntimeConfig config;
  if (!root.IsNull()) {
    google::protobuf::Value tree;
    NodeToValue(root, &tree);

    std::string json;
    if (auto status = google::protobuf::util::MessageToJsonString(tree, &json); !status.ok()) {
      throw std::runtime_error("config: cannot render YAML as JSON: " + std::string(status.message()));
    }

    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;
    if (auto status = google::protobuf::util::JsonStringToMessage(json, &config, options); !status.ok()) {
      throw util::InvalidArgument("config: " + std::string(status.message()));
    }
  }

  ConfigLoader::Validate(config);
  return config;
}

void RequireNonNegative(const google::protobuf::Duration& d, const char* field) {
  if (d.seconds() < 0 || d.nanos() < 0) {
    throw util::InvalidArgument(std::string("config: ") + field + " must not be negative");
  }
}

} // namespace

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("config: cannot load " + path + ": " + e.what());
  }
  return FromYaml(root);
}

RuntimeConfig ConfigLoader::LoadFromString(const std::string& text) {
  YAML::Node root;
  try {
    root = YAML::Load(text);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(std::string("config: cannot parse YAML: ") + e.what());
  }
  return FromYaml(root);
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  RequireNonNegative(config.node().default_ttl(), "node.default_ttl");
  RequireNonNegative(config.propagation().exchange_timeout(), "propagation.exchange_timeout");
  RequireNonNegative(config.propagation().exchange_interval(), "propagation.exchange_interval");
  RequireNonNegative(config.propagation().retry_base(), "propagation.retry_base");
  RequireNonNegative(config.propagation().retry_max(), "propagation.retry_max");
  RequireNonNegative(config.propagation().shutdown_grace(), "propagation.shutdown_grace");
  RequireNonNegative(config.reaper().interval(), "reaper.interval");

  if (config.node().default_hop_limit() > 65535) {
    throw util::InvalidArgument("config: node.default_hop_limit must fit in 16 bits");
  }

  const auto& store = config.store();
  if (store.capacity_bytes() > 0 && store.hard_capacity_bytes() > 0 && store.hard_capacity_bytes() < store.capacity_bytes()) {
    throw util::InvalidArgument("config: store.hard_capacity_bytes is below store.capacity_bytes");
  }

  const auto& propagation = config.propagation();
  if (propagation.has_retry_base() && propagation.has_retry_max() && propagation.retry_max().seconds() < propagation.retry_base().seconds()) {
    throw util::InvalidArgument("config: propagation.retry_max is below propagation.retry_base");
  }
  if (propagation.max_frame_bytes() > 0 && propagation.max_frame_bytes() < codec::kMinFrameBytes) {
    throw util::InvalidArgument("config: propagation.max_frame_bytes is too small to carry a bundle frame");
  }

  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    throw util::InvalidArgument("config: database.sqlite.path is required");
  }

  for (const auto& peer : config.node().known_peers()) {
    if (peer.node_id().empty() || peer.box_key().empty()) {
      throw util::InvalidArgument("config: node.known_peers entries need node_id and box_key");
    }
  }
}

} // namespace courier::config
