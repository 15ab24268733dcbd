#include "config_loader.hpp"

#include <google/protobuf/descriptor.h>
#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace shipx::config {

using google::protobuf::Descriptor;
using google::protobuf::FieldDescriptor;

static void YamlToProtoValue(const YAML::Node& node, const FieldDescriptor* field, const Descriptor* message_type,
                             google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, const FieldDescriptor* field, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars carry the "!" tag and stay strings ("12345" organization ids);
  // so does anything bound for a string field (organization_id: 12345)
  if (node.Tag() == "!" || (field != nullptr && field->type() == FieldDescriptor::TYPE_STRING)) {
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

/*
  `field` is the RuntimeConfig field the node lands in and `message_type` the
  message a mapping node fills. Both are nullptr for keys the schema does not
  know; the JSON parser rejects those afterwards.
*/
static void YamlToProtoValue(const YAML::Node& node, const FieldDescriptor* field, const Descriptor* message_type,
                             google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, field, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], field, message_type, list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        const auto             key   = it.first.Scalar();
        const FieldDescriptor* child = message_type != nullptr ? message_type->FindFieldByName(key) : nullptr;
        YamlToProtoValue(it.second, child, child != nullptr ? child->message_type() : nullptr,
                         &(*struct_value->mutable_fields())[key]);
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

shipx::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  shipx::runtime::config::RuntimeConfig config;

  // an empty file is a valid "all defaults" config
  if (yaml.IsNull()) {
    ApplyDefaults(&config);
    return config;
  }
  if (!yaml.IsMap()) {
    throw std::runtime_error("Invalid configuration: top level must be a mapping");
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, nullptr, shipx::runtime::config::RuntimeConfig::descriptor(), &json_value);

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

  ApplyDefaults(&config);
  return config;
}

void ConfigLoader::ApplyDefaults(shipx::runtime::config::RuntimeConfig* config) {
  auto* api = config->mutable_api();
  if (api->base_url().empty()) {
    api->set_base_url(kSandboxBaseUrl);
  }
  // trailing slashes would double up when endpoint paths are appended
  while (api->base_url().size() > 1 && api->base_url().back() == '/') {
    api->mutable_base_url()->pop_back();
  }
  if (api->request_timeout_ms() == 0) {
    api->set_request_timeout_ms(30000);
  }
  if (api->user_agent().empty()) {
    api->set_user_agent("shipx-courier/0.1.0");
  }

  auto* poll = config->mutable_poll();
  if (poll->interval_ms() == 0) {
    poll->set_interval_ms(1000);
  }
  if (!poll->has_max_attempts()) {
    poll->set_max_attempts(300);
  }

  auto* output = config->mutable_output();
  if (output->directory().empty()) {
    output->set_directory("tmp");
  }
  if (output->label_format().empty()) {
    output->set_label_format("Pdf");
  }
  if (output->label_type().empty()) {
    output->set_label_type("A6");
  }
  if (output->printout_format().empty()) {
    output->set_printout_format("Pdf");
  }

  auto* logging = config->mutable_logging();
  if (logging->level().empty()) {
    logging->set_level("info");
  }
  if (logging->console_level().empty()) {
    logging->set_console_level("warn");
  }
  if (logging->file().empty()) {
    logging->set_file("log.txt");
  }
}

} // namespace shipx::config
