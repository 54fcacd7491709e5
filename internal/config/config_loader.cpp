#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <string>

#include "internal/util/errors.hpp"

namespace cadence::config {

using cadence::util::ConfigurationError;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars are always strings
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
    case YAML::NodeType::Undefined:
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
  }
}

template <typename Message>
static Message LoadMessage(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw ConfigurationError("Failed to load YAML config " + path + ": " + std::string(e.what()));
  }

  Message message;
  if (yaml.IsNull()) {
    return message;
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw ConfigurationError("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &message, options);
  if (!status.ok()) {
    throw ConfigurationError("Invalid configuration " + path + ": " + std::string(status.message()));
  }

  return message;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

cadence::config::v1::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  auto config = LoadMessage<cadence::config::v1::RuntimeConfig>(path);
  ApplyDefaults(config);
  return config;
}

cadence::config::v1::CommunitiesConfig ConfigLoader::LoadCommunitiesFromYaml(const std::string& path) {
  return LoadMessage<cadence::config::v1::CommunitiesConfig>(path);
}

void ConfigLoader::ApplyDefaults(cadence::config::v1::RuntimeConfig& config) {
  if (const char* password = std::getenv("CADENCE_ADMIN_PASSWORD")) {
    config.mutable_api()->set_admin_password(password);
  }

  auto* api = config.mutable_api();
  if (api->base_url().empty()) api->set_base_url("http://localhost:3000/api");
  if (api->timeout_seconds() == 0) api->set_timeout_seconds(30);

  auto* dispatch = config.mutable_dispatch();
  if (!dispatch->has_sleep_between_posts_seconds()) dispatch->set_sleep_between_posts_seconds(3);
  if (dispatch->jitter_min_seconds() <= 0 && dispatch->jitter_max_seconds() <= 0) {
    dispatch->set_jitter_min_seconds(2);
    dispatch->set_jitter_max_seconds(7);
  }

  auto* schedule = config.mutable_schedule();
  if (schedule->path().empty()) schedule->set_path("schedules/schedule.csv");

  auto* state = config.mutable_state();
  if (state->forum_state_path().empty()) state->set_forum_state_path("state/forum_setup.json");
  if (state->posted_log_path().empty()) state->set_posted_log_path("state/posted_log.jsonl");
}

void ConfigLoader::ValidateForDispatch(const cadence::config::v1::RuntimeConfig& config) {
  if (config.api().base_url().empty()) {
    throw ConfigurationError("api.base_url is required");
  }
  if (config.schedule().path().empty()) {
    throw ConfigurationError("schedule.path is required");
  }
  if (config.state().forum_state_path().empty()) {
    throw ConfigurationError("state.forum_state_path is required");
  }
  if (config.dispatch().sleep_between_posts_seconds() < 0) {
    throw ConfigurationError("dispatch.sleep_between_posts_seconds must not be negative");
  }
  if (config.dispatch().jitter_max_seconds() < config.dispatch().jitter_min_seconds()) {
    throw ConfigurationError("dispatch.jitter_max_seconds must not be below dispatch.jitter_min_seconds");
  }
  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    throw ConfigurationError("database.sqlite.path is required when the sqlite backend is selected");
  }
}

void ConfigLoader::ValidateForProvisioning(const cadence::config::v1::RuntimeConfig& config) {
  if (config.api().base_url().empty()) {
    throw ConfigurationError("api.base_url is required");
  }
  if (config.api().admin_email().empty()) {
    throw ConfigurationError("api.admin_email is required");
  }
  if (config.api().admin_password().empty()) {
    throw ConfigurationError("api.admin_password (or CADENCE_ADMIN_PASSWORD) is required");
  }
  if (config.state().forum_state_path().empty()) {
    throw ConfigurationError("state.forum_state_path is required");
  }
}

} // namespace cadence::config
