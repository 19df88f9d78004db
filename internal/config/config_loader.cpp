#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <sstream>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace debugpod::config {

using debugpod::runtime::config::RuntimeConfig;

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

static const char* Env(const char* name) {
  const char* value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return nullptr;
  }
  return value;
}

// Splits on whitespace; the reference command is executed without a shell.
static void SplitCommand(const std::string& command, google::protobuf::RepeatedPtrField<std::string>* out) {
  out->Clear();
  std::istringstream in(command);
  std::string        token;
  while (in >> token) {
    *out->Add() = token;
  }
}

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

  RuntimeConfig config;

  if (!yaml.IsNull()) {
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
  }

  ApplyEnvironmentOverrides(&config);
  ApplyDefaults(&config);
  Validate(config);

  return config;
}

void ConfigLoader::ApplyDefaults(RuntimeConfig* config) {
  auto* server = config->mutable_server();
  if (server->http_bind_address().empty()) server->set_http_bind_address("0.0.0.0");
  if (server->http_port() == 0) server->set_http_port(8000);
  if (server->http_threads() == 0) server->set_http_threads(8);

  auto* repository = config->mutable_repository();
  if (repository->remote().empty()) repository->set_remote("origin");
  if (repository->main_branch().empty()) repository->set_main_branch("master");
  if (repository->env_template().empty()) repository->set_env_template(".env.debug.template");

  auto* worktrees = config->mutable_worktrees();
  if (worktrees->base_dir().empty()) worktrees->set_base_dir("/tmp/debug-worktrees");

  auto* ports = config->mutable_ports();
  if (ports->range_start() == 0 && ports->range_end() == 0) {
    ports->set_range_start(4100);
    ports->set_range_end(4200);
  }

  auto* agent = config->mutable_agent();
  if (agent->binary().empty()) {
    agent->set_binary("opencode");
    if (agent->args_size() == 0) {
      for (const char* arg : {"serve", "--port", "{port}", "--hostname", "{host}", "--no-mdns"}) {
        agent->add_args(arg);
      }
    }
  }
  if (agent->log_file_name().empty()) agent->set_log_file_name("server.log");
  if (agent->health_path().empty()) agent->set_health_path("/global/health");
  if (agent->contract_path().empty()) agent->set_contract_path("/doc");
  if (agent->readiness_timeout_ms() == 0) agent->set_readiness_timeout_ms(15000);
  if (agent->readiness_poll_interval_ms() == 0) agent->set_readiness_poll_interval_ms(200);
  if (agent->terminate_grace_ms() == 0) agent->set_terminate_grace_ms(5000);
  if (agent->pid_dir().empty()) agent->set_pid_dir("/tmp");

  auto* proxy = config->mutable_proxy();
  if (proxy->request_timeout_ms() == 0) proxy->set_request_timeout_ms(300000);
  if (proxy->relay_queue_chunks() == 0) proxy->set_relay_queue_chunks(64);
  if (!proxy->has_delete_requests_per_minute()) proxy->set_delete_requests_per_minute(5);

  auto* reaper = config->mutable_reaper();
  if (!reaper->has_interval_seconds()) reaper->set_interval_seconds(60);

  auto* logging = config->mutable_logging();
  if (logging->level().empty()) logging->set_level("info");
}

void ConfigLoader::ApplyEnvironmentOverrides(RuntimeConfig* config) {
  if (const char* value = Env("DEBUGPOD_PROJECT_PATH")) {
    config->mutable_repository()->set_path(value);
  }
  if (const char* value = Env("DEBUGPOD_REPO_URL")) {
    config->mutable_repository()->set_url(value);
  }
  if (const char* value = Env("DEBUGPOD_WORKTREE_BASE")) {
    config->mutable_worktrees()->set_base_dir(value);
  }
  if (const char* value = Env("DEBUGPOD_ENV_TEMPLATE")) {
    config->mutable_repository()->set_env_template(value);
  }
  if (const char* value = Env("DEBUGPOD_SSH_KEY_PATH")) {
    config->mutable_repository()->set_ssh_key_path(value);
  }
  if (const char* value = Env("DEBUGPOD_REFERENCE_COMMAND")) {
    SplitCommand(value, config->mutable_reference()->mutable_command());
  }
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  if (config.repository().path().empty()) {
    throw std::runtime_error("Invalid configuration: repository.path is required");
  }

  const auto& ports = config.ports();
  if (ports.range_start() == 0 || ports.range_end() > 65535 || ports.range_start() > ports.range_end()) {
    throw std::runtime_error("Invalid configuration: ports.range_start..range_end must be an ascending range within 1..65535");
  }

  if (config.server().http_port() > 65535) {
    throw std::runtime_error("Invalid configuration: server.http_port out of range");
  }

  if (config.agent().readiness_poll_interval_ms() > config.agent().readiness_timeout_ms()) {
    throw std::runtime_error("Invalid configuration: agent.readiness_poll_interval_ms exceeds readiness_timeout_ms");
  }

  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.sqlite.path is required");
  }

  try {
    debugpod::observability::ParseLevel(config.logging().level());
  } catch (const std::invalid_argument& e) {
    throw std::runtime_error(std::string("Invalid configuration: logging.level: ") + e.what());
  }
}

} // namespace debugpod::config
