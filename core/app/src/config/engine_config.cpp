#include "osr/config/engine_config.hpp"
#include "osr/domain/errors.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>

namespace osr {

using json = nlohmann::json;

const char* toString(ServerType type) {
  return type == ServerType::Test ? "Test" : "Live";
}

namespace {

// -----------------------------------------------------------------------------
// Typed accessors: each one throws ConfigError naming the key on a type
// mismatch. A missing key leaves the default untouched.
// -----------------------------------------------------------------------------
void readString(const json& root, const char* key, std::string& out) {
  auto it = root.find(key);
  if (it == root.end()) {
    return;
  }
  if (!it->is_string()) {
    throw ConfigError(std::string(key) + " must be a string");
  }
  out = it->get<std::string>();
}

void readInt(const json& root, const char* key, std::int64_t& out) {
  auto it = root.find(key);
  if (it == root.end()) {
    return;
  }
  if (!it->is_number_integer()) {
    throw ConfigError(std::string(key) + " must be an integer");
  }
  out = it->get<std::int64_t>();
}

void readBool(const json& root, const char* key, bool& out) {
  auto it = root.find(key);
  if (it == root.end()) {
    return;
  }
  if (!it->is_boolean()) {
    throw ConfigError(std::string(key) + " must be true or false");
  }
  out = it->get<bool>();
}

std::vector<CapacitySpec> readCapacitySpecs(const json& node) {
  if (!node.is_array()) {
    throw ConfigError("capacity_specs must be an array");
  }
  std::vector<CapacitySpec> specs;
  for (const auto& entry : node) {
    if (!entry.is_object()) {
      throw ConfigError("capacity_specs entries must be objects");
    }
    CapacitySpec spec;
    readString(entry, "compartment_type", spec.compartment_type);
    // maximum_quantity is an attribute value on the wire; accept 50 or "50".
    auto max_it = entry.find("maximum_quantity");
    if (max_it != entry.end() && max_it->is_number_integer()) {
      spec.maximum_quantity = std::to_string(max_it->get<std::int64_t>());
    } else {
      readString(entry, "maximum_quantity", spec.maximum_quantity);
    }
    if (spec.compartment_type.empty() || spec.maximum_quantity.empty()) {
      throw ConfigError(
          "capacity_specs entries need compartment_type and maximum_quantity");
    }
    specs.push_back(std::move(spec));
  }
  return specs;
}

void validate(const EngineConfig& config) {
  if (config.order_prefix.empty()) {
    throw ConfigError("order_prefix must not be empty");
  }
  if (config.endpoint.empty()) {
    throw ConfigError("endpoint must not be empty");
  }
  if (config.history_path.empty()) {
    throw ConfigError("history_path must not be empty");
  }
  if (config.call_timeout_ms <= 0 ||
      config.call_timeout_ms > std::numeric_limits<int>::max()) {
    throw ConfigError("call_timeout_ms must be from 1 to " +
                      std::to_string(std::numeric_limits<int>::max()));
  }
  if (config.max_send_attempts < 1) {
    throw ConfigError("max_send_attempts must be at least 1");
  }
  if (config.initial_backoff_ms < 0) {
    throw ConfigError("initial_backoff_ms must not be negative");
  }
  if (config.max_backoff_ms < config.initial_backoff_ms) {
    throw ConfigError("max_backoff_ms must be >= initial_backoff_ms");
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// parseEngineConfig(): defaults overlaid with whatever the file provides
// -----------------------------------------------------------------------------
EngineConfig parseEngineConfig(const std::string& json_text) {
  json root;
  try {
    root = json::parse(json_text);
  } catch (const json::parse_error& e) {
    throw ConfigError(std::string("configuration is not valid JSON: ") +
                      e.what());
  }
  if (!root.is_object()) {
    throw ConfigError("configuration root must be a JSON object");
  }

  EngineConfig config;
  readString(root, "osr_id", config.osr_id);
  readString(root, "order_prefix", config.order_prefix);
  readString(root, "endpoint", config.endpoint);
  readString(root, "command_endpoint", config.command_endpoint);
  readString(root, "history_path", config.history_path);
  readString(root, "catalog_path", config.catalog_path);
  readInt(root, "call_timeout_ms", config.call_timeout_ms);
  readInt(root, "initial_backoff_ms", config.initial_backoff_ms);
  readInt(root, "max_backoff_ms", config.max_backoff_ms);
  readBool(root, "dry_run", config.dry_run);

  std::int64_t attempts = config.max_send_attempts;
  readInt(root, "max_send_attempts", attempts);
  if (attempts < 1 || attempts > std::numeric_limits<int>::max()) {
    throw ConfigError("max_send_attempts must be at least 1");
  }
  config.max_send_attempts = static_cast<int>(attempts);

  std::string server_type = toString(config.server_type);
  readString(root, "server_type", server_type);
  if (server_type == "Live") {
    config.server_type = ServerType::Live;
  } else if (server_type == "Test") {
    config.server_type = ServerType::Test;
  } else {
    throw ConfigError("server_type must be \"Live\" or \"Test\", got \"" +
                      server_type + "\"");
  }

  auto specs_it = root.find("capacity_specs");
  if (specs_it != root.end()) {
    config.capacity_specs = readCapacitySpecs(*specs_it);
  }

  validate(config);
  return config;
}

// -----------------------------------------------------------------------------
// loadEngineConfig(): file → parseEngineConfig → OSR_ID fallback
// -----------------------------------------------------------------------------
EngineConfig loadEngineConfig(const std::string& path, bool must_exist) {
  std::ifstream in(path);
  EngineConfig config;
  if (!in) {
    if (must_exist) {
      throw ConfigError("cannot open configuration file " + path);
    }
    std::cout << "[EngineConfig] " << path
              << " not found, using defaults\n";
  } else {
    std::ostringstream buffer;
    buffer << in.rdbuf();
    config = parseEngineConfig(buffer.str());
    std::cout << "[EngineConfig] loaded " << path << "\n";
  }
  resolveOsrId(config);
  return config;
}

void resolveOsrId(EngineConfig& config) {
  if (!config.osr_id.empty()) {
    return;
  }
  const char* from_env = std::getenv("OSR_ID");
  if (from_env != nullptr) {
    config.osr_id = from_env;
  }
}

}  // namespace osr
