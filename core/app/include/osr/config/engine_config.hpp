#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace osr {

// OSR deployment the desk talks to. Sandbox commands only exist on Test.
enum class ServerType {
  Live,
  Test,
};

const char* toString(ServerType type);

// One <capacity_spec> element appended to every goods-in line.
struct CapacitySpec {
  std::string compartment_type;
  std::string maximum_quantity;
};

// -----------------------------------------------------------------------------
// EngineConfig — explicit configuration value
// -----------------------------------------------------------------------------
//
// @brief  Every tunable of the order desk, loaded once at startup and passed
//         by const reference into each component's constructor.
//
// @details
// There is no global configuration object. OrderService receives an
// EngineConfig and hands the relevant parts to DocumentBuilder,
// OrderLifecycleEngine and the transport. Tests construct one directly and
// override the fields they care about; the member initialisers are the
// documented defaults.
//
// File format (JSON, every key optional):
//
//   {
//     "osr_id": "osr1",
//     "order_prefix": "src",
//     "server_type": "Test",
//     "endpoint": "tcp://127.0.0.1:5560",
//     "command_endpoint": "tcp://127.0.0.1:5561",
//     "call_timeout_ms": 3000,
//     "max_send_attempts": 3,
//     "initial_backoff_ms": 200,
//     "max_backoff_ms": 2000,
//     "history_path": "./.osr_orders_history.json",
//     "catalog_path": "",
//     "capacity_specs": [{"compartment_type": "A", "maximum_quantity": "50"}],
//     "dry_run": false
//   }
//
// Validation rules are applied by loadEngineConfig/parseEngineConfig and
// reported as ConfigError naming the offending key.
// -----------------------------------------------------------------------------
struct EngineConfig {
  std::string osr_id;
  std::string order_prefix{"src"};
  ServerType server_type{ServerType::Live};
  std::string endpoint{"tcp://127.0.0.1:5560"};
  std::string command_endpoint{"tcp://127.0.0.1:5561"};
  std::int64_t call_timeout_ms{3000};
  int max_send_attempts{3};
  std::int64_t initial_backoff_ms{200};
  std::int64_t max_backoff_ms{2000};
  std::string history_path{"./.osr_orders_history.json"};
  std::string catalog_path;
  std::vector<CapacitySpec> capacity_specs;
  bool dry_run{false};
};

// Default location of the configuration file.
inline constexpr const char* kDefaultConfigPath = "./.osr_orders.json";

// -----------------------------------------------------------------------------
// parseEngineConfig(json_text)
// -----------------------------------------------------------------------------
// @brief  Parses a JSON document into an EngineConfig, starting from the
//         defaults and overriding every key present.
//
// @throws ConfigError on malformed JSON, a non-object root, a wrong type, or
//         a value outside its allowed range.
//
// The OSR_ID environment variable is NOT consulted here; see
// resolveOsrId().
// -----------------------------------------------------------------------------
EngineConfig parseEngineConfig(const std::string& json_text);

// -----------------------------------------------------------------------------
// loadEngineConfig(path, must_exist)
// -----------------------------------------------------------------------------
// @brief  Reads `path` and parses it. A missing file yields the defaults
//         unless must_exist is set (an explicit --config), in which case it
//         is a ConfigError. Applies resolveOsrId() to the result.
// -----------------------------------------------------------------------------
EngineConfig loadEngineConfig(const std::string& path, bool must_exist);

// Fills an empty osr_id from the OSR_ID environment variable.
void resolveOsrId(EngineConfig& config);

}  // namespace osr
