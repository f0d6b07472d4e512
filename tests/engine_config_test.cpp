// =============================================================================
// engine_config_test.cpp
// =============================================================================
// Unit tests for osr::EngineConfig loading and osr::StaticCatalog.
//
// Validates:
//   - Defaults when keys or the whole file are absent
//   - Every key overrides its default; capacity specs accept 50 or "50"
//   - Wrong types and out-of-range values are ConfigError
//   - OSR_ID environment fallback only fills an empty osr_id
//   - Catalog JSON loading and lookup
// =============================================================================

#include "osr/catalog/static_catalog.hpp"
#include "osr/config/engine_config.hpp"
#include "osr/domain/errors.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>

// -----------------------------------------------------------------------------
// 1. Empty object → documented defaults.
// -----------------------------------------------------------------------------
TEST(EngineConfigTest, Defaults) {
  osr::EngineConfig config = osr::parseEngineConfig("{}");
  EXPECT_EQ(config.osr_id, "");
  EXPECT_EQ(config.order_prefix, "src");
  EXPECT_EQ(config.server_type, osr::ServerType::Live);
  EXPECT_EQ(config.call_timeout_ms, 3000);
  EXPECT_EQ(config.max_send_attempts, 3);
  EXPECT_EQ(config.initial_backoff_ms, 200);
  EXPECT_EQ(config.max_backoff_ms, 2000);
  EXPECT_TRUE(config.capacity_specs.empty());
  EXPECT_FALSE(config.dry_run);
}

// -----------------------------------------------------------------------------
// 2. All keys override.
// -----------------------------------------------------------------------------
TEST(EngineConfigTest, OverridesEveryKey) {
  osr::EngineConfig config = osr::parseEngineConfig(R"({
    "osr_id": "osr2",
    "order_prefix": "wh",
    "server_type": "Test",
    "endpoint": "tcp://10.0.0.5:7000",
    "command_endpoint": "ipc:///tmp/osr.cmd",
    "call_timeout_ms": 500,
    "max_send_attempts": 5,
    "initial_backoff_ms": 50,
    "max_backoff_ms": 400,
    "history_path": "/var/lib/osr/history.json",
    "catalog_path": "/etc/osr/catalog.json",
    "capacity_specs": [{"compartment_type": "A", "maximum_quantity": 50},
                       {"compartment_type": "B", "maximum_quantity": "20"}],
    "dry_run": true
  })");

  EXPECT_EQ(config.osr_id, "osr2");
  EXPECT_EQ(config.order_prefix, "wh");
  EXPECT_EQ(config.server_type, osr::ServerType::Test);
  EXPECT_EQ(config.endpoint, "tcp://10.0.0.5:7000");
  EXPECT_EQ(config.command_endpoint, "ipc:///tmp/osr.cmd");
  EXPECT_EQ(config.call_timeout_ms, 500);
  EXPECT_EQ(config.max_send_attempts, 5);
  EXPECT_EQ(config.initial_backoff_ms, 50);
  EXPECT_EQ(config.max_backoff_ms, 400);
  EXPECT_EQ(config.history_path, "/var/lib/osr/history.json");
  EXPECT_EQ(config.catalog_path, "/etc/osr/catalog.json");
  ASSERT_EQ(config.capacity_specs.size(), 2u);
  EXPECT_EQ(config.capacity_specs[0].maximum_quantity, "50");
  EXPECT_EQ(config.capacity_specs[1].compartment_type, "B");
  EXPECT_TRUE(config.dry_run);
}

// -----------------------------------------------------------------------------
// 3. Invalid documents and values.
// -----------------------------------------------------------------------------
TEST(EngineConfigTest, RejectsInvalidValues) {
  EXPECT_THROW(osr::parseEngineConfig("not json"), osr::ConfigError);
  EXPECT_THROW(osr::parseEngineConfig("[1, 2]"), osr::ConfigError);
  EXPECT_THROW(osr::parseEngineConfig(R"({"osr_id": 7})"), osr::ConfigError);
  EXPECT_THROW(osr::parseEngineConfig(R"({"server_type": "Staging"})"),
               osr::ConfigError);
  EXPECT_THROW(osr::parseEngineConfig(R"({"max_send_attempts": 0})"),
               osr::ConfigError);
  EXPECT_THROW(osr::parseEngineConfig(R"({"call_timeout_ms": "fast"})"),
               osr::ConfigError);
  EXPECT_THROW(osr::parseEngineConfig(R"({"call_timeout_ms": 0})"),
               osr::ConfigError);
  EXPECT_THROW(osr::parseEngineConfig(R"({"call_timeout_ms": 3000000000})"),
               osr::ConfigError);
  EXPECT_EQ(osr::parseEngineConfig(R"({"call_timeout_ms": 2147483647})")
                .call_timeout_ms,
            2147483647);
  EXPECT_THROW(
      osr::parseEngineConfig(R"({"initial_backoff_ms": 500, "max_backoff_ms": 100})"),
      osr::ConfigError);
  EXPECT_THROW(osr::parseEngineConfig(R"({"capacity_specs": [{"compartment_type": "A"}]})"),
               osr::ConfigError);
  EXPECT_THROW(osr::parseEngineConfig(R"({"dry_run": "yes"})"), osr::ConfigError);
}

// -----------------------------------------------------------------------------
// 4. Files: missing is fine unless required; OSR_ID fills an empty osr_id.
// -----------------------------------------------------------------------------
TEST(EngineConfigTest, LoadFromFileWithEnvironmentFallback) {
  const std::string missing = "/tmp/osr_config_test_does_not_exist.json";
  std::remove(missing.c_str());
  EXPECT_THROW(osr::loadEngineConfig(missing, true), osr::ConfigError);

  ::setenv("OSR_ID", "osr9", 1);
  EXPECT_EQ(osr::loadEngineConfig(missing, false).osr_id, "osr9");

  const std::string path = "/tmp/osr_config_test.json";
  {
    std::ofstream out(path);
    out << R"({"osr_id": "osr3", "max_send_attempts": 4})";
  }
  osr::EngineConfig config = osr::loadEngineConfig(path, true);
  EXPECT_EQ(config.osr_id, "osr3");
  EXPECT_EQ(config.max_send_attempts, 4);

  ::unsetenv("OSR_ID");
  std::remove(path.c_str());
}

// -----------------------------------------------------------------------------
// 5. Catalog loading.
// -----------------------------------------------------------------------------
TEST(StaticCatalogTest, LoadsAndLooksUp) {
  osr::StaticCatalog catalog = osr::StaticCatalog::fromJsonText(R"([
    {"code": "A100", "name": "Widget"},
    {"code": "B200"},
    {"code": "L01", "name": "Aisle 1", "kind": "location"}
  ])");

  EXPECT_EQ(catalog.size(), 3u);
  auto widget = catalog.lookup("A100");
  ASSERT_TRUE(widget.has_value());
  EXPECT_EQ(widget->name, "Widget");
  EXPECT_EQ(widget->kind, osr::CatalogEntryKind::Item);
  EXPECT_EQ(catalog.lookup("B200")->name, "B200");
  EXPECT_EQ(catalog.lookup("L01")->kind, osr::CatalogEntryKind::Location);
  EXPECT_FALSE(catalog.lookup("Z999").has_value());

  EXPECT_THROW(osr::StaticCatalog::fromJsonText(R"({"code": "A"})"),
               osr::ConfigError);
  EXPECT_THROW(osr::StaticCatalog::fromJsonText(R"([{"name": "no code"}])"),
               osr::ConfigError);
  EXPECT_THROW(osr::StaticCatalog::fromJsonText(R"([{"code": "A", "kind": "bin"}])"),
               osr::ConfigError);
  EXPECT_THROW(osr::StaticCatalog::fromJsonFile("/nonexistent/catalog.json"),
               osr::ConfigError);
}
