// =============================================================================
// order_service_test.cpp
// =============================================================================
// Unit tests for osr::OrderService.
//
// Validates:
//   - Build → finalize → submit through the service facade
//   - executeCommand(): every command, success and error replies
//   - start() recovers submissions left Pending by a previous process
//   - Catalog wiring from config.catalog_path
//   - Sandbox commands are limited to Test servers
//   - Serving the command endpoint over ZeroMQ
//
// Design: MockTransportClient + SimulationTimeProvider; history in a temp
//         directory. Each test builds its own service.
// =============================================================================

#include "osr/domain/errors.hpp"
#include "osr/engine/order_service.hpp"
#include "osr/history/json_history_store.hpp"
#include "osr/lifecycle/order_lifecycle_engine.hpp"
#include "osr/time/simulation_time_provider.hpp"
#include "osr/transport/mock_transport_client.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>

using nlohmann::json;
using osr::domain::OrderStatus;

constexpr std::int64_t kNow = 1'700'000'000'000;

class OrderServiceTestFixture : public ::testing::Test {
 protected:
  void SetUp() override {
    char pattern[] = "/tmp/osr_service_test_XXXXXX";
    ASSERT_NE(::mkdtemp(pattern), nullptr);
    dir = pattern;

    config.osr_id = "osr1";
    config.history_path = dir + "/history.json";
    config.command_endpoint = "tcp://127.0.0.1:*";
  }

  void TearDown() override { std::filesystem::remove_all(dir); }

  std::unique_ptr<osr::OrderService> makeService() {
    return std::make_unique<osr::OrderService>(config, transport, clock);
  }

  // Runs one command and parses the reply.
  static json run(osr::OrderService& service, const json& request) {
    return json::parse(service.executeCommand(request.dump()));
  }

  std::string dir;
  osr::EngineConfig config;
  osr::MockTransportClient transport;
  osr::SimulationTimeProvider clock{kNow};
};

// -----------------------------------------------------------------------------
// 1. Facade: submit builds and finalizes, show and list read the history.
// -----------------------------------------------------------------------------
TEST_F(OrderServiceTestFixture, SubmitShowList) {
  auto service = makeService();
  service->start();

  osr::domain::OrderSpec spec;
  spec.kind = osr::domain::OrderKind::Standard;
  spec.fields = {{"item", "A100"}, {"qty", "5"}, {"location", "L01"}};
  transport.pushReference("R-123");

  auto record = service->submit(spec);
  EXPECT_EQ(record.status, OrderStatus::Sent);
  EXPECT_EQ(record.remote_reference, "R-123");
  EXPECT_TRUE(record.document.isFinalized());

  EXPECT_EQ(service->show(record.id), record);
  EXPECT_THROW(service->show("nope"), osr::NotFoundError);

  osr::HistoryFilter sent;
  sent.statuses = {OrderStatus::Sent};
  EXPECT_EQ(service->list(sent).size(), 1u);

  EXPECT_EQ(service->cancel(record.id).result,
            osr::CancelOutcome::Result::Cancelled);
  EXPECT_EQ(service->list(sent).size(), 0u);

  service->stop();
}

// -----------------------------------------------------------------------------
// 2. ping, and malformed or unknown requests.
// -----------------------------------------------------------------------------
TEST_F(OrderServiceTestFixture, PingAndBadRequests) {
  auto service = makeService();

  EXPECT_EQ(run(*service, {{"cmd", "ping"}}),
            json({{"status", "ok"}, {"response", "PONG"}}));

  json bad = json::parse(service->executeCommand("{not json"));
  EXPECT_EQ(bad["status"], "error");
  EXPECT_EQ(bad["category"], "Request");

  json unknown = run(*service, {{"cmd", "explode"}});
  EXPECT_EQ(unknown["category"], "Request");
  EXPECT_EQ(unknown["message"], "unknown command: explode");

  json no_cmd = run(*service, {{"id", "x"}});
  EXPECT_EQ(no_cmd["category"], "Validation");
  EXPECT_EQ(no_cmd["field"], "cmd");
}

// -----------------------------------------------------------------------------
// 3. submit: pair list or object fields, numeric values, caller id,
//    dry run flag.
// -----------------------------------------------------------------------------
TEST_F(OrderServiceTestFixture, SubmitCommand) {
  auto service = makeService();

  json sent = run(*service, {{"cmd", "submit"},
                             {"kind", "Standard"},
                             {"fields", {{"item", "A100"}, {"qty", "5"}, {"location", "L01"}}},
                             {"id", "console-1"}});
  ASSERT_EQ(sent["status"], "ok") << sent.dump();
  EXPECT_EQ(sent["record"]["id"], "console-1");
  EXPECT_EQ(sent["record"]["status"], "Sent");
  EXPECT_EQ(sent["record"]["remote_reference"], "R-1");

  json object_fields = run(*service, {{"cmd", "submit"},
                                      {"kind", "Manual"},
                                      {"fields", {{"item", "B200"}, {"qty", 3}}},
                                      {"dry_run", true}});
  ASSERT_EQ(object_fields["status"], "ok") << object_fields.dump();
  EXPECT_EQ(object_fields["record"]["status"], "Sent");
  EXPECT_EQ(object_fields["record"]["remote_reference"],
            "DRY-" + object_fields["record"]["id"].get<std::string>());
  EXPECT_EQ(transport.sendCalls(), 1);
}

// -----------------------------------------------------------------------------
// 4. Errors carry their category (and field for validation).
// -----------------------------------------------------------------------------
TEST_F(OrderServiceTestFixture, SubmitCommandErrors) {
  auto service = makeService();

  json invalid = run(*service, {{"cmd", "submit"},
                                {"kind", "Standard"},
                                {"fields", json::array({json::array({"item", "A100"})})}});
  EXPECT_EQ(invalid["status"], "error");
  EXPECT_EQ(invalid["category"], "Validation");
  EXPECT_EQ(invalid["field"], "qty");

  json kind = run(*service, {{"cmd", "submit"}, {"kind", "Teleport"}});
  EXPECT_EQ(kind["field"], "kind");

  json missing = run(*service, {{"cmd", "show"}, {"id", "ghost"}});
  EXPECT_EQ(missing["category"], "NotFound");

  run(*service, {{"cmd", "submit"},
                 {"kind", "Manual"},
                 {"fields", {{"item", "A"}, {"qty", "1"}}},
                 {"id", "dup"}});
  json duplicate = run(*service, {{"cmd", "submit"},
                                  {"kind", "Manual"},
                                  {"fields", {{"item", "A"}, {"qty", "1"}}},
                                  {"id", "dup"}});
  EXPECT_EQ(duplicate["category"], "DuplicateId");
}

// -----------------------------------------------------------------------------
// 5. cancel, status, show, list, resubmit, purge, recover commands.
// -----------------------------------------------------------------------------
TEST_F(OrderServiceTestFixture, LifecycleCommands) {
  auto service = makeService();
  const json fields = {{"item", "A100"}, {"qty", "5"}, {"location", "L01"}};

  run(*service, {{"cmd", "submit"}, {"kind", "Standard"}, {"fields", fields}, {"id", "a"}});
  run(*service, {{"cmd", "submit"}, {"kind", "Standard"}, {"fields", fields}, {"id", "b"}});

  json cancelled = run(*service, {{"cmd", "cancel"}, {"id", "a"}});
  EXPECT_EQ(cancelled["result"], "Cancelled");
  EXPECT_EQ(cancelled["record"]["status"], "Cancelled");

  json again = run(*service, {{"cmd", "cancel"}, {"id", "a"}});
  EXPECT_EQ(again["category"], "InvalidTransition");

  transport.pushStatus(osr::RemoteStatus::Completed);
  json status = run(*service, {{"cmd", "status"}, {"id", "b"}});
  EXPECT_EQ(status["record"]["status"], "Completed");

  json show = run(*service, {{"cmd", "show"}, {"id", "b"}});
  EXPECT_NE(show["xml"].get<std::string>().find("<pick_order "), std::string::npos);

  json listed = run(*service, {{"cmd", "list"}, {"statuses", json::array({"Cancelled"})}});
  ASSERT_EQ(listed["records"].size(), 1u);
  EXPECT_EQ(listed["records"][0]["id"], "a");

  json bad_status = run(*service, {{"cmd", "list"}, {"statuses", json::array({"Lost"})}});
  EXPECT_EQ(bad_status["category"], "Validation");

  json resubmitted = run(*service, {{"cmd", "resubmit"}, {"id", "a"}, {"new_id", "a2"}});
  EXPECT_EQ(resubmitted["record"]["id"], "a2");
  EXPECT_EQ(resubmitted["record"]["status"], "Sent");

  EXPECT_EQ(run(*service, {{"cmd", "recover"}})["recovered"], 0);

  json bad_purge = run(*service, {{"cmd", "purge"}, {"older_than", "forever"}});
  EXPECT_EQ(bad_purge["field"], "timeframe");

  EXPECT_EQ(run(*service, {{"cmd", "purge"}, {"older_than", "1d"}})["removed"], 0);
  clock.advance_time(kNow + 2LL * 24 * 60 * 60 * 1000);
  EXPECT_EQ(run(*service, {{"cmd", "purge"}, {"older_than", "1d"}})["removed"], 3);
  EXPECT_EQ(run(*service, {{"cmd", "list"}})["records"].size(), 0u);
}

// -----------------------------------------------------------------------------
// 6. start() settles records a crashed process left Pending.
// -----------------------------------------------------------------------------
TEST_F(OrderServiceTestFixture, StartRecoversInterruptedSubmissions) {
  {
    osr::JsonHistoryStore store(config.history_path);
    osr::domain::OrderRecord leftover;
    leftover.id = "osr1-000003";
    leftover.status = OrderStatus::Pending;
    leftover.document.finalize();
    leftover.created_at_ms = kNow - 1000;
    leftover.last_updated_at_ms = kNow - 1000;
    store.append(leftover);
  }

  auto service = makeService();
  service->start();

  auto recovered = service->show("osr1-000003");
  EXPECT_EQ(recovered.status, OrderStatus::Failed);
  EXPECT_EQ(recovered.last_error, osr::kInterruptedSubmissionReason);
  service->stop();
}

// -----------------------------------------------------------------------------
// 7. catalog_path wires a catalog into the builder; a bad catalog fails
//    construction.
// -----------------------------------------------------------------------------
TEST_F(OrderServiceTestFixture, CatalogFromConfig) {
  config.catalog_path = dir + "/catalog.json";
  {
    std::ofstream out(config.catalog_path);
    out << R"([{"code": "A100", "name": "Widget"}])";
  }
  auto service = makeService();

  json unknown = run(*service, {{"cmd", "submit"},
                                {"kind", "Manual"},
                                {"fields", {{"item", "Z9"}, {"qty", "1"}}}});
  EXPECT_EQ(unknown["field"], "item");
  EXPECT_EQ(unknown["message"], "item: not found in catalog");

  config.catalog_path = dir + "/missing.json";
  EXPECT_THROW(makeService(), osr::ConfigError);
}

// -----------------------------------------------------------------------------
// 8. Sandbox commands: Test servers only.
// -----------------------------------------------------------------------------
TEST_F(OrderServiceTestFixture, SandboxCommandsRequireTestServer) {
  {
    auto live = makeService();
    live->submit({osr::domain::OrderKind::Standard,
                  {{"item", "A100"}, {"qty", "5"}, {"location", "L01"}},
                  false},
                 std::string("s-1"));
    EXPECT_THROW(live->sandboxCommands("s-1"), osr::ConfigError);
  }

  config.server_type = osr::ServerType::Test;
  auto test_server = makeService();
  json reply = run(*test_server, {{"cmd", "sandbox"}, {"id", "s-1"}, {"element", "in.02"}});
  ASSERT_EQ(reply["status"], "ok") << reply.dump();
  EXPECT_EQ(reply["insert_now"], "simosr1 -i in.02 L01");
  EXPECT_EQ(reply["remove_later"], "simosr1 -r in.02 L01");
}

// -----------------------------------------------------------------------------
// 9. Serving: the command endpoint answers over ZeroMQ until stop().
// -----------------------------------------------------------------------------
TEST_F(OrderServiceTestFixture, ServesCommandEndpoint) {
  auto service = makeService();
  service->start(true);
  ASSERT_TRUE(service->isRunning());
  const std::string endpoint = service->commandEndpoint();
  ASSERT_FALSE(endpoint.empty());

  zmq::context_t context;
  zmq::socket_t socket(context, zmq::socket_type::req);
  socket.set(zmq::sockopt::linger, 0);
  socket.set(zmq::sockopt::rcvtimeo, 2000);
  socket.connect(endpoint);

  const std::string body = R"({"cmd":"ping"})";
  zmq::message_t request(body.data(), body.size());
  ASSERT_TRUE(socket.send(request, zmq::send_flags::none).has_value());
  zmq::message_t reply;
  ASSERT_TRUE(socket.recv(reply, zmq::recv_flags::none).has_value())
      << "Timed out: command endpoint did not answer";

  json parsed = json::parse(
      std::string(static_cast<const char*>(reply.data()), reply.size()));
  EXPECT_EQ(parsed["response"], "PONG");

  service->stop();
  EXPECT_FALSE(service->isRunning());
  EXPECT_TRUE(service->commandEndpoint().empty());
}
