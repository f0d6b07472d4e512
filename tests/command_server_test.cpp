// =============================================================================
// command_server_test.cpp
// =============================================================================
// Unit tests for osr::CommandServer.
//
// Validates:
//   - Lifecycle: start() / stop() / destructor, idempotent calls
//   - Requests reach the handler and its reply goes back verbatim
//   - Ephemeral "tcp://127.0.0.1:*" endpoints are resolved
//   - Bad or occupied endpoints fail at start() with ConfigError
// =============================================================================

#include "osr/network/command_server.hpp"
#include "osr/domain/errors.hpp"

#include <gtest/gtest.h>
#include <zmq.hpp>

#include <atomic>
#include <string>

namespace {

// One REQ/REP exchange with a 2 s receive timeout.
std::string request(const std::string& endpoint, const std::string& body) {
  zmq::context_t context;
  zmq::socket_t socket(context, zmq::socket_type::req);
  socket.set(zmq::sockopt::linger, 0);
  socket.set(zmq::sockopt::rcvtimeo, 2000);
  socket.connect(endpoint);

  zmq::message_t msg(body.data(), body.size());
  if (!socket.send(msg, zmq::send_flags::none)) {
    return "<send failed>";
  }
  zmq::message_t reply;
  if (!socket.recv(reply, zmq::recv_flags::none)) {
    return "<timeout>";
  }
  return std::string(static_cast<const char*>(reply.data()), reply.size());
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. Round trip through the handler.
// -----------------------------------------------------------------------------
TEST(CommandServerTest, RepliesWithHandlerResult) {
  std::atomic<int> calls{0};
  osr::CommandServer server(
      [&calls](const std::string& cmd) {
        calls.fetch_add(1);
        return "echo:" + cmd;
      },
      "tcp://127.0.0.1:*");

  server.start();
  ASSERT_TRUE(server.isRunning());
  const std::string endpoint = server.boundEndpoint();
  EXPECT_EQ(endpoint.rfind("tcp://127.0.0.1:", 0), 0u);

  EXPECT_EQ(request(endpoint, "hello"), "echo:hello");
  EXPECT_EQ(request(endpoint, R"({"cmd":"ping"})"), R"(echo:{"cmd":"ping"})");
  EXPECT_EQ(calls.load(), 2);

  server.stop();
  EXPECT_FALSE(server.isRunning());
}

// -----------------------------------------------------------------------------
// 2. Idempotent start/stop; stop() without start() is harmless.
// -----------------------------------------------------------------------------
TEST(CommandServerTest, IdempotentStartStop) {
  osr::CommandServer server([](const std::string&) { return std::string("{}"); },
                            "tcp://127.0.0.1:*");
  EXPECT_NO_FATAL_FAILURE(server.stop());

  server.start();
  EXPECT_NO_FATAL_FAILURE(server.start());
  EXPECT_NO_FATAL_FAILURE(server.stop());
  EXPECT_NO_FATAL_FAILURE(server.stop());
}

// -----------------------------------------------------------------------------
// 3. RAII: destructor joins the thread.
// -----------------------------------------------------------------------------
TEST(CommandServerTest, DestructorStopsThread) {
  {
    osr::CommandServer server(
        [](const std::string&) { return std::string("{}"); },
        "tcp://127.0.0.1:*");
    server.start();
  }
  SUCCEED();
}

// -----------------------------------------------------------------------------
// 4. An endpoint that cannot be bound fails at start().
// -----------------------------------------------------------------------------
TEST(CommandServerTest, BadEndpointThrows) {
  osr::CommandServer server([](const std::string&) { return std::string("{}"); },
                            "bogus://nowhere");
  EXPECT_THROW(server.start(), osr::ConfigError);
  EXPECT_FALSE(server.isRunning());
}

// -----------------------------------------------------------------------------
// 5. A second server on an endpoint already in use reports ConfigError and
//    leaves the first one serving.
// -----------------------------------------------------------------------------
TEST(CommandServerTest, EndpointInUseThrowsConfigError) {
  osr::CommandServer first([](const std::string&) { return std::string("one"); },
                           "tcp://127.0.0.1:*");
  first.start();
  const std::string endpoint = first.boundEndpoint();

  osr::CommandServer second(
      [](const std::string&) { return std::string("two"); }, endpoint);
  EXPECT_THROW(second.start(), osr::ConfigError);
  EXPECT_FALSE(second.isRunning());

  EXPECT_EQ(request(endpoint, "ping"), "one");
  first.stop();
}
