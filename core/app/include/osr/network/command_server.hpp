#pragma once

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace osr {

// -----------------------------------------------------------------------------
// CommandServer — ZeroMQ REP endpoint for operator consoles
// -----------------------------------------------------------------------------
//
// @brief  Runs a dedicated thread that receives JSON command strings on a
//         REP socket, hands each one to a callback, and sends the callback's
//         JSON reply back.
//
// @details
// This is what lets several operator consoles share one long-running order
// desk (and therefore one IdLockTable) instead of each running its own
// process against the same history file.
//
// The REP socket uses ZMQ_RCVTIMEO so recv() returns periodically and the
// loop can notice stop(). Requests are handled one at a time in arrival
// order; the callback (OrderService::executeCommand) must always return a
// reply string, since a REP socket that does not answer is stuck.
//
// Thread model:
//   start()/stop() are called from the main thread. The callback runs on
//   the server thread.
//
// Ownership:
//   Owned by OrderService via std::unique_ptr. Owns the ZMQ context, the
//   socket and the worker thread.
// -----------------------------------------------------------------------------
class CommandServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  CommandServer(CommandHandler command_handler, std::string endpoint);

  // RAII: stops the thread if it is still running.
  ~CommandServer();

  CommandServer(const CommandServer&) = delete;
  CommandServer& operator=(const CommandServer&) = delete;
  CommandServer(CommandServer&&) = delete;
  CommandServer& operator=(CommandServer&&) = delete;

  // Binds the socket and spawns the worker thread. No-op if running.
  // @throws ConfigError if the endpoint cannot be bound (malformed or
  //         already in use).
  void start();

  // Signals the thread, joins it, closes the socket. No-op if stopped.
  void stop();

  bool isRunning() const { return running_.load(); }

  // Endpoint actually bound; resolves wildcards such as "tcp://127.0.0.1:*".
  // Empty before start().
  std::string boundEndpoint() const { return bound_endpoint_; }

 private:
  void run();
  void processCommands();

  static constexpr int kPollTimeoutMs = 100;

  CommandHandler command_handler_;
  std::string endpoint_;
  std::string bound_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> socket_;

  std::atomic<bool> running_{false};
  std::thread thread_;
};

}  // namespace osr
