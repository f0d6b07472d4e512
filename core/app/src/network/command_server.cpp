#include "osr/network/command_server.hpp"
#include "osr/domain/errors.hpp"

#include <cerrno>
#include <iostream>
#include <utility>

namespace osr {

CommandServer::CommandServer(CommandHandler command_handler,
                             std::string endpoint)
    : command_handler_(std::move(command_handler)),
      endpoint_(std::move(endpoint)) {}

CommandServer::~CommandServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): create socket and spawn worker thread
// -----------------------------------------------------------------------------
void CommandServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  socket_ = std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  socket_->set(zmq::sockopt::linger, 0);
  socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  try {
    socket_->bind(endpoint_);
  } catch (const zmq::error_t& e) {
    socket_.reset();
    context_.reset();
    throw ConfigError("cannot bind command endpoint " + endpoint_ + ": " +
                      e.what());
  }
  bound_endpoint_ = socket_->get(zmq::sockopt::last_endpoint);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[CommandServer] started. CMD=" << bound_endpoint_ << "\n";
}

// -----------------------------------------------------------------------------
// stop(): signal and join
// -----------------------------------------------------------------------------
void CommandServer::stop() {
  if (!running_.load()) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  running_.store(false);
  if (thread_.joinable()) {
    thread_.join();
  }

  socket_.reset();
  context_.reset();

  std::cout << "[CommandServer] stopped.\n";
}

void CommandServer::run() {
  while (running_.load()) {
    processCommands();
  }
}

// -----------------------------------------------------------------------------
// processCommands(): one bounded recv, dispatch, reply
// -----------------------------------------------------------------------------
void CommandServer::processCommands() {
  zmq::message_t request;
  zmq::recv_result_t result;

  try {
    result = socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    std::cerr << "[CommandServer] ERROR: recv failed: " << e.what() << "\n";
    running_.store(false);
    return;
  }

  if (!result.has_value()) {
    return;
  }

  std::string command(static_cast<const char*>(request.data()),
                      request.size());
  std::string response = command_handler_(command);

  zmq::message_t reply(response.data(), response.size());
  try {
    if (!socket_->send(reply, zmq::send_flags::none)) {
      std::cerr << "[CommandServer] ERROR: reply could not be sent\n";
    }
  } catch (const zmq::error_t& e) {
    std::cerr << "[CommandServer] ERROR: reply failed: " << e.what() << "\n";
  }
}

}  // namespace osr
