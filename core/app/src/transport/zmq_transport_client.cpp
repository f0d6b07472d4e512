#include "osr/transport/zmq_transport_client.hpp"
#include "osr/domain/errors.hpp"

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <limits>
#include <string>
#include <utility>

namespace osr {

using json = nlohmann::json;

namespace {

bool isTransientCode(const std::string& code) {
  return code == "unavailable" || code == "busy" || code == "timeout";
}

}  // namespace

ZmqTransportClient::ZmqTransportClient(std::string endpoint,
                                       std::string osr_id)
    : endpoint_(std::move(endpoint)), osr_id_(std::move(osr_id)) {}

// Socket must close before the context it belongs to.
ZmqTransportClient::~ZmqTransportClient() { socket_.reset(); }

// -----------------------------------------------------------------------------
// send(): send_order → reference (falls back to the order number)
// -----------------------------------------------------------------------------
RemoteReference ZmqTransportClient::send(const domain::OrderDocument& document,
                                         std::chrono::milliseconds timeout) {
  json request = {{"op", "send_order"},
                  {"osr_id", osr_id_},
                  {"kind", domain::toString(document.kind())},
                  {"order_number", document.orderNumber()},
                  {"document", document.toXml()}};

  std::lock_guard lock(call_mutex_);
  json reply = roundTrip(request, timeout);
  auto it = reply.find("reference");
  if (it == reply.end() || it->is_null()) {
    return document.orderNumber();
  }
  if (!it->is_string() || it->get<std::string>().empty()) {
    throw TransportError(TransportErrorKind::Permanent,
                         "send_order reply carries an invalid reference");
  }
  return it->get<std::string>();
}

void ZmqTransportClient::cancel(const RemoteReference& reference,
                                std::chrono::milliseconds timeout) {
  json request = {
      {"op", "cancel_order"}, {"osr_id", osr_id_}, {"reference", reference}};

  std::lock_guard lock(call_mutex_);
  roundTrip(request, timeout);
}

RemoteStatus ZmqTransportClient::queryStatus(const RemoteReference& reference,
                                             std::chrono::milliseconds timeout) {
  json request = {
      {"op", "query_status"}, {"osr_id", osr_id_}, {"reference", reference}};

  std::lock_guard lock(call_mutex_);
  json reply = roundTrip(request, timeout);
  auto it = reply.find("remote_status");
  if (it == reply.end() || !it->is_string()) {
    throw TransportError(TransportErrorKind::Permanent,
                         "query_status reply lacks remote_status");
  }
  auto status = parseRemoteStatus(it->get<std::string>());
  if (!status) {
    throw TransportError(TransportErrorKind::Permanent,
                         "unknown remote_status \"" + it->get<std::string>() +
                             "\"");
  }
  return *status;
}

bool ZmqTransportClient::connected() const {
  std::lock_guard lock(call_mutex_);
  return socket_ != nullptr;
}

// -----------------------------------------------------------------------------
// roundTrip(): one REQ/REP exchange bounded by `timeout` in each direction
// -----------------------------------------------------------------------------
json ZmqTransportClient::roundTrip(const json& request,
                                   std::chrono::milliseconds timeout) {
  std::string payload;
  try {
    payload = request.dump();
  } catch (const json::exception& e) {
    throw TransportError(TransportErrorKind::Permanent,
                         std::string("cannot encode request: ") + e.what());
  }
  // ZeroMQ reads a negative timeout as "wait forever".
  const int timeout_ms = static_cast<int>(std::clamp<std::int64_t>(
      timeout.count(), 0, std::numeric_limits<int>::max()));
  zmq::message_t reply_msg;

  try {
    ensureConnected();
    socket_->set(zmq::sockopt::sndtimeo, timeout_ms);
    socket_->set(zmq::sockopt::rcvtimeo, timeout_ms);

    zmq::message_t request_msg(payload.data(), payload.size());
    if (!socket_->send(request_msg, zmq::send_flags::none)) {
      invalidate();
      throw TransportError(TransportErrorKind::Transient,
                           "could not hand request to " + endpoint_ +
                               " within " + std::to_string(timeout_ms) + " ms");
    }

    // An empty recv_result_t means rcvtimeo expired.
    if (!socket_->recv(reply_msg, zmq::recv_flags::none)) {
      invalidate();
      throw TransportError(TransportErrorKind::Transient,
                           "no reply from " + endpoint_ + " within " +
                               std::to_string(timeout_ms) + " ms");
    }
  } catch (const zmq::error_t& e) {
    invalidate();
    throw TransportError(TransportErrorKind::Transient,
                         std::string("zmq error: ") + e.what());
  }

  json reply;
  std::string status;
  try {
    reply = json::parse(std::string(static_cast<const char*>(reply_msg.data()),
                                    reply_msg.size()));
    if (reply.is_object()) {
      status = reply.value("status", std::string{});
    }
  } catch (const json::exception&) {
    status.clear();
  }
  if (status == "ok") {
    return reply;
  }
  if (status != "error") {
    throw TransportError(TransportErrorKind::Permanent,
                         "malformed reply from " + endpoint_);
  }

  const auto code_it = reply.find("code");
  const auto message_it = reply.find("message");
  const std::string code = code_it != reply.end() && code_it->is_string()
                               ? code_it->get<std::string>()
                               : std::string("unspecified");
  const std::string message =
      message_it != reply.end() && message_it->is_string()
          ? message_it->get<std::string>()
          : std::string{};
  const bool transient = isTransientCode(code);
  if (transient) {
    // Every transient failure drops the connection, answered or not.
    invalidate();
  }
  throw TransportError(
      transient ? TransportErrorKind::Transient : TransportErrorKind::Permanent,
      "OSR replied " + code + (message.empty() ? "" : ": " + message));
}

void ZmqTransportClient::ensureConnected() {
  if (socket_) {
    return;
  }
  socket_ = std::make_unique<zmq::socket_t>(context_, zmq::socket_type::req);
  socket_->set(zmq::sockopt::linger, 0);
  socket_->connect(endpoint_);
  std::cout << "[ZmqTransportClient] connected to " << endpoint_ << "\n";
}

void ZmqTransportClient::invalidate() {
  if (socket_) {
    socket_.reset();
    std::cerr << "[ZmqTransportClient] connection to " << endpoint_
              << " dropped\n";
  }
}

}  // namespace osr
