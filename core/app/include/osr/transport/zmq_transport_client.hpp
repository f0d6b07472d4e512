#pragma once

#include "osr/transport/i_transport_client.hpp"

#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <memory>
#include <mutex>
#include <string>

namespace osr {

// -----------------------------------------------------------------------------
// ZmqTransportClient — JSON-over-ZeroMQ implementation of ITransportClient
// -----------------------------------------------------------------------------
//
// @brief  Talks to the OSR order endpoint through a ZeroMQ REQ socket, one
//         JSON request and one JSON reply per call.
//
// @details
// Wire protocol (UTF-8 JSON, one message per frame):
//
//   → {"op":"send_order","osr_id":"osr1","kind":"Standard",
//      "order_number":"src-pick-1","document":"<host2osr>...</host2osr>"}
//   ← {"status":"ok","reference":"R-123"}
//
//   → {"op":"cancel_order","osr_id":"osr1","reference":"R-123"}
//   ← {"status":"ok"}
//
//   → {"op":"query_status","osr_id":"osr1","reference":"R-123"}
//   ← {"status":"ok","remote_status":"Processing"}
//
//   ← {"status":"error","code":"busy","message":"..."}   (any request)
//
// A send_order reply without "reference" means the OSR tracks the order by
// its order_number, which then becomes the reference.
//
// Error classification:
//   - code "unavailable" | "busy" | "timeout"         → Transient
//   - any other error code                              → Permanent
//   - no reply within the timeout, zmq::error_t         → Transient
//   - reply that is not JSON or lacks required fields   → Permanent
//
// Connection handling (lazy pirate):
//   The REQ socket is created on first use with linger=0 and reused while
//   calls succeed. REQ sockets enforce strict send/recv alternation, so a
//   request that times out leaves the socket unusable; every transient
//   failure therefore closes it and the next call reconnects.
//
// Thread model:
//   ZeroMQ sockets must not be shared between threads without
//   synchronisation. A mutex serialises whole request/reply exchanges, so
//   concurrent callers queue behind each other. The lifecycle engine's
//   parallelism across ids is preserved everywhere except on the wire.
//
// Ownership:
//   Owns its zmq::context_t and socket (RAII).
// -----------------------------------------------------------------------------
class ZmqTransportClient final : public ITransportClient {
 public:
  ZmqTransportClient(std::string endpoint, std::string osr_id);
  ~ZmqTransportClient() override;

  ZmqTransportClient(const ZmqTransportClient&) = delete;
  ZmqTransportClient& operator=(const ZmqTransportClient&) = delete;
  ZmqTransportClient(ZmqTransportClient&&) = delete;
  ZmqTransportClient& operator=(ZmqTransportClient&&) = delete;

  RemoteReference send(const domain::OrderDocument& document,
                       std::chrono::milliseconds timeout) override;
  void cancel(const RemoteReference& reference,
              std::chrono::milliseconds timeout) override;
  RemoteStatus queryStatus(const RemoteReference& reference,
                           std::chrono::milliseconds timeout) override;

  // True while a socket is open (a call succeeded and nothing failed
  // transiently since).
  bool connected() const;

 private:
  // Sends `request`, waits for the reply, and returns it when status is
  // "ok". Throws TransportError otherwise. Caller must hold call_mutex_.
  nlohmann::json roundTrip(const nlohmann::json& request,
                           std::chrono::milliseconds timeout);

  void ensureConnected();
  void invalidate();

  std::string endpoint_;
  std::string osr_id_;

  mutable std::mutex call_mutex_;
  zmq::context_t context_{1};
  std::unique_ptr<zmq::socket_t> socket_;
};

}  // namespace osr
