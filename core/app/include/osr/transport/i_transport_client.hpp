#pragma once

#include "osr/domain/order_document.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace osr {

// Handle the OSR returns for an accepted order; needed for cancel and status.
using RemoteReference = std::string;

// What the OSR reports for an order it has accepted.
enum class RemoteStatus {
  Accepted,
  Processing,
  Completed,
  Cancelled,
  Rejected,
};

const char* toString(RemoteStatus status);
std::optional<RemoteStatus> parseRemoteStatus(const std::string& name);

// -----------------------------------------------------------------------------
// ITransportClient — remote-invocation boundary to the OSR
// -----------------------------------------------------------------------------
//
// @brief  Send, cancel, and query one order at a time.
//
// @details
// Every call blocks for at most `timeout` and either returns the remote
// result or throws TransportError:
//
//   kind() == Transient → nothing definite happened (unreachable, busy,
//                         timed out). The caller may retry.
//   kind() == Permanent → the OSR answered and refused (schema rejected,
//                         unknown reference, not cancellable, malformed
//                         reply). Retrying cannot help.
//
// Implementations never retry on their own; retry policy belongs to
// OrderLifecycleEngine. A connection is established lazily on first use and
// reused; a transient failure drops it so the next call starts fresh.
//
// Implementations:
//   - ZmqTransportClient: JSON over a ZeroMQ REQ socket.
//   - MockTransportClient: scripted, in-process, with call counters.
//
// Ownership:
//   Created by main() (or a test) and borrowed by OrderService and the
//   lifecycle engine. Must outlive them.
//
// Thread model:
//   Implementations must accept calls from several threads; they may
//   serialise them internally.
// -----------------------------------------------------------------------------
class ITransportClient {
 public:
  virtual ~ITransportClient() = default;

  // Submits a finalized document. Returns the reference the OSR assigned.
  virtual RemoteReference send(const domain::OrderDocument& document,
                               std::chrono::milliseconds timeout) = 0;

  // Returns normally when the OSR acknowledged the cancellation.
  virtual void cancel(const RemoteReference& reference,
                      std::chrono::milliseconds timeout) = 0;

  virtual RemoteStatus queryStatus(const RemoteReference& reference,
                                   std::chrono::milliseconds timeout) = 0;
};

}  // namespace osr
