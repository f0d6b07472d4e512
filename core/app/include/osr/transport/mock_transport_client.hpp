#pragma once

#include "osr/domain/errors.hpp"
#include "osr/transport/i_transport_client.hpp"

#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace osr {

// -----------------------------------------------------------------------------
// MockTransportClient — scriptable in-process OSR
// -----------------------------------------------------------------------------
//
// @brief  ITransportClient that answers from a script instead of a socket.
//
// @details
// Each operation has its own FIFO of scripted failures. A call first
// consumes the next scripted failure for its operation, if any, and throws
// it; otherwise it succeeds:
//
//   send        → next scripted reference, else "R-<n>" (n counts successful
//                 sends from 1)
//   cancel      → acknowledged
//   queryStatus → next scripted status, else Accepted
//
// Every call is counted, including failed ones, so tests can assert
// "exactly one attempt" or "no transport call at all".
//
// setSendHook() installs a callback that runs at the start of every send()
// on the calling thread, before the script is consulted and without any
// internal lock held. Concurrency tests use it to hold a submission in
// flight.
//
// The CLI's --mock-endpoint mode uses an unscripted instance, which accepts
// everything: a rehearsal of the full lifecycle without an OSR.
//
// Thread model:
//   All members are guarded by one mutex; safe to call from any thread.
// -----------------------------------------------------------------------------
class MockTransportClient final : public ITransportClient {
 public:
  MockTransportClient() = default;

  MockTransportClient(const MockTransportClient&) = delete;
  MockTransportClient& operator=(const MockTransportClient&) = delete;

  RemoteReference send(const domain::OrderDocument& document,
                       std::chrono::milliseconds timeout) override;
  void cancel(const RemoteReference& reference,
              std::chrono::milliseconds timeout) override;
  RemoteStatus queryStatus(const RemoteReference& reference,
                           std::chrono::milliseconds timeout) override;

  // --- Scripting -----------------------------------------------------------
  void failNextSend(TransportErrorKind kind,
                    const std::string& message = "scripted send failure");
  void pushReference(RemoteReference reference);
  void failNextCancel(TransportErrorKind kind,
                      const std::string& message = "scripted cancel failure");
  void pushStatus(RemoteStatus status);
  void failNextStatusQuery(
      TransportErrorKind kind,
      const std::string& message = "scripted status failure");
  void setSendHook(std::function<void()> hook);

  // --- Observation ---------------------------------------------------------
  int sendCalls() const;
  int cancelCalls() const;
  int statusCalls() const;
  std::optional<domain::OrderDocument> lastSentDocument() const;
  std::vector<RemoteReference> cancelledReferences() const;

 private:
  mutable std::mutex mutex_;
  std::deque<TransportError> send_failures_;
  std::deque<TransportError> cancel_failures_;
  std::deque<TransportError> status_failures_;
  std::deque<RemoteReference> references_;
  std::deque<RemoteStatus> statuses_;
  std::function<void()> send_hook_;

  int send_calls_{0};
  int cancel_calls_{0};
  int status_calls_{0};
  int accepted_sends_{0};
  std::optional<domain::OrderDocument> last_sent_;
  std::vector<RemoteReference> cancelled_;
};

}  // namespace osr
