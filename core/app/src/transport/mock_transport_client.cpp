#include "osr/transport/mock_transport_client.hpp"

#include <utility>

namespace osr {

// -----------------------------------------------------------------------------
// send(): hook, then scripted failure, then scripted or generated reference
// -----------------------------------------------------------------------------
RemoteReference MockTransportClient::send(const domain::OrderDocument& document,
                                          std::chrono::milliseconds) {
  std::function<void()> hook;
  {
    std::lock_guard lock(mutex_);
    ++send_calls_;
    hook = send_hook_;
  }
  if (hook) {
    hook();
  }

  std::lock_guard lock(mutex_);
  last_sent_ = document;
  if (!send_failures_.empty()) {
    TransportError error = send_failures_.front();
    send_failures_.pop_front();
    throw error;
  }
  ++accepted_sends_;
  if (!references_.empty()) {
    RemoteReference reference = std::move(references_.front());
    references_.pop_front();
    return reference;
  }
  return "R-" + std::to_string(accepted_sends_);
}

void MockTransportClient::cancel(const RemoteReference& reference,
                                 std::chrono::milliseconds) {
  std::lock_guard lock(mutex_);
  ++cancel_calls_;
  if (!cancel_failures_.empty()) {
    TransportError error = cancel_failures_.front();
    cancel_failures_.pop_front();
    throw error;
  }
  cancelled_.push_back(reference);
}

RemoteStatus MockTransportClient::queryStatus(const RemoteReference&,
                                              std::chrono::milliseconds) {
  std::lock_guard lock(mutex_);
  ++status_calls_;
  if (!status_failures_.empty()) {
    TransportError error = status_failures_.front();
    status_failures_.pop_front();
    throw error;
  }
  if (!statuses_.empty()) {
    RemoteStatus status = statuses_.front();
    statuses_.pop_front();
    return status;
  }
  return RemoteStatus::Accepted;
}

// -----------------------------------------------------------------------------
// Scripting
// -----------------------------------------------------------------------------
void MockTransportClient::failNextSend(TransportErrorKind kind,
                                       const std::string& message) {
  std::lock_guard lock(mutex_);
  send_failures_.emplace_back(kind, message);
}

void MockTransportClient::pushReference(RemoteReference reference) {
  std::lock_guard lock(mutex_);
  references_.push_back(std::move(reference));
}

void MockTransportClient::failNextCancel(TransportErrorKind kind,
                                         const std::string& message) {
  std::lock_guard lock(mutex_);
  cancel_failures_.emplace_back(kind, message);
}

void MockTransportClient::pushStatus(RemoteStatus status) {
  std::lock_guard lock(mutex_);
  statuses_.push_back(status);
}

void MockTransportClient::failNextStatusQuery(TransportErrorKind kind,
                                              const std::string& message) {
  std::lock_guard lock(mutex_);
  status_failures_.emplace_back(kind, message);
}

void MockTransportClient::setSendHook(std::function<void()> hook) {
  std::lock_guard lock(mutex_);
  send_hook_ = std::move(hook);
}

// -----------------------------------------------------------------------------
// Observation
// -----------------------------------------------------------------------------
int MockTransportClient::sendCalls() const {
  std::lock_guard lock(mutex_);
  return send_calls_;
}

int MockTransportClient::cancelCalls() const {
  std::lock_guard lock(mutex_);
  return cancel_calls_;
}

int MockTransportClient::statusCalls() const {
  std::lock_guard lock(mutex_);
  return status_calls_;
}

std::optional<domain::OrderDocument> MockTransportClient::lastSentDocument()
    const {
  std::lock_guard lock(mutex_);
  return last_sent_;
}

std::vector<RemoteReference> MockTransportClient::cancelledReferences() const {
  std::lock_guard lock(mutex_);
  return cancelled_;
}

}  // namespace osr
