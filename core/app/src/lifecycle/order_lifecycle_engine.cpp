#include "osr/lifecycle/order_lifecycle_engine.hpp"
#include "osr/document/order_schema.hpp"
#include "osr/domain/errors.hpp"
#include "osr/lifecycle/order_state_machine.hpp"

#include <algorithm>
#include <iostream>

namespace osr {

using domain::OrderDocument;
using domain::OrderRecord;
using domain::OrderStatus;

namespace {

constexpr const char* kDryRunReferencePrefix = "DRY-";
constexpr const char* kLocalIdPrefix = "local";

// Ids are "<osr_id>-NNNNNN"; dry runs without an OSR configured use "local".
std::string systemIdPrefix(const EngineConfig& config) {
  return config.osr_id.empty() ? kLocalIdPrefix : config.osr_id;
}

bool isSyntheticReference(const std::string& reference) {
  return reference.rfind(kDryRunReferencePrefix, 0) == 0;
}

}  // namespace

const char* toString(CancelOutcome::Result result) {
  switch (result) {
    case CancelOutcome::Result::Cancelled:      return "Cancelled";
    case CancelOutcome::Result::RetryLater:     return "RetryLater";
    case CancelOutcome::Result::NotCancellable: return "NotCancellable";
  }
  return "Unknown";
}

// -----------------------------------------------------------------------------
// Constructor: seed the id sequence past everything the history has seen
// -----------------------------------------------------------------------------
OrderLifecycleEngine::OrderLifecycleEngine(const EngineConfig& config,
                                           IHistoryStore& history,
                                           ITransportClient& transport,
                                           IdLockTable& locks,
                                           ITimeProvider& clock)
    : config_(config),
      history_(history),
      transport_(transport),
      locks_(locks),
      clock_(clock),
      call_timeout_(config.call_timeout_ms),
      id_gen_(systemIdPrefix(config),
              history.maxSequence(systemIdPrefix(config))) {}

// -----------------------------------------------------------------------------
// submit()
// -----------------------------------------------------------------------------
OrderRecord OrderLifecycleEngine::submit(const OrderDocument& document,
                                         std::optional<std::string> id) {
  if (!document.isFinalized()) {
    throw ValidationError("document",
                          "document must be finalized before submission");
  }
  const bool dry_run = document.dryRun() || config_.dry_run;
  if (!dry_run && config_.osr_id.empty()) {
    throw ConfigError("osr_id is not configured");
  }

  auto [pending, guard] = admit(document, id);
  const std::string& order_id = pending.id;

  if (dry_run) {
    OrderRecord sent = transitionTo(order_id, OrderStatus::Sent,
                                    [&](OrderRecord& r) {
                                      r.remote_reference =
                                          kDryRunReferencePrefix + order_id;
                                    });
    std::cout << "[OrderLifecycleEngine] order " << order_id
              << " Sent (dry run, ref=" << *sent.remote_reference << ")\n";
    return sent;
  }

  return transmit(order_id, document);
}

// -----------------------------------------------------------------------------
// admit(): lock the id and append the Pending record
// -----------------------------------------------------------------------------
std::pair<OrderRecord, IdLockTable::Guard> OrderLifecycleEngine::admit(
    const OrderDocument& document,
    const std::optional<std::string>& requested_id) {
  const std::int64_t now = clock_.now_ms();
  auto pendingRecord = [&](const std::string& id) {
    OrderRecord record;
    record.id = id;
    record.kind = document.kind();
    record.document = document;
    record.status = OrderStatus::Pending;
    record.created_at_ms = now;
    record.last_updated_at_ms = now;
    record.attempts = 0;
    return record;
  };

  if (requested_id) {
    if (auto reason = checkFieldValue(FieldType::Identifier, *requested_id)) {
      throw ValidationError("id", *reason);
    }
    auto guard = locks_.tryAcquire(*requested_id);
    if (!guard) {
      throw BusyError(*requested_id);
    }
    OrderRecord record = pendingRecord(*requested_id);
    history_.append(record);
    if (auto seq = OrderIdGenerator::sequence_of(id_gen_.prefix(), record.id)) {
      id_gen_.advance_past(*seq);
    }
    return {std::move(record), std::move(*guard)};
  }

  // System ids: skip anything an operator already claimed by hand.
  while (true) {
    const std::string candidate = id_gen_.next_id();
    auto guard = locks_.tryAcquire(candidate);
    if (!guard) {
      continue;
    }
    OrderRecord record = pendingRecord(candidate);
    try {
      history_.append(record);
    } catch (const DuplicateIdError&) {
      continue;
    }
    return {std::move(record), std::move(*guard)};
  }
}

// -----------------------------------------------------------------------------
// transmit(): bounded retry loop around ITransportClient::send
// -----------------------------------------------------------------------------
OrderRecord OrderLifecycleEngine::transmit(const std::string& id,
                                           const OrderDocument& document) {
  const int max_attempts = config_.max_send_attempts;

  for (int attempt = 1;; ++attempt) {
    touch(id, [attempt](OrderRecord& r) { r.attempts = attempt; });

    RemoteReference reference;
    try {
      reference = transport_.send(document, call_timeout_);
    } catch (const TransportError& e) {
      if (!e.isTransient()) {
        const std::string reason = std::string("rejected by OSR: ") + e.what();
        std::cerr << "[OrderLifecycleEngine] order " << id << " Failed: "
                  << reason << "\n";
        return transitionTo(id, OrderStatus::Failed,
                            [&](OrderRecord& r) { r.last_error = reason; });
      }
      if (attempt >= max_attempts) {
        const std::string reason = "gave up after " +
                                   std::to_string(attempt) +
                                   " attempts: " + e.what();
        std::cerr << "[OrderLifecycleEngine] order " << id << " Failed: "
                  << reason << "\n";
        return transitionTo(id, OrderStatus::Failed,
                            [&](OrderRecord& r) { r.last_error = reason; });
      }

      const std::string reason = e.what();
      touch(id, [&](OrderRecord& r) { r.last_error = reason; });
      const std::int64_t backoff = backoffFor(attempt);
      std::cout << "[OrderLifecycleEngine] order " << id << " attempt "
                << attempt << "/" << max_attempts << " failed (" << reason
                << "), retrying in " << backoff << " ms\n";
      clock_.sleep_ms(backoff);
      continue;
    }

    try {
      OrderRecord sent = transitionTo(id, OrderStatus::Sent,
                                      [&](OrderRecord& r) {
                                        r.remote_reference = reference;
                                        r.last_error.reset();
                                      });
      std::cout << "[OrderLifecycleEngine] order " << id << " Sent (ref="
                << reference << ", attempts=" << attempt << ")\n";
      return sent;
    } catch (const StorageError& e) {
      std::cerr << "[OrderLifecycleEngine] ERROR: order " << id
                << " was accepted by the OSR as " << reference
                << " but could not be recorded as Sent: " << e.what() << "\n";
      throw;
    }
  }
}

// -----------------------------------------------------------------------------
// cancel()
// -----------------------------------------------------------------------------
CancelOutcome OrderLifecycleEngine::cancel(const std::string& id) {
  auto guard = locks_.acquire(id);
  OrderRecord current = requireRecord(id);

  if (current.status != OrderStatus::Sent || !current.remote_reference) {
    throw InvalidTransitionError(
        id, std::string("only Sent orders can be cancelled (status is ") +
                domain::toString(current.status) + ")");
  }
  const RemoteReference reference = *current.remote_reference;

  CancelOutcome outcome;
  if (isSyntheticReference(reference)) {
    outcome.record = transitionTo(id, OrderStatus::Cancelled,
                                  [](OrderRecord& r) { r.last_error.reset(); });
    outcome.result = CancelOutcome::Result::Cancelled;
    outcome.reason = "dry run: cancelled locally";
    std::cout << "[OrderLifecycleEngine] order " << id
              << " Cancelled (dry run)\n";
    return outcome;
  }

  try {
    transport_.cancel(reference, call_timeout_);
  } catch (const TransportError& e) {
    const bool transient = e.isTransient();
    outcome.result = transient ? CancelOutcome::Result::RetryLater
                               : CancelOutcome::Result::NotCancellable;
    outcome.reason = (transient ? std::string("cancel not confirmed: ")
                                : std::string("OSR refused cancel: ")) +
                     e.what();
    outcome.record =
        touch(id, [&](OrderRecord& r) { r.last_error = outcome.reason; });
    std::cerr << "[OrderLifecycleEngine] order " << id << " cancel "
              << toString(outcome.result) << ": " << outcome.reason << "\n";
    return outcome;
  }

  outcome.record = transitionTo(id, OrderStatus::Cancelled,
                                [](OrderRecord& r) { r.last_error.reset(); });
  outcome.result = CancelOutcome::Result::Cancelled;
  std::cout << "[OrderLifecycleEngine] order " << id << " Cancelled (ref="
            << reference << ")\n";
  return outcome;
}

// -----------------------------------------------------------------------------
// refreshStatus()
// -----------------------------------------------------------------------------
OrderRecord OrderLifecycleEngine::refreshStatus(const std::string& id) {
  auto guard = locks_.acquire(id);
  OrderRecord current = requireRecord(id);

  if ((current.status != OrderStatus::Sent &&
       current.status != OrderStatus::Unknown) ||
      !current.remote_reference) {
    throw InvalidTransitionError(
        id, std::string("status can only be refreshed for Sent or Unknown "
                        "orders (status is ") +
                domain::toString(current.status) + ")");
  }
  const RemoteReference reference = *current.remote_reference;
  if (isSyntheticReference(reference)) {
    return current;
  }

  RemoteStatus remote = RemoteStatus::Accepted;
  try {
    remote = transport_.queryStatus(reference, call_timeout_);
  } catch (const TransportError& e) {
    const std::string reason = std::string("status check failed: ") + e.what();
    if (current.status == OrderStatus::Unknown && current.last_error == reason) {
      return current;
    }
    std::cerr << "[OrderLifecycleEngine] order " << id << " Unknown: "
              << reason << "\n";
    return transitionTo(id, OrderStatus::Unknown,
                        [&](OrderRecord& r) { r.last_error = reason; });
  }

  OrderStatus next = OrderStatus::Sent;
  std::optional<std::string> error;
  switch (remote) {
    case RemoteStatus::Accepted:
    case RemoteStatus::Processing:
      next = OrderStatus::Sent;
      break;
    case RemoteStatus::Completed:
      next = OrderStatus::Completed;
      break;
    case RemoteStatus::Cancelled:
      next = OrderStatus::Cancelled;
      break;
    case RemoteStatus::Rejected:
      next = OrderStatus::Failed;
      error = "rejected by OSR";
      break;
  }

  if (next == current.status && error == current.last_error) {
    return current;
  }
  OrderRecord updated = transitionTo(
      id, next, [&](OrderRecord& r) { r.last_error = error; });
  std::cout << "[OrderLifecycleEngine] order " << id << " "
            << domain::toString(current.status) << " -> "
            << domain::toString(next) << " (remote " << toString(remote)
            << ")\n";
  return updated;
}

// -----------------------------------------------------------------------------
// resubmit(): new id, same finalized document
// -----------------------------------------------------------------------------
OrderRecord OrderLifecycleEngine::resubmit(const std::string& source_id,
                                           std::optional<std::string> new_id) {
  OrderRecord source = requireRecord(source_id);
  std::cout << "[OrderLifecycleEngine] resubmitting " << source_id << " ("
            << domain::toString(source.status) << ")\n";
  return submit(source.document, std::move(new_id));
}

// -----------------------------------------------------------------------------
// recoverInterrupted(): Pending at startup means the process died mid-send
// -----------------------------------------------------------------------------
std::size_t OrderLifecycleEngine::recoverInterrupted() {
  HistoryFilter pending;
  pending.statuses = {OrderStatus::Pending};

  std::size_t recovered = 0;
  for (const OrderRecord& record : history_.list(pending)) {
    auto guard = locks_.tryAcquire(record.id);
    if (!guard) {
      continue;
    }
    auto fresh = history_.get(record.id);
    if (!fresh || fresh->status != OrderStatus::Pending) {
      continue;
    }
    transitionTo(record.id, OrderStatus::Failed, [](OrderRecord& r) {
      r.last_error = kInterruptedSubmissionReason;
    });
    std::cerr << "[OrderLifecycleEngine] order " << record.id
              << " was interrupted mid-submission; marked Failed\n";
    ++recovered;
  }
  return recovered;
}

std::int64_t OrderLifecycleEngine::backoffFor(int attempt) const {
  std::int64_t backoff = config_.initial_backoff_ms;
  for (int i = 1; i < attempt && backoff < config_.max_backoff_ms; ++i) {
    if (backoff > config_.max_backoff_ms / 2) {
      return config_.max_backoff_ms;
    }
    backoff *= 2;
  }
  return std::min(backoff, config_.max_backoff_ms);
}

// -----------------------------------------------------------------------------
// Store helpers
// -----------------------------------------------------------------------------
OrderRecord OrderLifecycleEngine::transitionTo(const std::string& id,
                                               OrderStatus next,
                                               const RecordMutator& extra) {
  const std::int64_t now = clock_.now_ms();
  return history_.update(id, [&](OrderRecord& r) {
    if (r.status != next && !OrderStateMachine::isLegal(r.status, next)) {
      throw InvalidTransitionError(
          id, std::string("cannot move from ") + domain::toString(r.status) +
                  " to " + domain::toString(next));
    }
    r.status = next;
    r.last_updated_at_ms = now;
    if (extra) {
      extra(r);
    }
  });
}

OrderRecord OrderLifecycleEngine::touch(const std::string& id,
                                        const RecordMutator& change) {
  const std::int64_t now = clock_.now_ms();
  return history_.update(id, [&](OrderRecord& r) {
    change(r);
    r.last_updated_at_ms = now;
  });
}

OrderRecord OrderLifecycleEngine::requireRecord(const std::string& id) const {
  auto record = history_.get(id);
  if (!record) {
    throw NotFoundError(id);
  }
  return *record;
}

}  // namespace osr
