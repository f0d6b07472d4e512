#pragma once

#include "osr/concurrent/id_lock_table.hpp"
#include "osr/concurrent/order_id_generator.hpp"
#include "osr/config/engine_config.hpp"
#include "osr/domain/order_document.hpp"
#include "osr/domain/order_record.hpp"
#include "osr/history/i_history_store.hpp"
#include "osr/time/i_time_provider.hpp"
#include "osr/transport/i_transport_client.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>

namespace osr {

// -----------------------------------------------------------------------------
// CancelOutcome
// -----------------------------------------------------------------------------
// Result of OrderLifecycleEngine::cancel(). Only Cancelled changes the
// record's status; the other two leave it Sent and record `reason` as
// last_error.
// -----------------------------------------------------------------------------
struct CancelOutcome {
  enum class Result {
    Cancelled,       // OSR acknowledged (or dry run cancelled locally)
    RetryLater,      // transient failure; the order may still be live
    NotCancellable,  // OSR refused; the order is past the point of cancel
  };

  Result result{Result::Cancelled};
  domain::OrderRecord record;
  std::string reason;
};

const char* toString(CancelOutcome::Result result);

// Reason recorded on records found Pending by recoverInterrupted().
inline constexpr const char* kInterruptedSubmissionReason =
    "submission interrupted before remote confirmation; verify on the OSR "
    "before resubmitting";

// -----------------------------------------------------------------------------
// OrderLifecycleEngine — submit / cancel / refresh orchestration
// -----------------------------------------------------------------------------
//
// @brief  Drives every order from a finalized document to a definite
//         outcome, keeping the history, the OSR and the operator's view
//         consistent.
//
// @details
// Submission protocol:
//
//   1. Reject Draft documents (ValidationError "document").
//   2. Resolve the id: the caller's, or "<osr_id>-<NNNNNN>" from the
//      sequence seeded by the history. Take the per-id lock without waiting
//      (BusyError on contention) and append a Pending record with
//      attempts = 0 (DuplicateIdError if the id is live or retired; system
//      ids move on to the next sequence instead).
//   3. Dry run (document flag or config.dry_run): Pending → Sent with
//      reference "DRY-<id>". The transport is never called.
//   4. Otherwise, per attempt: persist attempts + 1, call send().
//        success          → Sent + remote_reference
//        Permanent error  → Failed, last_error = reason
//        Transient error  → persist last_error; if attempts remain, sleep
//                           the backoff (initial, doubling, capped) and go
//                           again; otherwise Failed.
//   5. StorageError at any step propagates. The engine never returns a
//      status that is not on disk. If the OSR accepted the order but the
//      Sent write failed, the reference is logged to stderr before the
//      error propagates, so an operator can reconcile by hand.
//
// Cancel and refresh wait for the per-id lock, so they queue behind an
// in-flight submission of the same id instead of failing with BusyError.
//
// Every status change is validated by OrderStateMachine inside the store's
// update mutator.
//
// Thread model:
//   All public members are safe to call concurrently. Operations on
//   different ids proceed in parallel; the only blocking points are
//   transport calls and backoff sleeps.
//
// Ownership:
//   Borrows the history, transport, lock table and clock; all must outlive
//   the engine. Owns the id generator.
// -----------------------------------------------------------------------------
class OrderLifecycleEngine {
 public:
  OrderLifecycleEngine(const EngineConfig& config, IHistoryStore& history,
                       ITransportClient& transport, IdLockTable& locks,
                       ITimeProvider& clock);

  OrderLifecycleEngine(const OrderLifecycleEngine&) = delete;
  OrderLifecycleEngine& operator=(const OrderLifecycleEngine&) = delete;
  OrderLifecycleEngine(OrderLifecycleEngine&&) = delete;
  OrderLifecycleEngine& operator=(OrderLifecycleEngine&&) = delete;

  // -------------------------------------------------------------------------
  // submit(document, id)
  // -------------------------------------------------------------------------
  // @brief  Runs the submission protocol above and returns the final record
  //         (Sent or Failed).
  //
  // @throws ValidationError   document not finalized, or malformed id
  // @throws ConfigError       real submission without an osr_id
  // @throws BusyError         id held by another operation
  // @throws DuplicateIdError  caller-supplied id live or retired
  // @throws StorageError      history write failed
  // -------------------------------------------------------------------------
  domain::OrderRecord submit(const domain::OrderDocument& document,
                             std::optional<std::string> id = std::nullopt);

  // -------------------------------------------------------------------------
  // cancel(id)
  // -------------------------------------------------------------------------
  // Only Sent records can be cancelled; anything else is an
  // InvalidTransitionError raised before the OSR is contacted.
  //
  // @throws NotFoundError, InvalidTransitionError, StorageError
  // -------------------------------------------------------------------------
  CancelOutcome cancel(const std::string& id);

  // -------------------------------------------------------------------------
  // refreshStatus(id)
  // -------------------------------------------------------------------------
  // Queries the OSR for a Sent or Unknown record and maps the answer:
  //   Accepted, Processing → Sent
  //   Completed            → Completed
  //   Cancelled            → Cancelled
  //   Rejected             → Failed ("rejected by OSR")
  //   any TransportError   → Unknown (reference kept, last_error set)
  // Writes only when status or last_error actually changes. Dry-run
  // records come back untouched.
  //
  // @throws NotFoundError, InvalidTransitionError, StorageError
  // -------------------------------------------------------------------------
  domain::OrderRecord refreshStatus(const std::string& id);

  // Submits the stored document of `source_id` again as a brand-new order.
  // The source record is not modified.
  //
  // @throws NotFoundError plus everything submit() throws.
  domain::OrderRecord resubmit(const std::string& source_id,
                               std::optional<std::string> new_id = std::nullopt);

  // Moves records left Pending by a previous process to Failed with
  // kInterruptedSubmissionReason. Records whose id is currently locked are
  // in flight in this process and are left alone. Returns the count.
  std::size_t recoverInterrupted();

  // Backoff slept after failed attempt `attempt` (1-based).
  std::int64_t backoffFor(int attempt) const;

  // Prefix of system-assigned ids.
  const std::string& idPrefix() const { return id_gen_.prefix(); }

 private:
  std::pair<domain::OrderRecord, IdLockTable::Guard> admit(
      const domain::OrderDocument& document,
      const std::optional<std::string>& requested_id);

  domain::OrderRecord transmit(const std::string& id,
                               const domain::OrderDocument& document);

  // Changes status (validated) and applies `extra` in the same write.
  domain::OrderRecord transitionTo(const std::string& id,
                                   domain::OrderStatus next,
                                   const RecordMutator& extra = {});

  // Rewrites a record without changing its status.
  domain::OrderRecord touch(const std::string& id, const RecordMutator& change);

  domain::OrderRecord requireRecord(const std::string& id) const;

  EngineConfig config_;
  IHistoryStore& history_;
  ITransportClient& transport_;
  IdLockTable& locks_;
  ITimeProvider& clock_;
  std::chrono::milliseconds call_timeout_;
  OrderIdGenerator id_gen_;
};

}  // namespace osr
