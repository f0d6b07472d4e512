#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace osr {

// -----------------------------------------------------------------------------
// ErrorCategory
// -----------------------------------------------------------------------------
// @brief  Stable classification of every failure the order desk can raise.
//
// @details
// The CLI maps a category to an exit code and the command endpoint reports
// it as the "category" field of an error reply. Callers that need to branch
// on the kind of failure should switch on category() instead of relying on
// dynamic_cast chains.
// -----------------------------------------------------------------------------
enum class ErrorCategory {
  Validation,
  Transport,
  Busy,
  NotFound,
  DuplicateId,
  InvalidTransition,
  Storage,
  Config,
  DocumentState,
};

inline const char* toString(ErrorCategory category) {
  switch (category) {
    case ErrorCategory::Validation:        return "Validation";
    case ErrorCategory::Transport:         return "Transport";
    case ErrorCategory::Busy:              return "Busy";
    case ErrorCategory::NotFound:          return "NotFound";
    case ErrorCategory::DuplicateId:       return "DuplicateId";
    case ErrorCategory::InvalidTransition: return "InvalidTransition";
    case ErrorCategory::Storage:           return "Storage";
    case ErrorCategory::Config:            return "Config";
    case ErrorCategory::DocumentState:     return "DocumentState";
  }
  return "Unknown";
}

// -----------------------------------------------------------------------------
// OrderError — root of the exception hierarchy
// -----------------------------------------------------------------------------
//
// @brief  Base class for every error raised by the builder, transport,
//         history store and lifecycle engine.
//
// @details
// Derives from std::runtime_error so what() carries the human-readable
// message. Catching `const OrderError&` at the outer surface (CLI, command
// endpoint) is enough to report any domain failure; anything else reaching
// that layer is a programming error.
//
// Thread model:
//   Immutable after construction. Safe to copy across threads (e.g. through
//   std::promise::set_exception).
// -----------------------------------------------------------------------------
class OrderError : public std::runtime_error {
 public:
  explicit OrderError(const std::string& message)
      : std::runtime_error(message) {}

  virtual ErrorCategory category() const = 0;
};

// -----------------------------------------------------------------------------
// ValidationError
// -----------------------------------------------------------------------------
// Raised by DocumentBuilder for the first invalid field in schema order, and
// by the engine when handed a Draft document. Never reaches the transport and
// never mutates history.
// -----------------------------------------------------------------------------
class ValidationError : public OrderError {
 public:
  ValidationError(std::string field, std::string reason)
      : OrderError(field + ": " + reason),
        field_(std::move(field)),
        reason_(std::move(reason)) {}

  ErrorCategory category() const override { return ErrorCategory::Validation; }

  const std::string& field() const { return field_; }
  const std::string& reason() const { return reason_; }

 private:
  std::string field_;
  std::string reason_;
};

// Whether a transport failure is worth retrying.
enum class TransportErrorKind {
  Transient,  // remote unreachable, busy, or timed out
  Permanent,  // remote rejected the request; retrying cannot help
};

// -----------------------------------------------------------------------------
// TransportError
// -----------------------------------------------------------------------------
// Raised by ITransportClient implementations. The client never retries on
// its own; the lifecycle engine decides what to do with kind().
// -----------------------------------------------------------------------------
class TransportError : public OrderError {
 public:
  TransportError(TransportErrorKind kind, const std::string& message)
      : OrderError(message), kind_(kind) {}

  ErrorCategory category() const override { return ErrorCategory::Transport; }

  TransportErrorKind kind() const { return kind_; }
  bool isTransient() const { return kind_ == TransportErrorKind::Transient; }

 private:
  TransportErrorKind kind_;
};

// Another operation holds the per-id lock.
class BusyError : public OrderError {
 public:
  explicit BusyError(const std::string& id)
      : OrderError("order " + id + " is busy with another operation"),
        id_(id) {}

  ErrorCategory category() const override { return ErrorCategory::Busy; }
  const std::string& id() const { return id_; }

 private:
  std::string id_;
};

class NotFoundError : public OrderError {
 public:
  explicit NotFoundError(const std::string& id)
      : OrderError("order " + id + " not found"), id_(id) {}

  ErrorCategory category() const override { return ErrorCategory::NotFound; }
  const std::string& id() const { return id_; }

 private:
  std::string id_;
};

// The id exists in the history, or existed and was purged.
class DuplicateIdError : public OrderError {
 public:
  explicit DuplicateIdError(const std::string& id)
      : OrderError("order id " + id + " is already in use"), id_(id) {}

  ErrorCategory category() const override { return ErrorCategory::DuplicateId; }
  const std::string& id() const { return id_; }

 private:
  std::string id_;
};

class InvalidTransitionError : public OrderError {
 public:
  InvalidTransitionError(const std::string& id, const std::string& message)
      : OrderError("order " + id + ": " + message), id_(id) {}

  ErrorCategory category() const override {
    return ErrorCategory::InvalidTransition;
  }
  const std::string& id() const { return id_; }

 private:
  std::string id_;
};

// -----------------------------------------------------------------------------
// StorageError
// -----------------------------------------------------------------------------
// Durable read or write of the history failed. Fatal to the operation that
// raised it; the store guarantees that neither the file nor its in-memory
// index changed.
// -----------------------------------------------------------------------------
class StorageError : public OrderError {
 public:
  explicit StorageError(const std::string& message) : OrderError(message) {}

  ErrorCategory category() const override { return ErrorCategory::Storage; }
};

class ConfigError : public OrderError {
 public:
  explicit ConfigError(const std::string& message) : OrderError(message) {}

  ErrorCategory category() const override { return ErrorCategory::Config; }
};

// Attempt to edit a document after finalize().
class DocumentStateError : public OrderError {
 public:
  explicit DocumentStateError(const std::string& message)
      : OrderError(message) {}

  ErrorCategory category() const override {
    return ErrorCategory::DocumentState;
  }
};

}  // namespace osr
