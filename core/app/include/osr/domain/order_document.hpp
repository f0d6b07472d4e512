#pragma once

#include "osr/domain/order_kind.hpp"

#include <string>
#include <utility>
#include <vector>

namespace osr {
namespace domain {

// -----------------------------------------------------------------------------
// DocumentElement
// -----------------------------------------------------------------------------
// Responsibility: One node of the order document tree. Attributes and
// children are kept in insertion order because the OSR protocol treats both
// orders as significant.
// -----------------------------------------------------------------------------
struct DocumentElement {
  std::string name;
  std::vector<std::pair<std::string, std::string>> attributes;
  std::vector<DocumentElement> children;

  // Value of attribute `key`, or nullptr when absent.
  const std::string* attribute(const std::string& key) const;

  // Replaces the value of an existing attribute in place, otherwise appends.
  void setAttribute(const std::string& key, std::string value);

  // Appends a child and returns a reference to it. The reference is
  // invalidated by the next addChild() on the same element.
  DocumentElement& addChild(std::string child_name);

  bool operator==(const DocumentElement& other) const;
  bool operator!=(const DocumentElement& other) const { return !(*this == other); }
};

enum class DocumentState {
  Draft,
  Finalized,
};

// -----------------------------------------------------------------------------
// OrderDocument — validated, wire-ready order
// -----------------------------------------------------------------------------
//
// @brief  Canonical tree produced by DocumentBuilder and submitted by the
//         lifecycle engine.
//
// @details
// A document is born Draft. While Draft, mutableRoot() allows edits (an
// operator correcting a pre-filled template). finalize() freezes it; from
// then on mutableRoot() throws DocumentStateError and the document is the
// immutable snapshot stored in the history and sent to the OSR.
//
// The root element is always <host2osr> with exactly one order element as
// its first child. orderNumber() reads that element's "order_number"
// attribute.
//
// Rendering:
//   toXml() produces the compact wire form:
//     <host2osr><pick_order order_number="src-pick-1" ...>...</pick_order></host2osr>
//   Attribute values are escaped; elements without children self-close.
//
// Thread model:
//   Plain value type. Copies are independent; a Finalized document may be
//   shared read-only between threads.
// -----------------------------------------------------------------------------
class OrderDocument {
 public:
  // Empty Draft document; only meaningful as a placeholder (default-
  // constructed OrderRecord, JSON decoding target).
  OrderDocument() = default;

  OrderDocument(OrderKind kind, DocumentElement root, bool dry_run);

  OrderKind kind() const { return kind_; }
  bool dryRun() const { return dry_run_; }
  DocumentState state() const { return state_; }
  bool isFinalized() const { return state_ == DocumentState::Finalized; }

  const DocumentElement& root() const { return root_; }

  // @throws DocumentStateError when the document is Finalized.
  DocumentElement& mutableRoot();

  // Freezes the document. Idempotent.
  void finalize() { state_ = DocumentState::Finalized; }

  // "order_number" attribute of the order element, empty if the tree has no
  // order element yet.
  std::string orderNumber() const;

  std::string toXml() const;

  bool operator==(const OrderDocument& other) const;
  bool operator!=(const OrderDocument& other) const { return !(*this == other); }

 private:
  OrderKind kind_{OrderKind::Standard};
  DocumentElement root_;
  bool dry_run_{false};
  DocumentState state_{DocumentState::Draft};
};

}  // namespace domain
}  // namespace osr
