#pragma once

#include "osr/domain/order_kind.hpp"

#include <optional>
#include <string>
#include <vector>

namespace osr {

// Value format of one input field.
enum class FieldType {
  Quantity,    // 1..999999, digits only
  Identifier,  // [A-Za-z0-9][A-Za-z0-9._-]{0,31}
  Location,    // non-empty after trimming, <= 64 chars, no whitespace/control
  Text,        // <= 128 chars, no control characters
  Token,       // [A-Za-z0-9_-]{1,32}
};

const char* toString(FieldType type);

// -----------------------------------------------------------------------------
// FieldSpec
// -----------------------------------------------------------------------------
// One declared input field. `per_line` fields repeat on every pick line as
// "<name>#<n>" for n >= 2. An optional field that is absent takes
// `default_value`, or the value of `default_from` on the same line
// (item_name falls back to item).
// -----------------------------------------------------------------------------
struct FieldSpec {
  std::string name;
  FieldType type{FieldType::Text};
  bool required{true};
  bool per_line{false};
  bool catalog_checked{false};
  std::string default_value;
  std::string default_from;
};

// -----------------------------------------------------------------------------
// OrderSchema
// -----------------------------------------------------------------------------
// The fixed input contract of one OrderKind. `fields` is in declaration
// order, which is also the validation order. `order_tag` is the middle part
// of the generated order number ("<prefix>-<order_tag>-<n>").
// -----------------------------------------------------------------------------
struct OrderSchema {
  domain::OrderKind kind{domain::OrderKind::Standard};
  std::string order_tag;
  bool multi_line{false};
  std::vector<FieldSpec> fields;

  // Declared field named `name`, or nullptr.
  const FieldSpec* find(const std::string& name) const;
};

// Schema of `kind`. The returned reference is valid for the program's
// lifetime.
const OrderSchema& schemaFor(domain::OrderKind kind);

// Locations are trimmed; every other type is taken verbatim.
std::string normaliseFieldValue(FieldType type, const std::string& raw);

// Checks a normalised `value` against the format of `type`. Returns the failure reason,
// or std::nullopt if the value is acceptable.
std::optional<std::string> checkFieldValue(FieldType type,
                                           const std::string& value);

}  // namespace osr
