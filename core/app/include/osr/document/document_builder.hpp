#pragma once

#include "osr/config/engine_config.hpp"
#include "osr/document/order_schema.hpp"
#include "osr/domain/order_document.hpp"
#include "osr/domain/order_spec.hpp"

#include <string>
#include <vector>

namespace osr {

class ICatalogLookup;

// -----------------------------------------------------------------------------
// DocumentBuilder — OrderSpec → validated OrderDocument
// -----------------------------------------------------------------------------
//
// @brief  Validates operator input against the schema of its kind and lays
//         it out as the element tree the OSR expects.
//
// @details
// build() is a pure function of (spec, configuration, catalog contents):
//
//   1. Declared fields are checked in schema order. Header fields and the
//      fields of line 1 share that order; lines 2..N of a pick order follow
//      in ascending line order. The first problem throws
//      ValidationError{field, reason}:
//        - absent required field      → "required field is missing"
//        - field given twice          → "field is given more than once"
//        - bad format                 → type-specific reason
//        - item code not in catalog   → "not found in catalog"
//   2. Any input field left over is rejected in input order as
//      "unknown field for <Kind>". This includes line suffixes on
//      single-line kinds and malformed suffixes ("item#1", "item#x").
//   3. Optional fields take their defaults (item_name → item,
//      order_number → "1", container_type → "full").
//   4. The element tree is emitted in schema order regardless of the order
//      the fields were entered in.
//
// Line suffixes must be contiguous: given "qty#3" without line 2, the build
// fails on "qty#2" as a missing required field.
//
// The returned document is a Draft. The caller may adjust it through
// mutableRoot() and must finalize() it before submission.
//
// Thread model:
//   build() is const and touches no shared mutable state; concurrent calls
//   are safe provided the catalog lookup is.
//
// Ownership:
//   The catalog lookup is borrowed and may be nullptr (no reference-data
//   check). It must outlive the builder.
// -----------------------------------------------------------------------------
class DocumentBuilder {
 public:
  explicit DocumentBuilder(const EngineConfig& config,
                           const ICatalogLookup* catalog = nullptr);

  // @throws ValidationError for the first invalid field.
  domain::OrderDocument build(const domain::OrderSpec& spec) const;

 private:
  std::string order_prefix_;
  std::vector<CapacitySpec> capacity_specs_;
  const ICatalogLookup* catalog_;
};

}  // namespace osr
