#pragma once

#include "osr/domain/order_kind.hpp"

#include <string>
#include <utility>
#include <vector>

namespace osr {
namespace domain {

// Raw operator input, one (name, value) pair per field in the order it was
// entered. Line n >= 2 of a pick order uses suffixed names ("item#2").
using FieldList = std::vector<std::pair<std::string, std::string>>;

// -----------------------------------------------------------------------------
// OrderSpec — operator intent before validation
// -----------------------------------------------------------------------------
//
// @brief  Plain value type handed to DocumentBuilder::build().
//
// @details
// Nothing here is validated. The builder checks every field against the
// schema of `kind` and either returns a Draft OrderDocument or throws
// ValidationError. Callers construct the spec once and pass it by const
// reference; it is never modified downstream.
//
// dry_run is copied into the resulting document, which makes the lifecycle
// engine skip the transport for that submission.
// -----------------------------------------------------------------------------
struct OrderSpec {
  OrderKind kind{OrderKind::Standard};
  FieldList fields;
  bool dry_run{false};
};

}  // namespace domain
}  // namespace osr
