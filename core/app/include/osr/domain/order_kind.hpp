#pragma once

#include <optional>
#include <string>

namespace osr {
namespace domain {

// -----------------------------------------------------------------------------
// OrderKind
// -----------------------------------------------------------------------------
// Responsibility: The closed set of order types the OSR accepts from the host.
// Each kind has exactly one schema (see document/order_schema.hpp) and one
// element layout on the wire.
//
//   Standard  → pick order against a known container ("processing_mode=standard")
//   Manual    → pick order without a container ("processing_mode=manual")
//   Inventory → stock count of one product in one container
//   GoodsIn   → goods receipt into a compartment
//   GoodsAdd  → goods receipt renewal ("processing_mode=renewal")
// -----------------------------------------------------------------------------
enum class OrderKind {
  Standard,
  Manual,
  Inventory,
  GoodsIn,
  GoodsAdd,
};

// Enum name as persisted in the history log ("Standard", "GoodsIn", ...).
const char* toString(OrderKind kind);

// Inverse of toString(). Case-sensitive; returns std::nullopt for anything
// outside the closed set.
std::optional<OrderKind> parseOrderKind(const std::string& name);

}  // namespace domain
}  // namespace osr
