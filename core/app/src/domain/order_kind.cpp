#include "osr/domain/order_kind.hpp"

namespace osr {
namespace domain {

const char* toString(OrderKind kind) {
  switch (kind) {
    case OrderKind::Standard:  return "Standard";
    case OrderKind::Manual:    return "Manual";
    case OrderKind::Inventory: return "Inventory";
    case OrderKind::GoodsIn:   return "GoodsIn";
    case OrderKind::GoodsAdd:  return "GoodsAdd";
  }
  return "Unknown";
}

std::optional<OrderKind> parseOrderKind(const std::string& name) {
  if (name == "Standard")  return OrderKind::Standard;
  if (name == "Manual")    return OrderKind::Manual;
  if (name == "Inventory") return OrderKind::Inventory;
  if (name == "GoodsIn")   return OrderKind::GoodsIn;
  if (name == "GoodsAdd")  return OrderKind::GoodsAdd;
  return std::nullopt;
}

}  // namespace domain
}  // namespace osr
