#include "osr/domain/order_status.hpp"

namespace osr {
namespace domain {

// -----------------------------------------------------------------------------
// OrderStatus names
// -----------------------------------------------------------------------------
const char* toString(OrderStatus status) {
  using S = OrderStatus;
  switch (status) {
    case S::Pending:   return "Pending";
    case S::Sent:      return "Sent";
    case S::Failed:    return "Failed";
    case S::Cancelled: return "Cancelled";
    case S::Unknown:   return "Unknown";
    case S::Completed: return "Completed";
  }
  return "Unknown";
}

std::optional<OrderStatus> parseOrderStatus(const std::string& name) {
  using S = OrderStatus;
  if (name == "Pending")   return S::Pending;
  if (name == "Sent")      return S::Sent;
  if (name == "Failed")    return S::Failed;
  if (name == "Cancelled") return S::Cancelled;
  if (name == "Unknown")   return S::Unknown;
  if (name == "Completed") return S::Completed;
  return std::nullopt;
}

bool isTerminal(OrderStatus status) {
  return status == OrderStatus::Failed ||
         status == OrderStatus::Cancelled ||
         status == OrderStatus::Completed;
}

}  // namespace domain
}  // namespace osr
