#include "osr/lifecycle/order_state_machine.hpp"

namespace osr {

bool OrderStateMachine::isLegal(domain::OrderStatus current,
                                domain::OrderStatus next) {
  using S = domain::OrderStatus;

  switch (current) {
    case S::Pending:
      return next == S::Sent ||
             next == S::Failed;

    case S::Sent:
      return next == S::Cancelled ||
             next == S::Completed ||
             next == S::Failed ||
             next == S::Unknown;

    case S::Unknown:
      return next == S::Sent ||
             next == S::Completed ||
             next == S::Failed ||
             next == S::Cancelled;

    case S::Failed:
    case S::Cancelled:
    case S::Completed:
      return false;
  }

  return false;
}

}  // namespace osr
