#include "barsim/domain/finished_order.hpp"

namespace barsim {
namespace domain {

const char* toString(FinishedOrderState state) {
  using S = FinishedOrderState;
  switch (state) {
    case S::FilledTaker:        return "FilledTaker";
    case S::FilledMaker:        return "FilledMaker";
    case S::CancelledNotFilled: return "CancelledNotFilled";
    case S::CancelledPostOnly:  return "CancelledPostOnly";
  }
  return "Unknown";
}

FinishedOrder FinishedOrder::scaled(double factor) const {
  // domain::scaled() rejects a negative factor before anything is copied.
  FinishedOrder out = *this;
  out.order = domain::scaled(order, factor);
  out.balance_decrement = balance_decrement * factor;
  out.quote_size = quote_size * factor;
  out.fee = fee * factor;
  return out;
}

}  // namespace domain
}  // namespace barsim
