#include "barsim/execution/order_matcher.hpp"
#include "barsim/domain/errors.hpp"

#include <sstream>
#include <variant>

namespace barsim {

namespace {

using domain::FinishedOrder;
using domain::FinishedOrderState;

// Zero-effect outcome shared by both cancellation states.
FinishedOrder cancelled(const domain::OrderRequest& order,
                        FinishedOrderState state,
                        std::int64_t time_index) {
  FinishedOrder out;
  out.time_index = time_index;
  out.order = order;
  out.balance_decrement = 0.0;
  out.fee = 0.0;
  out.executed_price = std::nullopt;
  out.quote_size = 0.0;
  out.state = state;
  return out;
}

// A fill at `price`. balance_factor is (1 + rate) for buys, (1 - rate) for
// sells; fee keeps the sign of size.
FinishedOrder filled(const domain::OrderRequest& order,
                     double size,
                     double price,
                     double fee_rate,
                     double balance_factor,
                     FinishedOrderState state,
                     std::int64_t time_index) {
  FinishedOrder out;
  out.time_index = time_index;
  out.order = order;
  out.quote_size = size * price;
  out.fee = out.quote_size * fee_rate;
  out.balance_decrement = out.quote_size * balance_factor;
  out.executed_price = price;
  out.state = state;
  return out;
}

[[noreturn]] void throwInvalid(const char* reason,
                               const domain::OrderRequest& order,
                               std::int64_t time_index) {
  std::ostringstream os;
  os << reason << ": " << domain::describe(order) << " at bar " << time_index;
  throw InvalidOrderError(os.str());
}

}  // namespace

// -----------------------------------------------------------------------------
// toLimitOrder: synthetic limit price for market orders
// -----------------------------------------------------------------------------
domain::LimitOrder OrderMatcher::toLimitOrder(
    const domain::OrderRequest& order, double last_close) {
  return std::visit(
      domain::Overloaded{
          [](const domain::LimitOrder& limit) { return limit; },
          [last_close](const domain::MarketOrder& market) {
            double price = last_close;
            if (market.size > 0.0) {
              price = last_close * 2.0;
            } else if (market.size < 0.0) {
              price = last_close / 2.0;
            }
            return domain::LimitOrder{market.size, price, false};
          },
      },
      order);
}

// -----------------------------------------------------------------------------
// processBuy
// -----------------------------------------------------------------------------
FinishedOrder OrderMatcher::processBuy(const domain::OrderRequest& order,
                                       double last_close,
                                       double bar_low,
                                       double maker_fee,
                                       double taker_fee,
                                       std::int64_t time_index) {
  const domain::LimitOrder limit = toLimitOrder(order, last_close);
  if (!(limit.size > 0.0)) {
    throwInvalid("Buy order size must be positive", order, time_index);
  }

  // --- Marketable at the reference price: taker or post-only reject --------
  if (limit.price >= last_close) {
    if (limit.post_only) {
      return cancelled(order, FinishedOrderState::CancelledPostOnly,
                       time_index);
    }
    return filled(order, limit.size, last_close, taker_fee, 1.0 + taker_fee,
                  FinishedOrderState::FilledTaker, time_index);
  }

  // --- Resting: reached if the bar traded down to the limit ----------------
  if (limit.price >= bar_low) {
    return filled(order, limit.size, limit.price, maker_fee, 1.0 + maker_fee,
                  FinishedOrderState::FilledMaker, time_index);
  }

  return cancelled(order, FinishedOrderState::CancelledNotFilled, time_index);
}

// -----------------------------------------------------------------------------
// processSell
// -----------------------------------------------------------------------------
FinishedOrder OrderMatcher::processSell(const domain::OrderRequest& order,
                                        double last_close,
                                        double bar_high,
                                        double maker_fee,
                                        double taker_fee,
                                        std::int64_t time_index) {
  const domain::LimitOrder limit = toLimitOrder(order, last_close);
  if (!(limit.size < 0.0)) {
    throwInvalid("Sell order size must be negative", order, time_index);
  }

  if (limit.price <= last_close) {
    if (limit.post_only) {
      return cancelled(order, FinishedOrderState::CancelledPostOnly,
                       time_index);
    }
    return filled(order, limit.size, last_close, taker_fee, 1.0 - taker_fee,
                  FinishedOrderState::FilledTaker, time_index);
  }

  if (limit.price <= bar_high) {
    return filled(order, limit.size, limit.price, maker_fee, 1.0 - maker_fee,
                  FinishedOrderState::FilledMaker, time_index);
  }

  return cancelled(order, FinishedOrderState::CancelledNotFilled, time_index);
}

// -----------------------------------------------------------------------------
// process: dispatch by side
// -----------------------------------------------------------------------------
FinishedOrder OrderMatcher::process(const domain::OrderRequest& order,
                                    double last_close,
                                    double bar_high,
                                    double bar_low,
                                    double maker_fee,
                                    double taker_fee,
                                    std::int64_t time_index) {
  const double size = domain::orderSize(order);
  if (size > 0.0) {
    return processBuy(order, last_close, bar_low, maker_fee, taker_fee,
                      time_index);
  }
  if (size < 0.0) {
    return processSell(order, last_close, bar_high, maker_fee, taker_fee,
                       time_index);
  }
  throwInvalid("Order size must be non-zero", order, time_index);
}

}  // namespace barsim
