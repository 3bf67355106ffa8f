#pragma once

#include "barsim/domain/finished_order.hpp"
#include "barsim/domain/order_request.hpp"

#include <cstdint>

namespace barsim {

// -----------------------------------------------------------------------------
// OrderMatcher — deterministic bar-level fill decision
// -----------------------------------------------------------------------------
//
// @brief  Decides how one pending order resolves against one bar and what it
//         costs. Stateless; every member is static.
//
// @details
// The reference price is the PREVIOUS bar's close (last_close): the order
// was placed at that close, so anything priced through it is marketable
// immediately and fills as taker at last_close. Otherwise the order rests
// and fills as maker at its own price if the bar's range reaches it.
//
// Market orders are first turned into synthetic limit orders priced far
// through the spread (buy: last_close * 2, sell: last_close / 2, never
// post-only), so they always take.
//
// Buy (size > 0):
//   price >= last_close  → taker at last_close, or CancelledPostOnly
//     fee               = size * last_close * taker_fee
//     balance_decrement = size * last_close * (1 + taker_fee)
//   price >= low         → maker at price
//     fee               = size * price * maker_fee
//     balance_decrement = size * price * (1 + maker_fee)
//   otherwise            → CancelledNotFilled
//
// Sell (size < 0) mirrors this with high and reversed comparisons, and
// (1 - fee_rate) in the decrement.
//
// Error handling:
//   A zero-size order, or an order handed to the handler for the other side,
//   is a logic fault in the caller and throws InvalidOrderError naming the
//   order and the bar key. The simulation loop filters zero-size orders
//   before calling process().
//
// Thread model:
//   Pure functions with no shared state; safe from any number of shard
//   threads concurrently.
// -----------------------------------------------------------------------------
class OrderMatcher {
 public:
  OrderMatcher() = delete;

  // -------------------------------------------------------------------------
  // process()
  // -------------------------------------------------------------------------
  // @brief  Routes the order to processBuy() or processSell() by the sign of
  //         its size.
  //
  // @throws InvalidOrderError if size == 0.
  // -------------------------------------------------------------------------
  static domain::FinishedOrder process(const domain::OrderRequest& order,
                                       double last_close,
                                       double bar_high,
                                       double bar_low,
                                       double maker_fee,
                                       double taker_fee,
                                       std::int64_t time_index);

  // @throws InvalidOrderError if size <= 0.
  static domain::FinishedOrder processBuy(const domain::OrderRequest& order,
                                          double last_close,
                                          double bar_low,
                                          double maker_fee,
                                          double taker_fee,
                                          std::int64_t time_index);

  // @throws InvalidOrderError if size >= 0.
  static domain::FinishedOrder processSell(const domain::OrderRequest& order,
                                           double last_close,
                                           double bar_high,
                                           double maker_fee,
                                           double taker_fee,
                                           std::int64_t time_index);

  // Limit orders pass through unchanged; market orders become the synthetic
  // limit described above. A zero-size market order is priced at last_close.
  static domain::LimitOrder toLimitOrder(const domain::OrderRequest& order,
                                         double last_close);
};

}  // namespace barsim
