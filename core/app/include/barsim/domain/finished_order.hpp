#pragma once

#include "barsim/domain/order_request.hpp"

#include <cstdint>
#include <optional>

namespace barsim {
namespace domain {

// -----------------------------------------------------------------------------
// FinishedOrderState — terminal outcome of one resolution attempt
// -----------------------------------------------------------------------------
//
// @details
// Every order is resolved exactly once, on the bar following the one that
// produced it, and lands in exactly one of these states:
//
//   FilledTaker         marketable at the reference price (previous close)
//   FilledMaker         rested and was reached by the bar's low (buy) or
//                       high (sell)
//   CancelledNotFilled  never reached within the bar
//   CancelledPostOnly   would have executed as taker but was post-only
//
// There is no partial fill and no multi-bar queuing.
// -----------------------------------------------------------------------------
enum class FinishedOrderState {
  FilledTaker,
  FilledMaker,
  CancelledNotFilled,
  CancelledPostOnly,
};

const char* toString(FinishedOrderState state);

// -----------------------------------------------------------------------------
// FinishedOrder
// -----------------------------------------------------------------------------
//
// @brief  Immutable record of how one order was resolved and what it did to
//         the balance.
//
// @details
// balance_decrement is always SUBTRACTED from the balance. A buy produces a
// positive decrement (quote currency leaves the account); a sell produces a
// negative one (quote currency comes in).
//
// fee carries the sign of size, so sell fills report a negative fee. This is
// the observed arithmetic of size * price * rate and is kept as-is; callers
// that want a magnitude should take std::abs(fee).
//
// executed_price is present only for filled orders. quote_size is
// size * executed_price for fills and 0 for cancellations.
//
// Thread model:
//   Plain value type. Produced on a shard's worker thread, read by the
//   merger on the caller thread after the shard has finished.
// -----------------------------------------------------------------------------
struct FinishedOrder {
  std::int64_t time_index{0};            // Key of the bar that resolved it
  OrderRequest order{MarketOrder{}};     // The order as the strategy sent it
  double balance_decrement{0.0};
  double fee{0.0};
  std::optional<double> executed_price;  // Set iff filled()
  double quote_size{0.0};
  FinishedOrderState state{FinishedOrderState::CancelledNotFilled};

  bool filled() const {
    return state == FinishedOrderState::FilledTaker ||
           state == FinishedOrderState::FilledMaker;
  }

  // Copy with order size, balance_decrement, quote_size and fee multiplied
  // by factor. Throws std::invalid_argument for a negative factor.
  FinishedOrder scaled(double factor) const;
};

}  // namespace domain
}  // namespace barsim
