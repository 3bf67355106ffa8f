#pragma once

#include "barsim/backtest/ledger.hpp"
#include "barsim/domain/backtest_params.hpp"
#include "barsim/domain/bar.hpp"
#include "barsim/domain/order_request.hpp"
#include "barsim/strategy/i_strategy.hpp"

#include <optional>
#include <vector>

namespace barsim {

// -----------------------------------------------------------------------------
// SimulationLoop — single-shard bar-by-bar driver
// -----------------------------------------------------------------------------
//
// @brief  Replays one strategy over one contiguous bar sequence and returns
//         the resulting Ledger.
//
// @details
// Per bar, in order:
//
//   1. Resolve: every carried order with non-zero size goes through
//      OrderMatcher against the previous close and this bar's high/low.
//      balance -= balance_decrement; a filled order moves position by
//      exactly its size. Zero-size orders are skipped silently.
//   2. Snapshot: position_quote = position * open,
//      equity = balance + position_quote.
//   3. Strategy: produceOrders(snapshot, bar) becomes the complete carried
//      order set for the next bar. Nothing survives from the previous set.
//   4. Record the ledger row; last_close = bar.close.
//
// The first bar has no previous close and no carried orders, so it only
// records the initial state and collects the strategy's first orders.
// Orders returned for the last bar are dropped when the loop ends.
//
// Thread model:
//   Strictly sequential. One instance per shard; the Partitioner gives each
//   shard its own loop and its own strategy instance. run() is not
//   reentrant.
//
// Ownership:
//   Holds a reference to the strategy, which must outlive run(). Params
//   are copied.
// -----------------------------------------------------------------------------
class SimulationLoop {
 public:
  SimulationLoop(const domain::BacktestParams& params, IStrategy& strategy);

  SimulationLoop(const SimulationLoop&) = delete;
  SimulationLoop& operator=(const SimulationLoop&) = delete;
  SimulationLoop(SimulationLoop&&) = delete;
  SimulationLoop& operator=(SimulationLoop&&) = delete;

  // -------------------------------------------------------------------------
  // run(bars)
  // -------------------------------------------------------------------------
  // @brief  Resets the run state, calls strategy.init() and replays every
  //         bar.
  //
  // @param  bars  Validated bars with strictly increasing keys. May be
  //               empty, which yields an empty ledger.
  //
  // @return One LedgerRow per bar, with fee rates and mode from params.
  //
  // @throws InvalidOrderError from OrderMatcher, or anything the strategy
  //         throws. No partial ledger is returned.
  // -------------------------------------------------------------------------
  Ledger run(const std::vector<domain::Bar>& bars);

 private:
  // Mutable account state of one run. Created with balance_init at the
  // start of run() and discarded when it returns.
  struct RunState {
    double position{0.0};
    double balance{0.0};
    std::vector<domain::OrderRequest> open_orders;
    std::optional<double> last_close;
  };

  LedgerRow step(const domain::Bar& bar);

  const domain::BacktestParams params_;
  IStrategy& strategy_;
  RunState state_;
};

}  // namespace barsim
