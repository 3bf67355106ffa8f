#include "barsim/backtest/simulation_loop.hpp"
#include "barsim/domain/close_data.hpp"
#include "barsim/execution/order_matcher.hpp"

#include <utility>

namespace barsim {

SimulationLoop::SimulationLoop(const domain::BacktestParams& params,
                               IStrategy& strategy)
    : params_(params), strategy_(strategy) {}

// -----------------------------------------------------------------------------
// run: fresh state, then one step per bar
// -----------------------------------------------------------------------------
Ledger SimulationLoop::run(const std::vector<domain::Bar>& bars) {
  state_ = RunState{};
  state_.balance = params_.balance_init;

  strategy_.init();

  std::vector<LedgerRow> rows;
  rows.reserve(bars.size());
  for (const auto& bar : bars) {
    rows.push_back(step(bar));
  }

  LedgerInfo info;
  info.name = params_.name;
  info.maker_fee_rate = domain::FeeRate::known(params_.maker_fee);
  info.taker_fee_rate = domain::FeeRate::known(params_.taker_fee);
  info.logarithmic = params_.logarithmic;
  info.balance_init = params_.balance_init;
  return Ledger(std::move(info), std::move(rows));
}

// -----------------------------------------------------------------------------
// step: resolve → snapshot → strategy → record
// -----------------------------------------------------------------------------
LedgerRow SimulationLoop::step(const domain::Bar& bar) {
  LedgerRow row;
  row.key = bar.key;
  row.close = bar.close;

  // Carried orders only exist once a previous close exists.
  if (state_.last_close) {
    const double last_close = *state_.last_close;
    for (const auto& order : state_.open_orders) {
      if (domain::orderSize(order) == 0.0) {
        continue;
      }
      domain::FinishedOrder finished = OrderMatcher::process(
          order, last_close, bar.high, bar.low, params_.maker_fee,
          params_.taker_fee, bar.key);
      state_.balance -= finished.balance_decrement;
      if (finished.filled()) {
        state_.position += domain::orderSize(order);
      }
      row.finished_orders.push_back(std::move(finished));
    }
  }

  const double position_quote = state_.position * bar.open;
  const double equity = state_.balance + position_quote;

  domain::CloseData snapshot;
  snapshot.index = bar.key;
  snapshot.open = bar.open;
  snapshot.high = bar.high;
  snapshot.low = bar.low;
  snapshot.close = bar.close;
  snapshot.position = state_.position;
  snapshot.position_quote = position_quote;
  snapshot.balance_quote = state_.balance;
  snapshot.equity_quote = equity;

  // Replaced wholesale: unfilled orders from this bar are gone.
  state_.open_orders = strategy_.produceOrders(snapshot, bar);
  state_.last_close = bar.close;

  row.position = state_.position;
  row.position_quote = position_quote;
  row.balance_quote = state_.balance;
  row.equity_quote = equity;
  return row;
}

}  // namespace barsim
