#pragma once

#include "barsim/strategy/i_strategy.hpp"

#include <string>

namespace barsim {

// -----------------------------------------------------------------------------
// SignalLimitStrategy
// -----------------------------------------------------------------------------
//
// @brief  Quotes post-only limit orders around the close, driven by a signal
//         column of the input table.
//
// @details
// For each bar:
//   signal ==  1 → buy  `size` at close - bar[offset_column] * offset_ratio
//   signal == -1 → sell `size` at close + bar[offset_column] * offset_ratio
//   otherwise    → no orders
//
// Orders are post-only, so a quote that would cross the previous close is
// rejected (CancelledPostOnly) rather than taking liquidity. A typical
// offset column is an ATR indicator.
//
// A missing signal or offset column is a data error: Bar::field() throws
// std::out_of_range and the run aborts.
// -----------------------------------------------------------------------------
class SignalLimitStrategy final : public IStrategy {
 public:
  struct Params {
    double size{1.0};
    std::string signal_column{"signal"};
    std::string offset_column{"atr"};
    double offset_ratio{0.5};
  };

  explicit SignalLimitStrategy(Params params);

  std::vector<domain::OrderRequest> produceOrders(
      const domain::CloseData& close_data, const domain::Bar& bar) override;

 private:
  const Params params_;
};

}  // namespace barsim
