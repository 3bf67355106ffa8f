#include "barsim/strategy/signal_limit_strategy.hpp"

#include <utility>

namespace barsim {

SignalLimitStrategy::SignalLimitStrategy(Params params)
    : params_(std::move(params)) {}

std::vector<domain::OrderRequest> SignalLimitStrategy::produceOrders(
    const domain::CloseData& close_data, const domain::Bar& bar) {
  const double signal = bar.field(params_.signal_column);
  if (signal != 1.0 && signal != -1.0) {
    return {};
  }

  const double offset = bar.field(params_.offset_column) * params_.offset_ratio;

  if (signal == 1.0) {
    return {domain::LimitOrder{params_.size, close_data.close - offset, true}};
  }
  return {domain::LimitOrder{-params_.size, close_data.close + offset, true}};
}

}  // namespace barsim
