#include "barsim/strategy/round_trip_strategy.hpp"

namespace barsim {

RoundTripStrategy::RoundTripStrategy(double quote_size)
    : quote_size_(quote_size) {}

std::vector<domain::OrderRequest> RoundTripStrategy::produceOrders(
    const domain::CloseData& close_data, const domain::Bar& /*bar*/) {
  // Sized at this bar's close, which is the price both legs take at.
  const double size = quote_size_ / close_data.close;
  return {domain::MarketOrder{size}, domain::MarketOrder{-size}};
}

}  // namespace barsim
