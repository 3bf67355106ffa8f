#pragma once

#include "barsim/strategy/i_strategy.hpp"

namespace barsim {

// -----------------------------------------------------------------------------
// RoundTripStrategy
// -----------------------------------------------------------------------------
// Responsibility: After every close, sends a market buy and a market sell of
// the same base size, worth quote_size at the close. Both fill as taker at
// the next bar, so the position stays flat and the equity curve falls by
// exactly the taker fees: 2 * quote_size * taker_fee per resolved bar.
//
// Used as the default strategy of the CLI and as a fee-accounting probe in
// tests. Stateless, so every shard's instance behaves identically.
// -----------------------------------------------------------------------------
class RoundTripStrategy final : public IStrategy {
 public:
  explicit RoundTripStrategy(double quote_size = 1.0);

  std::vector<domain::OrderRequest> produceOrders(
      const domain::CloseData& close_data, const domain::Bar& bar) override;

 private:
  double quote_size_;
};

}  // namespace barsim
