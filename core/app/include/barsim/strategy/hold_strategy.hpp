#pragma once

#include "barsim/strategy/i_strategy.hpp"

namespace barsim {

// Never trades. The ledger of a HoldStrategy run is flat at balance_init,
// which makes it the baseline for comparing other strategies.
class HoldStrategy final : public IStrategy {
 public:
  std::vector<domain::OrderRequest> produceOrders(
      const domain::CloseData& /*close_data*/,
      const domain::Bar& /*bar*/) override {
    return {};
  }
};

}  // namespace barsim
