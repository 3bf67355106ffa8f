#pragma once

#include "barsim/domain/bar.hpp"
#include "barsim/domain/close_data.hpp"
#include "barsim/domain/order_request.hpp"

#include <functional>
#include <memory>
#include <vector>

namespace barsim {

// -----------------------------------------------------------------------------
// IStrategy — the strategy capability consumed by the simulation loop
// -----------------------------------------------------------------------------
//
// @brief  Turns one closed bar (plus the account snapshot) into the complete
//         set of orders to carry into the next bar.
//
// @details
// produceOrders() is called exactly once per bar, synchronously, after the
// bar's carried orders were resolved. The returned vector REPLACES the
// carried set: nothing survives from the previous bar, so unfilled orders
// are cancelled by construction. A strategy that wants an order kept alive
// re-issues it every bar.
//
// init() runs once at the start of every shard, before the first bar.
// Most strategies leave it as the no-op default.
//
// Ownership / thread model:
//   Each shard owns its own strategy instance, created by a StrategyFactory
//   on the shard's worker thread. An instance is never shared between
//   shards, so implementations need no locking; the factory itself may be
//   called from several threads at once and must be safe for that.
// -----------------------------------------------------------------------------
class IStrategy {
 public:
  virtual ~IStrategy() = default;

  virtual void init() {}

  virtual std::vector<domain::OrderRequest> produceOrders(
      const domain::CloseData& close_data, const domain::Bar& bar) = 0;
};

// Creates one fresh strategy per shard.
using StrategyFactory = std::function<std::unique_ptr<IStrategy>()>;

}  // namespace barsim
