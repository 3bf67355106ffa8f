#pragma once

#include <optional>
#include <string>

namespace barsim {
namespace domain {

// -----------------------------------------------------------------------------
// BacktestParams — run-wide parameters
// -----------------------------------------------------------------------------
//
// @details
// Copied by value into every shard, so each shard starts with the full
// balance_init and the same fee rates. The merger corrects for the repeated
// starting capital afterwards.
//
// n_splits:
//    1  → single shard, run inline on the caller thread
//   >1  → that many shards
//   <0  → relative to available parallelism: cpu_count + n_splits + 1
//          (-1 means "one shard per hardware thread")
//    0  → invalid
//
// logarithmic selects how shard curves chain: multiplicatively (returns
// compound) or additively (absolute PnL adds up).
// -----------------------------------------------------------------------------
struct BacktestParams {
  double maker_fee{0.0};
  double taker_fee{0.0};
  double balance_init{1.0};
  std::optional<std::string> name;
  int n_splits{1};
  bool logarithmic{true};
};

}  // namespace domain
}  // namespace barsim
