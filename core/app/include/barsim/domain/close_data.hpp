#pragma once

#include <cstdint>

namespace barsim {
namespace domain {

// -----------------------------------------------------------------------------
// CloseData — account snapshot handed to the strategy after each close
// -----------------------------------------------------------------------------
//
// @details
// Taken after the bar's carried orders were resolved. position_quote and
// equity_quote are valued at the bar's OPEN, not its close, matching the
// ledger row recorded for the same bar:
//
//   position_quote = position * open
//   equity_quote   = balance_quote + position_quote
//
// Value type; the strategy receives a const reference valid for the call.
// -----------------------------------------------------------------------------
struct CloseData {
  std::int64_t index{0};
  double open{0.0};
  double high{0.0};
  double low{0.0};
  double close{0.0};
  double position{0.0};
  double position_quote{0.0};
  double balance_quote{0.0};
  double equity_quote{0.0};
};

}  // namespace domain
}  // namespace barsim
