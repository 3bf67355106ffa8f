#pragma once

#include "barsim/domain/backtest_params.hpp"
#include "barsim/domain/bar.hpp"

#include <string>
#include <vector>

namespace barsim {

// -----------------------------------------------------------------------------
// InputValidator — structural checks at the input boundary
// -----------------------------------------------------------------------------
//
// @brief  Turns an untrusted BarTable plus run parameters into validated
//         bars, or reports every violated rule at once.
//
// @details
// Column normalization: the table needs open/high/low/close. If any of the
// lowercase names is missing but all of Open/High/Low/Close are present,
// the capitalized columns are used instead. Otherwise one "missing columns"
// cause is reported and the price checks are skipped.
//
// Rules, each reported at most once regardless of how many rows break it:
//
//   open > high, open < low, close > high, close < low, high < low
//   open, close, high, low <= 0
//   keys not monotonic increasing, keys not unique
//   balance_init <= 0
//   n_splits == 0 or n_splits < -cpu_count
//
// Every other column is carried into Bar::extra for the strategy.
//
// A non-positive taker_fee is legal (rebate modelling) and only logged as a
// warning on std::cerr.
//
// @throws ValidationError carrying all causes, if any rule is violated.
// -----------------------------------------------------------------------------
class InputValidator {
 public:
  InputValidator() = delete;

  static std::vector<domain::Bar> validate(const domain::BarTable& table,
                                           const domain::BacktestParams& params,
                                           int cpu_count);

  // Same rules without building bars: returns the causes (empty if valid)
  // and logs nothing.
  static std::vector<std::string> collectErrors(
      const domain::BarTable& table,
      const domain::BacktestParams& params,
      int cpu_count);
};

}  // namespace barsim
