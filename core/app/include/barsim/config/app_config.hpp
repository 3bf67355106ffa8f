#pragma once

#include "barsim/domain/backtest_params.hpp"
#include "barsim/strategy/i_strategy.hpp"
#include "barsim/strategy/signal_limit_strategy.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace barsim {

// Which built-in strategy to run, with its parameters.
struct StrategyConfig {
  enum class Type { RoundTrip, SignalLimit, Hold };

  Type type{Type::RoundTrip};
  double quote_size{1.0};               // RoundTrip
  SignalLimitStrategy::Params signal;   // SignalLimit
};

// -----------------------------------------------------------------------------
// AppConfig — everything the barsim executable needs for one run
// -----------------------------------------------------------------------------
//
// @details
// Loaded from a JSON file:
//
//   {
//     "name": "btc-1h",                          optional
//     "bars_csv": "data/bars.csv",               required
//     "output_json": "ledger.json",              optional
//     "publish_endpoint": "tcp://127.0.0.1:5557" optional, "" disables
//     "maker_fee": -0.00025,                     required
//     "taker_fee": 0.00075,                      required
//     "balance_init": 1.0,                       default 1
//     "n_splits": 1,                             default 1
//     "logarithmic": true,                       default true
//     "strategy": {
//       "type": "round_trip" | "signal_limit" | "hold",
//       "quote_size": 1.0,                       round_trip
//       "size": 1.0,                             signal_limit
//       "signal_column": "signal",               signal_limit
//       "offset_column": "atr",                  signal_limit
//       "offset_ratio": 0.5                      signal_limit
//     }
//   }
//
// Relative bars_csv / output_json paths are taken as given (relative to the
// working directory), not to the config file.
// -----------------------------------------------------------------------------
struct AppConfig {
  domain::BacktestParams params;
  std::string bars_csv;
  std::string output_json;
  std::string publish_endpoint;
  StrategyConfig strategy;
};

// @throws ConfigError for a missing/unknown field type, a bad strategy type
//         or a missing required field. Range checks (balance_init > 0,
//         n_splits != 0) are left to InputValidator.
AppConfig parseConfig(const nlohmann::json& j);

// @throws ConfigError if the file cannot be opened or is not valid JSON.
AppConfig loadConfig(const std::string& path);

// One fresh strategy per call, as configured.
StrategyFactory makeStrategyFactory(const StrategyConfig& config);

const char* toString(StrategyConfig::Type type);

}  // namespace barsim
