#include "barsim/config/app_config.hpp"
#include "barsim/domain/errors.hpp"
#include "barsim/strategy/hold_strategy.hpp"
#include "barsim/strategy/round_trip_strategy.hpp"

#include <fstream>
#include <iostream>
#include <memory>

namespace barsim {

namespace {

// Optional field: default when absent or null. A present field of the
// wrong type throws nlohmann::json::type_error.
template <typename T>
T valueOr(const nlohmann::json& j, const char* key, T fallback) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return fallback;
  }
  return it->get<T>();
}

StrategyConfig::Type parseStrategyType(const std::string& name) {
  if (name == "round_trip") {
    return StrategyConfig::Type::RoundTrip;
  }
  if (name == "signal_limit") {
    return StrategyConfig::Type::SignalLimit;
  }
  if (name == "hold") {
    return StrategyConfig::Type::Hold;
  }
  throw ConfigError("Unknown strategy type '" + name +
                    "' (expected round_trip, signal_limit or hold)");
}

StrategyConfig parseStrategy(const nlohmann::json& j) {
  StrategyConfig config;
  config.type = parseStrategyType(valueOr<std::string>(j, "type", "round_trip"));
  config.quote_size = valueOr(j, "quote_size", config.quote_size);

  auto& signal = config.signal;
  signal.size = valueOr(j, "size", signal.size);
  signal.signal_column = valueOr(j, "signal_column", signal.signal_column);
  signal.offset_column = valueOr(j, "offset_column", signal.offset_column);
  signal.offset_ratio = valueOr(j, "offset_ratio", signal.offset_ratio);
  return config;
}

}  // namespace

const char* toString(StrategyConfig::Type type) {
  switch (type) {
    case StrategyConfig::Type::RoundTrip:   return "round_trip";
    case StrategyConfig::Type::SignalLimit: return "signal_limit";
    case StrategyConfig::Type::Hold:        return "hold";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// parseConfig: nlohmann errors become ConfigError
// -----------------------------------------------------------------------------
AppConfig parseConfig(const nlohmann::json& j) {
  if (!j.is_object()) {
    throw ConfigError("Config root must be a JSON object");
  }

  try {
    AppConfig config;
    config.bars_csv = j.at("bars_csv").get<std::string>();
    config.output_json = valueOr<std::string>(j, "output_json", "");
    config.publish_endpoint = valueOr<std::string>(j, "publish_endpoint", "");

    auto& params = config.params;
    params.maker_fee = j.at("maker_fee").get<double>();
    params.taker_fee = j.at("taker_fee").get<double>();
    params.balance_init = valueOr(j, "balance_init", params.balance_init);
    params.n_splits = valueOr(j, "n_splits", params.n_splits);
    params.logarithmic = valueOr(j, "logarithmic", params.logarithmic);
    if (j.contains("name") && !j.at("name").is_null()) {
      params.name = j.at("name").get<std::string>();
    }

    if (j.contains("strategy")) {
      config.strategy = parseStrategy(j.at("strategy"));
    }
    return config;
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(std::string("Invalid config: ") + e.what());
  }
}

AppConfig loadConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("Cannot open config file: " + path);
  }

  nlohmann::json j;
  try {
    j = nlohmann::json::parse(in);
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigError("Malformed JSON in " + path + ": " + e.what());
  }

  AppConfig config = parseConfig(j);
  std::cout << "[AppConfig] loaded " << path << ": bars=" << config.bars_csv
            << " strategy=" << toString(config.strategy.type)
            << " n_splits=" << config.params.n_splits
            << " logarithmic=" << std::boolalpha << config.params.logarithmic
            << std::noboolalpha << "\n";
  return config;
}

// -----------------------------------------------------------------------------
// makeStrategyFactory
// -----------------------------------------------------------------------------
StrategyFactory makeStrategyFactory(const StrategyConfig& config) {
  switch (config.type) {
    case StrategyConfig::Type::RoundTrip: {
      const double quote_size = config.quote_size;
      return [quote_size]() -> std::unique_ptr<IStrategy> {
        return std::make_unique<RoundTripStrategy>(quote_size);
      };
    }
    case StrategyConfig::Type::SignalLimit: {
      const SignalLimitStrategy::Params params = config.signal;
      return [params]() -> std::unique_ptr<IStrategy> {
        return std::make_unique<SignalLimitStrategy>(params);
      };
    }
    case StrategyConfig::Type::Hold:
      return []() -> std::unique_ptr<IStrategy> {
        return std::make_unique<HoldStrategy>();
      };
  }
  throw ConfigError("Unhandled strategy type");
}

}  // namespace barsim
