// =============================================================================
// config_test.cpp
// =============================================================================
// Unit tests for the JSON run configuration and the CSV bar loader.
//
// Validates:
//   - parseConfig(): required fields, defaults, type errors, strategy types
//   - makeStrategyFactory(): each call yields a fresh, working strategy
//   - parseBarsCsv(): header, comments, NaN cells, line-numbered errors
// =============================================================================

#include "barsim/config/app_config.hpp"
#include "barsim/config/csv_bar_loader.hpp"
#include "barsim/domain/errors.hpp"

#include "bar_fixtures.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cmath>
#include <sstream>
#include <string>
#include <variant>
#include <vector>

using barsim::AppConfig;
using barsim::ConfigError;
using barsim::StrategyConfig;
using nlohmann::json;

namespace {

json minimalConfig() {
  return json{{"bars_csv", "bars.csv"},
              {"maker_fee", -0.00025},
              {"taker_fee", 0.00075}};
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. Minimal config: required fields read, everything else defaulted.
// -----------------------------------------------------------------------------
TEST(AppConfigTest, MinimalConfigUsesDefaults) {
  const AppConfig config = barsim::parseConfig(minimalConfig());

  EXPECT_EQ(config.bars_csv, "bars.csv");
  EXPECT_TRUE(config.output_json.empty());
  EXPECT_TRUE(config.publish_endpoint.empty());
  EXPECT_DOUBLE_EQ(config.params.maker_fee, -0.00025);
  EXPECT_DOUBLE_EQ(config.params.taker_fee, 0.00075);
  EXPECT_DOUBLE_EQ(config.params.balance_init, 1.0);
  EXPECT_EQ(config.params.n_splits, 1);
  EXPECT_TRUE(config.params.logarithmic);
  EXPECT_FALSE(config.params.name.has_value());
  EXPECT_EQ(config.strategy.type, StrategyConfig::Type::RoundTrip);
}

TEST(AppConfigTest, FullConfigIsRead) {
  json j = minimalConfig();
  j["name"] = "btc-1h";
  j["output_json"] = "out.json";
  j["publish_endpoint"] = "tcp://127.0.0.1:5557";
  j["balance_init"] = 1000.0;
  j["n_splits"] = -1;
  j["logarithmic"] = false;
  j["strategy"] = {{"type", "signal_limit"},
                   {"size", 2.0},
                   {"signal_column", "sig"},
                   {"offset_column", "range"},
                   {"offset_ratio", 0.25}};

  const AppConfig config = barsim::parseConfig(j);
  ASSERT_TRUE(config.params.name.has_value());
  EXPECT_EQ(*config.params.name, "btc-1h");
  EXPECT_EQ(config.output_json, "out.json");
  EXPECT_EQ(config.publish_endpoint, "tcp://127.0.0.1:5557");
  EXPECT_DOUBLE_EQ(config.params.balance_init, 1000.0);
  EXPECT_EQ(config.params.n_splits, -1);
  EXPECT_FALSE(config.params.logarithmic);
  EXPECT_EQ(config.strategy.type, StrategyConfig::Type::SignalLimit);
  EXPECT_DOUBLE_EQ(config.strategy.signal.size, 2.0);
  EXPECT_EQ(config.strategy.signal.signal_column, "sig");
  EXPECT_EQ(config.strategy.signal.offset_column, "range");
  EXPECT_DOUBLE_EQ(config.strategy.signal.offset_ratio, 0.25);
}

// -----------------------------------------------------------------------------
// 2. Errors surface as ConfigError.
// -----------------------------------------------------------------------------
TEST(AppConfigTest, MissingRequiredFieldThrows) {
  json j = minimalConfig();
  j.erase("taker_fee");
  EXPECT_THROW(barsim::parseConfig(j), ConfigError);

  j = minimalConfig();
  j.erase("bars_csv");
  EXPECT_THROW(barsim::parseConfig(j), ConfigError);
}

TEST(AppConfigTest, WrongTypeThrows) {
  json j = minimalConfig();
  j["n_splits"] = "four";
  EXPECT_THROW(barsim::parseConfig(j), ConfigError);
}

TEST(AppConfigTest, UnknownStrategyTypeThrows) {
  json j = minimalConfig();
  j["strategy"] = {{"type", "martingale"}};
  try {
    barsim::parseConfig(j);
    FAIL() << "expected ConfigError";
  } catch (const ConfigError& e) {
    EXPECT_NE(std::string(e.what()).find("martingale"), std::string::npos);
  }
}

TEST(AppConfigTest, NonObjectRootThrows) {
  EXPECT_THROW(barsim::parseConfig(json::array({1, 2})), ConfigError);
}

TEST(AppConfigTest, MissingFileThrows) {
  EXPECT_THROW(barsim::loadConfig("/nonexistent/barsim.json"), ConfigError);
}

// -----------------------------------------------------------------------------
// 3. Strategy factories.
// -----------------------------------------------------------------------------
TEST(AppConfigTest, FactoryBuildsConfiguredStrategy) {
  const auto bar = barsim_test::makeBar(1, 100.0, 110.0, 90.0, 100.0);
  barsim::domain::CloseData data;
  data.close = 100.0;

  StrategyConfig round_trip;
  round_trip.type = StrategyConfig::Type::RoundTrip;
  round_trip.quote_size = 50.0;
  auto factory = barsim::makeStrategyFactory(round_trip);
  auto first = factory();
  auto second = factory();
  ASSERT_NE(first, nullptr);
  EXPECT_NE(first.get(), second.get());
  const auto orders = first->produceOrders(data, bar);
  ASSERT_EQ(orders.size(), 2u);
  EXPECT_DOUBLE_EQ(barsim::domain::orderSize(orders[0]), 0.5);
  EXPECT_DOUBLE_EQ(barsim::domain::orderSize(orders[1]), -0.5);

  StrategyConfig hold;
  hold.type = StrategyConfig::Type::Hold;
  EXPECT_TRUE(barsim::makeStrategyFactory(hold)()->produceOrders(data, bar)
                  .empty());

  StrategyConfig signal;
  signal.type = StrategyConfig::Type::SignalLimit;
  auto signal_bar = bar;
  signal_bar.extra["signal"] = -1.0;
  signal_bar.extra["atr"] = 4.0;
  const auto quotes =
      barsim::makeStrategyFactory(signal)()->produceOrders(data, signal_bar);
  ASSERT_EQ(quotes.size(), 1u);
  ASSERT_TRUE(std::holds_alternative<barsim::domain::LimitOrder>(quotes[0]));
  const auto& limit = std::get<barsim::domain::LimitOrder>(quotes[0]);
  EXPECT_DOUBLE_EQ(limit.size, -1.0);
  EXPECT_DOUBLE_EQ(limit.price, 102.0);
  EXPECT_TRUE(limit.post_only);
}

TEST(AppConfigTest, StrategyTypeNames) {
  EXPECT_STREQ(barsim::toString(StrategyConfig::Type::RoundTrip), "round_trip");
  EXPECT_STREQ(barsim::toString(StrategyConfig::Type::SignalLimit),
               "signal_limit");
  EXPECT_STREQ(barsim::toString(StrategyConfig::Type::Hold), "hold");
}

// =============================================================================
// CSV bar loader
// =============================================================================

TEST(CsvBarLoaderTest, SplitKeepsEmptyCells) {
  const auto cells = barsim::splitCsvLine("1,,3,");
  ASSERT_EQ(cells.size(), 4u);
  EXPECT_EQ(cells[0], "1");
  EXPECT_EQ(cells[1], "");
  EXPECT_EQ(cells[2], "3");
  EXPECT_EQ(cells[3], "");
}

TEST(CsvBarLoaderTest, ParsesHeaderRowsAndComments) {
  std::istringstream in(
      "# exported bars\n"
      "\n"
      "key,open,high,low,close,signal\n"
      "1700000000000,100.0,101.5,99.2,100.8,1\n"
      "# gap\n"
      "1700000060000, 100.8 ,102.0,100.1,101.9,\n");

  const auto table = barsim::parseBarsCsv(in, "bars.csv");
  ASSERT_EQ(table.size(), 2u);
  EXPECT_EQ(table.keys[0], 1700000000000);
  EXPECT_EQ(table.keys[1], 1700000060000);
  EXPECT_EQ(table.column_names,
            (std::vector<std::string>{"open", "high", "low", "close",
                                      "signal"}));

  const auto* open = table.column("open");
  ASSERT_NE(open, nullptr);
  EXPECT_DOUBLE_EQ((*open)[1], 100.8);
  const auto* signal = table.column("signal");
  ASSERT_NE(signal, nullptr);
  EXPECT_DOUBLE_EQ((*signal)[0], 1.0);
  EXPECT_TRUE(std::isnan((*signal)[1]));
}

TEST(CsvBarLoaderTest, ErrorsNameSourceAndLine) {
  std::istringstream wrong_count("key,open,close\n1,2,3\n2,3\n");
  try {
    barsim::parseBarsCsv(wrong_count, "bars.csv");
    FAIL() << "expected ConfigError";
  } catch (const ConfigError& e) {
    EXPECT_EQ(std::string(e.what()), "bars.csv:3: expected 3 cells, got 2");
  }

  std::istringstream bad_key("key,open\nx1,2\n");
  EXPECT_THROW(barsim::parseBarsCsv(bad_key), ConfigError);

  std::istringstream bad_number("key,open\n1,2.5abc\n");
  EXPECT_THROW(barsim::parseBarsCsv(bad_number), ConfigError);

  std::istringstream empty("# nothing here\n");
  EXPECT_THROW(barsim::parseBarsCsv(empty), ConfigError);
}

TEST(CsvBarLoaderTest, MissingFileThrows) {
  EXPECT_THROW(barsim::loadBarsCsv("/nonexistent/bars.csv"), ConfigError);
}
