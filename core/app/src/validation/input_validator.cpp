#include "barsim/validation/input_validator.hpp"
#include "barsim/backtest/partitioner.hpp"
#include "barsim/domain/errors.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iostream>
#include <string>
#include <utility>

namespace barsim {

namespace {

// Pointers to the four price columns, in open/high/low/close order.
struct PriceColumns {
  const std::vector<double>* open{nullptr};
  const std::vector<double>* high{nullptr};
  const std::vector<double>* low{nullptr};
  const std::vector<double>* close{nullptr};
  std::array<const char*, 4> names{{"open", "high", "low", "close"}};

  bool complete() const { return open && high && low && close; }
};

PriceColumns findPriceColumns(const domain::BarTable& table) {
  PriceColumns lower;
  lower.open = table.column("open");
  lower.high = table.column("high");
  lower.low = table.column("low");
  lower.close = table.column("close");
  if (lower.complete()) {
    return lower;
  }

  PriceColumns upper;
  upper.open = table.column("Open");
  upper.high = table.column("High");
  upper.low = table.column("Low");
  upper.close = table.column("Close");
  upper.names = {{"Open", "High", "Low", "Close"}};
  if (upper.complete()) {
    return upper;
  }
  return PriceColumns{};
}

std::string listColumns(const domain::BarTable& table) {
  std::string out = "[";
  for (std::size_t i = 0; i < table.column_names.size(); ++i) {
    if (i > 0) {
      out += ", ";
    }
    out += "'" + table.column_names[i] + "'";
  }
  return out + "]";
}

// True if any row satisfies pred(lhs[i], rhs[i]).
bool anyRow(const std::vector<double>& lhs,
            const std::vector<double>& rhs,
            const std::function<bool(double, double)>& pred) {
  for (std::size_t i = 0; i < lhs.size(); ++i) {
    if (pred(lhs[i], rhs[i])) {
      return true;
    }
  }
  return false;
}

// NaN (an empty CSV cell) counts as non-positive.
bool anyNonPositive(const std::vector<double>& values) {
  for (const double v : values) {
    if (!(v > 0.0)) {
      return true;
    }
  }
  return false;
}

bool anyInfinite(const std::vector<double>& values) {
  return std::any_of(values.begin(), values.end(),
                     [](double v) { return std::isinf(v); });
}

}  // namespace

// -----------------------------------------------------------------------------
// collectErrors: every rule, no early exit
// -----------------------------------------------------------------------------
std::vector<std::string> InputValidator::collectErrors(
    const domain::BarTable& table,
    const domain::BacktestParams& params,
    int cpu_count) {
  std::vector<std::string> errors;

  const PriceColumns prices = findPriceColumns(table);
  if (!prices.complete()) {
    errors.push_back(
        "bars must have columns \"open\", \"close\", \"high\", \"low\", but "
        "got " +
        listColumns(table));
  } else {
    const auto& open = *prices.open;
    const auto& high = *prices.high;
    const auto& low = *prices.low;
    const auto& close = *prices.close;
    const auto greater = [](double x, double y) { return x > y; };
    const auto less = [](double x, double y) { return x < y; };

    if (anyRow(open, high, greater)) {
      errors.emplace_back("open price must be less than high price");
    }
    if (anyRow(open, low, less)) {
      errors.emplace_back("open price must be greater than low price");
    }
    if (anyRow(close, high, greater)) {
      errors.emplace_back("close price must be less than high price");
    }
    if (anyRow(close, low, less)) {
      errors.emplace_back("close price must be greater than low price");
    }
    if (anyRow(high, low, less)) {
      errors.emplace_back("high price must be greater than low price");
    }
    if (anyNonPositive(open)) {
      errors.emplace_back("open price must be greater than 0");
    }
    if (anyNonPositive(close)) {
      errors.emplace_back("close price must be greater than 0");
    }
    if (anyNonPositive(high)) {
      errors.emplace_back("high price must be greater than 0");
    }
    if (anyNonPositive(low)) {
      errors.emplace_back("low price must be greater than 0");
    }
    const std::array<const std::vector<double>*, 4> columns{
        {&open, &high, &low, &close}};
    for (std::size_t c = 0; c < columns.size(); ++c) {
      if (anyInfinite(*columns[c])) {
        errors.push_back(std::string(prices.names[c]) + " price must be finite");
      }
    }
  }

  bool monotonic = true;
  bool unique = true;
  for (std::size_t i = 1; i < table.keys.size(); ++i) {
    if (table.keys[i] < table.keys[i - 1]) {
      monotonic = false;
    }
  }
  {
    std::vector<std::int64_t> sorted = table.keys;
    std::sort(sorted.begin(), sorted.end());
    unique = std::adjacent_find(sorted.begin(), sorted.end()) == sorted.end();
  }
  if (!monotonic) {
    errors.emplace_back("index must be monotonic increasing");
  }
  if (!unique) {
    errors.emplace_back("index must be unique");
  }

  if (!(params.balance_init > 0.0)) {
    errors.emplace_back("balance_init must be greater than 0");
  }

  if (auto split_error =
          Partitioner::checkSplitCount(params.n_splits, cpu_count)) {
    errors.push_back(*split_error);
  }

  return errors;
}

// -----------------------------------------------------------------------------
// validate: aggregate, warn, then build bars
// -----------------------------------------------------------------------------
std::vector<domain::Bar> InputValidator::validate(
    const domain::BarTable& table,
    const domain::BacktestParams& params,
    int cpu_count) {
  auto errors = collectErrors(table, params, cpu_count);

  if (!(params.taker_fee > 0.0)) {
    std::cerr << "[InputValidator] WARNING: taker_fee is not positive (got "
              << params.taker_fee << "), are you sure?\n";
  }

  if (!errors.empty()) {
    throw ValidationError(std::move(errors));
  }

  const PriceColumns prices = findPriceColumns(table);

  // Non-price columns travel with each bar.
  std::vector<std::size_t> extra_columns;
  for (std::size_t c = 0; c < table.column_names.size(); ++c) {
    const std::string& name = table.column_names[c];
    bool is_price = false;
    for (const char* price_name : prices.names) {
      if (name == price_name) {
        is_price = true;
      }
    }
    if (!is_price) {
      extra_columns.push_back(c);
    }
  }

  std::vector<domain::Bar> bars;
  bars.reserve(table.size());
  for (std::size_t i = 0; i < table.size(); ++i) {
    domain::Bar bar;
    bar.key = table.keys[i];
    bar.open = (*prices.open)[i];
    bar.high = (*prices.high)[i];
    bar.low = (*prices.low)[i];
    bar.close = (*prices.close)[i];
    for (const auto c : extra_columns) {
      bar.extra.emplace(table.column_names[c], table.columns[c][i]);
    }
    bars.push_back(std::move(bar));
  }
  return bars;
}

}  // namespace barsim
