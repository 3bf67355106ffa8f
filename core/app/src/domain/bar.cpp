#include "barsim/domain/bar.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <utility>

namespace barsim {
namespace domain {

double Bar::field(const std::string& name) const {
  auto it = extra.find(name);
  if (it == extra.end()) {
    throw std::out_of_range("Bar " + std::to_string(key) +
                            " has no column '" + name + "'");
  }
  return it->second;
}

const std::vector<double>* BarTable::column(const std::string& name) const {
  auto it = std::find(column_names.begin(), column_names.end(), name);
  if (it == column_names.end()) {
    return nullptr;
  }
  return &columns[static_cast<std::size_t>(it - column_names.begin())];
}

void BarTable::addColumn(std::string name, std::vector<double> values) {
  if (values.size() != keys.size()) {
    throw std::invalid_argument("Column '" + name + "' has " +
                                std::to_string(values.size()) +
                                " values, expected " +
                                std::to_string(keys.size()));
  }
  column_names.push_back(std::move(name));
  columns.push_back(std::move(values));
}

BarTable BarTable::fromBars(const std::vector<Bar>& bars) {
  BarTable table;
  table.keys.reserve(bars.size());

  std::vector<double> open, high, low, close;
  open.reserve(bars.size());
  high.reserve(bars.size());
  low.reserve(bars.size());
  close.reserve(bars.size());

  for (const auto& bar : bars) {
    table.keys.push_back(bar.key);
    open.push_back(bar.open);
    high.push_back(bar.high);
    low.push_back(bar.low);
    close.push_back(bar.close);
  }

  table.addColumn("open", std::move(open));
  table.addColumn("high", std::move(high));
  table.addColumn("low", std::move(low));
  table.addColumn("close", std::move(close));

  if (bars.empty()) {
    return table;
  }

  // Extras are taken from the first bar; sort names so the column order
  // does not depend on unordered_map iteration.
  std::vector<std::string> extra_names;
  for (const auto& [name, value] : bars.front().extra) {
    extra_names.push_back(name);
  }
  std::sort(extra_names.begin(), extra_names.end());

  for (const auto& name : extra_names) {
    std::vector<double> values;
    values.reserve(bars.size());
    for (const auto& bar : bars) {
      auto it = bar.extra.find(name);
      values.push_back(it != bar.extra.end()
                           ? it->second
                           : std::numeric_limits<double>::quiet_NaN());
    }
    table.addColumn(name, std::move(values));
  }

  return table;
}

}  // namespace domain
}  // namespace barsim
