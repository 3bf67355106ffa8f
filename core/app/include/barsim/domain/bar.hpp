#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace barsim {
namespace domain {

// -----------------------------------------------------------------------------
// Bar
// -----------------------------------------------------------------------------
//
// @brief  One validated OHLC record plus any extra numeric columns of the
//         input row.
//
// @details
// key is the row's position in time (typically epoch milliseconds). Keys are
// unique and strictly increasing across a bar sequence; this is checked once
// by InputValidator and never re-checked per bar.
//
// extra carries every non-OHLC column (indicators, signals) so a strategy
// sees the whole input row, not just prices. field() looks one up and throws
// std::out_of_range naming the column when it is absent.
//
// Price invariants after validation: all prices > 0 and
// low <= {open, close} <= high.
// -----------------------------------------------------------------------------
struct Bar {
  std::int64_t key{0};
  double open{0.0};
  double high{0.0};
  double low{0.0};
  double close{0.0};
  std::unordered_map<std::string, double> extra;

  double field(const std::string& name) const;
};

// -----------------------------------------------------------------------------
// BarTable — raw columnar input before validation
// -----------------------------------------------------------------------------
//
// @details
// Produced by the CSV loader (or by callers building data in memory).
// Nothing about it is trusted: columns may be missing, capitalized, or hold
// prices that violate OHLC ordering. InputValidator turns it into a
// std::vector<Bar> or reports every violation at once.
//
// Every column holds exactly keys.size() values.
// -----------------------------------------------------------------------------
struct BarTable {
  std::vector<std::int64_t> keys;
  std::vector<std::string> column_names;
  std::vector<std::vector<double>> columns;  // Parallel to column_names

  std::size_t size() const { return keys.size(); }

  // Column by exact name, or nullptr.
  const std::vector<double>* column(const std::string& name) const;

  void addColumn(std::string name, std::vector<double> values);

  // Builds a table with open/high/low/close columns (and extras taken from
  // the first bar's extra keys) from already-constructed bars.
  static BarTable fromBars(const std::vector<Bar>& bars);
};

}  // namespace domain
}  // namespace barsim
