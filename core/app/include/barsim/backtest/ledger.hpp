#pragma once

#include "barsim/domain/fee_rate.hpp"
#include "barsim/domain/finished_order.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace barsim {

// -----------------------------------------------------------------------------
// LedgerRow — account state recorded at one bar
// -----------------------------------------------------------------------------
//
// @details
// Recorded after the bar's carried orders were resolved. Quote values are
// marked at the bar's open:
//
//   position_quote = position * open
//   equity_quote   = balance_quote + position_quote
//
// finished_orders lists the orders resolved at this bar (placed at the
// previous bar's close), in the order the strategy returned them.
// -----------------------------------------------------------------------------
struct LedgerRow {
  std::int64_t key{0};
  double close{0.0};
  double position{0.0};
  double position_quote{0.0};
  double balance_quote{0.0};
  double equity_quote{0.0};
  std::vector<domain::FinishedOrder> finished_orders;
};

// Run metadata travelling with the rows.
struct LedgerInfo {
  std::optional<std::string> name;
  domain::FeeRate maker_fee_rate;
  domain::FeeRate taker_fee_rate;
  bool logarithmic{true};
  double balance_init{1.0};
};

// -----------------------------------------------------------------------------
// Ledger — the time-aligned output of a run
// -----------------------------------------------------------------------------
//
// @brief  Ordered-by-key rows plus run metadata. Produced by SimulationLoop
//         (one shard) or ResultMerger (several shards combined).
//
// @details
// Keys are unique and strictly increasing; they are the keys of the input
// bars. Reporting collaborators (JSON writer, ZeroMQ publisher, plotting
// and metrics outside this repository) consume the ledger through the
// parallel-sequence accessors below, which return one value per row in row
// order.
//
// The aggregation accessors (orderCount, filledRate, totalFee, ...) are
// plain sums and counts over finished orders. Performance statistics are
// left to downstream tools.
//
// Value semantics: a Ledger is immutable once built. scaled() and
// withName() return new ledgers.
// -----------------------------------------------------------------------------
class Ledger {
 public:
  Ledger() = default;
  Ledger(LedgerInfo info, std::vector<LedgerRow> rows);

  const LedgerInfo& info() const { return info_; }
  const std::vector<LedgerRow>& rows() const { return rows_; }

  bool empty() const { return rows_.empty(); }
  std::size_t size() const { return rows_.size(); }

  const std::optional<std::string>& name() const { return info_.name; }
  bool logarithmic() const { return info_.logarithmic; }
  double balanceInit() const { return info_.balance_init; }
  const domain::FeeRate& makerFeeRate() const { return info_.maker_fee_rate; }
  const domain::FeeRate& takerFeeRate() const { return info_.taker_fee_rate; }

  // --- Parallel time-indexed sequences ------------------------------------
  std::vector<std::int64_t> keys() const;
  std::vector<double> closes() const;
  std::vector<double> positions() const;
  std::vector<double> positionQuotes() const;
  std::vector<double> balanceQuotes() const;
  std::vector<double> equityQuotes() const;

  // All finished orders of the run, flattened in row order.
  std::vector<domain::FinishedOrder> finishedOrders() const;

  // --- Per-row aggregations -----------------------------------------------
  std::vector<std::size_t> orderCount() const;

  // Fraction of the row's orders that filled; empty for rows without orders.
  std::vector<std::optional<double>> filledRate() const;

  // --- Whole-run aggregations ---------------------------------------------
  double totalFee() const;
  double totalFee(domain::FinishedOrderState state) const;
  double totalOrderAmount() const;  // Sum of |quote_size|
  std::size_t totalOrderCount() const;
  std::size_t stateCount(domain::FinishedOrderState state) const;

  // -------------------------------------------------------------------------
  // scaled(factor)
  // -------------------------------------------------------------------------
  // @brief  Copy with position, position_quote, balance, equity and every
  //         finished order multiplied by factor.
  //
  // @details
  // Models running the same strategy with `factor` times the capital and
  // order sizes. close and metadata are unchanged.
  //
  // @throws std::invalid_argument for a negative factor.
  // -------------------------------------------------------------------------
  Ledger scaled(double factor) const;

  Ledger withName(std::optional<std::string> name) const;

 private:
  template <typename T, typename Getter>
  std::vector<T> column(Getter getter) const {
    std::vector<T> out;
    out.reserve(rows_.size());
    for (const auto& row : rows_) {
      out.push_back(getter(row));
    }
    return out;
  }

  LedgerInfo info_;
  std::vector<LedgerRow> rows_;
};

}  // namespace barsim
