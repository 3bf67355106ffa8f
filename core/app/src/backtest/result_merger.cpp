#include "barsim/backtest/result_merger.hpp"
#include "barsim/domain/errors.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <sstream>
#include <utility>

namespace barsim {

namespace {

// Values of (keys, values) reindexed onto `target` (a sorted superset):
// each target key takes the value at the nearest source key at or before
// it, and keys before the first source key take the first value.
std::vector<double> fillOnto(const std::vector<std::int64_t>& keys,
                             const std::vector<double>& values,
                             const std::vector<std::int64_t>& target) {
  std::vector<double> out;
  out.reserve(target.size());
  std::size_t j = 0;
  for (const auto key : target) {
    while (j + 1 < keys.size() && keys[j + 1] <= key) {
      ++j;
    }
    out.push_back(values[j]);
  }
  return out;
}

// Sum with missing keys treated as 0.
std::vector<double> alignZero(const std::vector<std::int64_t>& keys,
                              const std::vector<double>& values,
                              const std::vector<std::int64_t>& target) {
  std::vector<double> out(target.size(), 0.0);
  std::size_t j = 0;
  for (std::size_t i = 0; i < target.size() && j < keys.size(); ++i) {
    if (target[i] == keys[j]) {
      out[i] = values[j];
      ++j;
    }
  }
  return out;
}

std::optional<std::string> joinNames(const std::optional<std::string>& a,
                                     const std::optional<std::string>& b) {
  if (a && b) {
    return *a + " + " + *b;
  }
  return a ? a : b;
}

}  // namespace

// -----------------------------------------------------------------------------
// merge: A (earlier) + B (later)
// -----------------------------------------------------------------------------
Ledger ResultMerger::merge(const Ledger& a, const Ledger& b) {
  if (a.logarithmic() != b.logarithmic()) {
    throw MergeError(
        "Cannot merge a logarithmic ledger with a linear ledger");
  }
  if (a.empty()) {
    return b;
  }
  if (b.empty()) {
    return a;
  }

  const bool logarithmic = a.logarithmic();
  const double a_equity_last = a.rows().back().equity_quote;
  const double b_equity_first = b.rows().front().equity_quote;

  // Rescale B so it continues from A's final equity.
  double ratio = 1.0;
  if (logarithmic) {
    if (!(b_equity_first > 0.0)) {
      std::ostringstream os;
      os << "Cannot chain logarithmic ledgers: first equity of the later "
            "ledger is "
         << b_equity_first;
      throw MergeError(os.str());
    }
    if (!(a_equity_last >= 0.0)) {
      std::ostringstream os;
      os << "Cannot chain logarithmic ledgers: last equity of the earlier "
            "ledger is "
         << a_equity_last;
      throw MergeError(os.str());
    }
    ratio = a_equity_last / b_equity_first;
  }
  const Ledger b_scaled = logarithmic ? b.scaled(ratio) : b;

  // Sorted union of both key sets.
  const auto a_keys = a.keys();
  const auto b_keys = b_scaled.keys();
  std::vector<std::int64_t> keys;
  keys.reserve(a_keys.size() + b_keys.size());
  std::set_union(a_keys.begin(), a_keys.end(), b_keys.begin(), b_keys.end(),
                 std::back_inserter(keys));

  // Seam: A ends and B starts fully marked to equity.
  auto a_balance = a.balanceQuotes();
  a_balance.back() = a.rows().back().equity_quote;
  auto b_balance = b_scaled.balanceQuotes();
  b_balance.front() = b_scaled.rows().front().equity_quote;

  const auto a_balance_f = fillOnto(a_keys, a_balance, keys);
  const auto b_balance_f = fillOnto(b_keys, b_balance, keys);
  const auto a_equity_f = fillOnto(a_keys, a.equityQuotes(), keys);
  const auto b_equity_f = fillOnto(b_keys, b_scaled.equityQuotes(), keys);

  const auto a_position = alignZero(a_keys, a.positions(), keys);
  const auto b_position = alignZero(b_keys, b_scaled.positions(), keys);
  const auto a_position_quote = alignZero(a_keys, a.positionQuotes(), keys);
  const auto b_position_quote =
      alignZero(b_keys, b_scaled.positionQuotes(), keys);

  // Level counted twice by the fills.
  const double offset = logarithmic ? a_equity_last : b.balanceInit();

  std::vector<LedgerRow> rows;
  rows.reserve(keys.size());
  std::size_t ia = 0;
  std::size_t ib = 0;
  for (std::size_t i = 0; i < keys.size(); ++i) {
    LedgerRow row;
    row.key = keys[i];
    row.position = a_position[i] + b_position[i];
    row.position_quote = a_position_quote[i] + b_position_quote[i];
    row.balance_quote = a_balance_f[i] + b_balance_f[i] - offset;
    row.equity_quote = a_equity_f[i] + b_equity_f[i] - offset;

    const LedgerRow* from_a = nullptr;
    const LedgerRow* from_b = nullptr;
    if (ia < a.size() && a.rows()[ia].key == row.key) {
      from_a = &a.rows()[ia++];
    }
    if (ib < b.size() && b.rows()[ib].key == row.key) {
      from_b = &b.rows()[ib++];
    }

    row.close = from_a ? from_a->close : from_b->close;
    if (from_a) {
      row.finished_orders = from_a->finished_orders;
    }
    if (from_b) {
      // Unscaled: these are B's own transaction amounts.
      row.finished_orders.insert(row.finished_orders.end(),
                                 from_b->finished_orders.begin(),
                                 from_b->finished_orders.end());
    }
    rows.push_back(std::move(row));
  }

  LedgerInfo info;
  info.name = joinNames(a.name(), b.name());
  info.maker_fee_rate =
      domain::FeeRate::combine(a.makerFeeRate(), b.makerFeeRate());
  info.taker_fee_rate =
      domain::FeeRate::combine(a.takerFeeRate(), b.takerFeeRate());
  info.logarithmic = logarithmic;
  info.balance_init = a.balanceInit();
  return Ledger(std::move(info), std::move(rows));
}

// -----------------------------------------------------------------------------
// reduce: ((L0 + L1) + L2) + ...
// -----------------------------------------------------------------------------
Ledger ResultMerger::reduce(const std::vector<Ledger>& ledgers) {
  if (ledgers.empty()) {
    return Ledger();
  }
  Ledger result = ledgers.front();
  for (std::size_t i = 1; i < ledgers.size(); ++i) {
    result = merge(result, ledgers[i]);
  }
  return result;
}

}  // namespace barsim
