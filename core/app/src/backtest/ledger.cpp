#include "barsim/backtest/ledger.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace barsim {

Ledger::Ledger(LedgerInfo info, std::vector<LedgerRow> rows)
    : info_(std::move(info)), rows_(std::move(rows)) {}

// -----------------------------------------------------------------------------
// Parallel sequences
// -----------------------------------------------------------------------------
std::vector<std::int64_t> Ledger::keys() const {
  return column<std::int64_t>([](const LedgerRow& r) { return r.key; });
}

std::vector<double> Ledger::closes() const {
  return column<double>([](const LedgerRow& r) { return r.close; });
}

std::vector<double> Ledger::positions() const {
  return column<double>([](const LedgerRow& r) { return r.position; });
}

std::vector<double> Ledger::positionQuotes() const {
  return column<double>([](const LedgerRow& r) { return r.position_quote; });
}

std::vector<double> Ledger::balanceQuotes() const {
  return column<double>([](const LedgerRow& r) { return r.balance_quote; });
}

std::vector<double> Ledger::equityQuotes() const {
  return column<double>([](const LedgerRow& r) { return r.equity_quote; });
}

std::vector<domain::FinishedOrder> Ledger::finishedOrders() const {
  std::vector<domain::FinishedOrder> out;
  for (const auto& row : rows_) {
    out.insert(out.end(), row.finished_orders.begin(),
               row.finished_orders.end());
  }
  return out;
}

// -----------------------------------------------------------------------------
// Aggregations
// -----------------------------------------------------------------------------
std::vector<std::size_t> Ledger::orderCount() const {
  return column<std::size_t>(
      [](const LedgerRow& r) { return r.finished_orders.size(); });
}

std::vector<std::optional<double>> Ledger::filledRate() const {
  return column<std::optional<double>>(
      [](const LedgerRow& r) -> std::optional<double> {
        if (r.finished_orders.empty()) {
          return std::nullopt;
        }
        std::size_t filled = 0;
        for (const auto& order : r.finished_orders) {
          if (order.filled()) {
            ++filled;
          }
        }
        return static_cast<double>(filled) /
               static_cast<double>(r.finished_orders.size());
      });
}

double Ledger::totalFee() const {
  double total = 0.0;
  for (const auto& row : rows_) {
    for (const auto& order : row.finished_orders) {
      total += order.fee;
    }
  }
  return total;
}

double Ledger::totalFee(domain::FinishedOrderState state) const {
  double total = 0.0;
  for (const auto& row : rows_) {
    for (const auto& order : row.finished_orders) {
      if (order.state == state) {
        total += order.fee;
      }
    }
  }
  return total;
}

double Ledger::totalOrderAmount() const {
  double total = 0.0;
  for (const auto& row : rows_) {
    for (const auto& order : row.finished_orders) {
      total += std::abs(order.quote_size);
    }
  }
  return total;
}

std::size_t Ledger::totalOrderCount() const {
  std::size_t total = 0;
  for (const auto& row : rows_) {
    total += row.finished_orders.size();
  }
  return total;
}

std::size_t Ledger::stateCount(domain::FinishedOrderState state) const {
  std::size_t count = 0;
  for (const auto& row : rows_) {
    for (const auto& order : row.finished_orders) {
      if (order.state == state) {
        ++count;
      }
    }
  }
  return count;
}

// -----------------------------------------------------------------------------
// Scaled copies
// -----------------------------------------------------------------------------
Ledger Ledger::scaled(double factor) const {
  if (std::isnan(factor) || factor < 0.0) {
    std::ostringstream os;
    os << "Cannot scale by negative number: " << factor;
    throw std::invalid_argument(os.str());
  }

  std::vector<LedgerRow> rows;
  rows.reserve(rows_.size());
  for (const auto& row : rows_) {
    LedgerRow out;
    out.key = row.key;
    out.close = row.close;
    out.position = row.position * factor;
    out.position_quote = row.position_quote * factor;
    out.balance_quote = row.balance_quote * factor;
    out.equity_quote = row.equity_quote * factor;
    out.finished_orders.reserve(row.finished_orders.size());
    for (const auto& order : row.finished_orders) {
      out.finished_orders.push_back(order.scaled(factor));
    }
    rows.push_back(std::move(out));
  }
  return Ledger(info_, std::move(rows));
}

Ledger Ledger::withName(std::optional<std::string> name) const {
  LedgerInfo info = info_;
  info.name = std::move(name);
  return Ledger(std::move(info), rows_);
}

}  // namespace barsim
