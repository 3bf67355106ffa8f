#include "barsim/report/ledger_json.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <variant>

namespace barsim {

// -----------------------------------------------------------------------------
// Order request
// -----------------------------------------------------------------------------
nlohmann::json toJson(const domain::OrderRequest& order) {
  return std::visit(
      domain::Overloaded{
          [](const domain::MarketOrder& market) {
            return nlohmann::json{{"type", "market"}, {"size", market.size}};
          },
          [](const domain::LimitOrder& limit) {
            return nlohmann::json{{"type", "limit"},
                                  {"size", limit.size},
                                  {"price", limit.price},
                                  {"post_only", limit.post_only}};
          },
      },
      order);
}

// -----------------------------------------------------------------------------
// Finished order
// -----------------------------------------------------------------------------
nlohmann::json toJson(const domain::FinishedOrder& order) {
  nlohmann::json j;
  j["time_index"] = order.time_index;
  j["order"] = toJson(order.order);
  j["state"] = domain::toString(order.state);
  j["filled"] = order.filled();
  j["balance_decrement"] = order.balance_decrement;
  j["fee"] = order.fee;
  j["quote_size"] = order.quote_size;
  if (order.executed_price) {
    j["executed_price"] = *order.executed_price;
  } else {
    j["executed_price"] = nullptr;
  }
  return j;
}

nlohmann::json toJson(const domain::FeeRate& rate) {
  if (rate.isMixed()) {
    return "mixed";
  }
  return rate.value();
}

// -----------------------------------------------------------------------------
// Ledger
// -----------------------------------------------------------------------------
nlohmann::json toJson(const Ledger& ledger) {
  using domain::FinishedOrderState;

  nlohmann::json j;
  j["type"] = "ledger";
  if (ledger.name()) {
    j["name"] = *ledger.name();
  } else {
    j["name"] = nullptr;
  }
  j["logarithmic"] = ledger.logarithmic();
  j["balance_init"] = ledger.balanceInit();
  j["maker_fee_rate"] = toJson(ledger.makerFeeRate());
  j["taker_fee_rate"] = toJson(ledger.takerFeeRate());

  nlohmann::json summary;
  summary["rows"] = ledger.size();
  summary["orders"] = ledger.totalOrderCount();
  summary["filled_taker"] = ledger.stateCount(FinishedOrderState::FilledTaker);
  summary["filled_maker"] = ledger.stateCount(FinishedOrderState::FilledMaker);
  summary["cancelled_not_filled"] =
      ledger.stateCount(FinishedOrderState::CancelledNotFilled);
  summary["cancelled_post_only"] =
      ledger.stateCount(FinishedOrderState::CancelledPostOnly);
  summary["total_fee"] = ledger.totalFee();
  summary["total_order_amount"] = ledger.totalOrderAmount();
  if (ledger.empty()) {
    summary["final_equity"] = nullptr;
  } else {
    summary["final_equity"] = ledger.rows().back().equity_quote;
  }
  j["summary"] = summary;

  nlohmann::json rows = nlohmann::json::array();
  for (const auto& row : ledger.rows()) {
    nlohmann::json r;
    r["key"] = row.key;
    r["close"] = row.close;
    r["position"] = row.position;
    r["position_quote"] = row.position_quote;
    r["balance_quote"] = row.balance_quote;
    r["equity_quote"] = row.equity_quote;
    nlohmann::json orders = nlohmann::json::array();
    for (const auto& order : row.finished_orders) {
      orders.push_back(toJson(order));
    }
    r["finished_orders"] = orders;
    rows.push_back(r);
  }
  j["rows"] = rows;
  return j;
}

void writeJson(const Ledger& ledger, const std::string& path) {
  std::ofstream out(path);
  if (!out) {
    throw std::runtime_error("Cannot open ledger output file: " + path);
  }
  out << toJson(ledger).dump(2) << "\n";
  if (!out) {
    throw std::runtime_error("Failed writing ledger output file: " + path);
  }
  std::cout << "[LedgerJson] wrote " << ledger.size() << " rows to " << path
            << "\n";
}

}  // namespace barsim
