#pragma once

#include "barsim/backtest/ledger.hpp"
#include "barsim/domain/fee_rate.hpp"
#include "barsim/domain/finished_order.hpp"
#include "barsim/domain/order_request.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace barsim {

// -----------------------------------------------------------------------------
// Ledger JSON serialization
// -----------------------------------------------------------------------------
//
// @brief  nlohmann::json views of the run output, for the ledger file and
//         the ZeroMQ publisher.
//
// @details
// Layout:
//
//   {
//     "type": "ledger",
//     "name": "btc-1h" | null,
//     "logarithmic": true,
//     "balance_init": 1.0,
//     "maker_fee_rate": -0.00025 | "mixed",
//     "taker_fee_rate": 0.00075 | "mixed",
//     "summary": { "rows", "orders", "filled_taker", "filled_maker",
//                  "cancelled_not_filled", "cancelled_post_only",
//                  "total_fee", "total_order_amount", "final_equity" },
//     "rows": [ { "key", "close", "position", "position_quote",
//                 "balance_quote", "equity_quote",
//                 "finished_orders": [ ... ] }, ... ]
//   }
//
// A finished order carries its request as
//   { "type": "market", "size" } or
//   { "type": "limit", "size", "price", "post_only" }
// and executed_price is null when the order did not fill.
// -----------------------------------------------------------------------------

nlohmann::json toJson(const domain::OrderRequest& order);
nlohmann::json toJson(const domain::FinishedOrder& order);
nlohmann::json toJson(const domain::FeeRate& rate);
nlohmann::json toJson(const Ledger& ledger);

// Pretty-printed toJson(ledger) written to path.
// @throws std::runtime_error if the file cannot be opened or written.
void writeJson(const Ledger& ledger, const std::string& path);

}  // namespace barsim
