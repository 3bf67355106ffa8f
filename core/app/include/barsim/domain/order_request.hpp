#pragma once

#include <string>
#include <variant>

namespace barsim {
namespace domain {

// -----------------------------------------------------------------------------
// MarketOrder / LimitOrder
// -----------------------------------------------------------------------------
//
// @brief  The two kinds of order a strategy may request after a bar closes.
//
// @details
// Sign convention for size (shared by both kinds):
//   positive → buy
//   negative → sell
//   zero     → legal no-op; the simulation loop skips it without emitting a
//              FinishedOrder
//
// Both are immutable values. scaled() returns a copy with the size
// multiplied by a non-negative factor; a negative (or NaN) factor would flip
// the side of the order and is rejected with std::invalid_argument.
//
// Orders live for exactly one bar. A strategy that wants an order "kept
// alive" must return it again after every close.
// -----------------------------------------------------------------------------
struct MarketOrder {
  double size{0.0};  // Signed base-currency units

  MarketOrder scaled(double factor) const;
};

struct LimitOrder {
  double size{0.0};        // Signed base-currency units
  double price{0.0};       // Limit price in quote currency
  bool post_only{false};   // Cancel instead of executing as taker

  LimitOrder scaled(double factor) const;
};

bool operator==(const MarketOrder& lhs, const MarketOrder& rhs);
bool operator==(const LimitOrder& lhs, const LimitOrder& rhs);

// -----------------------------------------------------------------------------
// OrderRequest
// -----------------------------------------------------------------------------
// Closed two-case sum type. The matcher, describe() and the JSON encoder
// dispatch on it with std::visit over an Overloaded set, so adding a third
// kind is a compile-time change at every visit site.
// -----------------------------------------------------------------------------
using OrderRequest = std::variant<MarketOrder, LimitOrder>;

// One lambda per alternative: std::visit(Overloaded{...}, order).
template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

// Signed size of either alternative.
double orderSize(const OrderRequest& order);

// Scaled copy of either alternative (see MarketOrder::scaled).
OrderRequest scaled(const OrderRequest& order, double factor);

// Short human-readable form used in log lines and error messages, e.g.
// "Limit(size=1, price=95, post_only=false)".
std::string describe(const OrderRequest& order);

}  // namespace domain
}  // namespace barsim
