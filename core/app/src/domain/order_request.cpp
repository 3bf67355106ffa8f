#include "barsim/domain/order_request.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>

namespace barsim {
namespace domain {

namespace {

void requireNonNegativeFactor(double factor) {
  if (std::isnan(factor) || factor < 0.0) {
    std::ostringstream os;
    os << "Cannot scale by negative number: " << factor;
    throw std::invalid_argument(os.str());
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// Scaling
// -----------------------------------------------------------------------------
MarketOrder MarketOrder::scaled(double factor) const {
  requireNonNegativeFactor(factor);
  return MarketOrder{size * factor};
}

LimitOrder LimitOrder::scaled(double factor) const {
  requireNonNegativeFactor(factor);
  return LimitOrder{size * factor, price, post_only};
}

OrderRequest scaled(const OrderRequest& order, double factor) {
  return std::visit(
      [factor](const auto& o) -> OrderRequest { return o.scaled(factor); },
      order);
}

// -----------------------------------------------------------------------------
// Equality
// -----------------------------------------------------------------------------
bool operator==(const MarketOrder& lhs, const MarketOrder& rhs) {
  return lhs.size == rhs.size;
}

bool operator==(const LimitOrder& lhs, const LimitOrder& rhs) {
  return lhs.size == rhs.size && lhs.price == rhs.price &&
         lhs.post_only == rhs.post_only;
}

// -----------------------------------------------------------------------------
// Accessors
// -----------------------------------------------------------------------------
double orderSize(const OrderRequest& order) {
  return std::visit([](const auto& o) { return o.size; }, order);
}

std::string describe(const OrderRequest& order) {
  std::ostringstream os;
  std::visit(Overloaded{
                 [&os](const MarketOrder& market) {
                   os << "Market(size=" << market.size << ")";
                 },
                 [&os](const LimitOrder& limit) {
                   os << "Limit(size=" << limit.size
                      << ", price=" << limit.price << ", post_only="
                      << (limit.post_only ? "true" : "false") << ")";
                 },
             },
             order);
  return os.str();
}

}  // namespace domain
}  // namespace barsim
