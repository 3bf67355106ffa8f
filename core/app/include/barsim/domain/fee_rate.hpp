#pragma once

#include <stdexcept>

namespace barsim {
namespace domain {

// -----------------------------------------------------------------------------
// FeeRate — a fee rate that may be unknown after merging
// -----------------------------------------------------------------------------
//
// @brief  Either a known rate or the Mixed marker.
//
// @details
// A ledger records the maker and taker rates it was produced with. When two
// ledgers built with different rates are merged, no single rate describes
// the result, so the combined ledger reports Mixed. A tagged type is used
// instead of a NaN sentinel so a mixed rate cannot silently flow into
// arithmetic: value() throws for Mixed.
// -----------------------------------------------------------------------------
class FeeRate {
 public:
  enum class Kind { Known, Mixed };

  FeeRate() = default;

  static FeeRate known(double rate) { return FeeRate(Kind::Known, rate); }
  static FeeRate mixed() { return FeeRate(Kind::Mixed, 0.0); }

  // Equal rates survive a merge; anything else becomes Mixed.
  static FeeRate combine(const FeeRate& a, const FeeRate& b) {
    return a == b ? a : mixed();
  }

  Kind kind() const { return kind_; }
  bool isMixed() const { return kind_ == Kind::Mixed; }

  double value() const {
    if (isMixed()) {
      throw std::logic_error("FeeRate::value() called on a mixed fee rate");
    }
    return value_;
  }

  bool operator==(const FeeRate& other) const {
    if (kind_ != other.kind_) {
      return false;
    }
    return kind_ == Kind::Mixed || value_ == other.value_;
  }

  bool operator!=(const FeeRate& other) const { return !(*this == other); }

 private:
  FeeRate(Kind kind, double value) : kind_(kind), value_(value) {}

  Kind kind_{Kind::Known};
  double value_{0.0};
};

}  // namespace domain
}  // namespace barsim
