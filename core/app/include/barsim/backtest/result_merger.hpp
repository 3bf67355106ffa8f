#pragma once

#include "barsim/backtest/ledger.hpp"

#include <vector>

namespace barsim {

// -----------------------------------------------------------------------------
// ResultMerger — stitches shard ledgers into one continuous ledger
// -----------------------------------------------------------------------------
//
// @brief  Pairwise merge of an earlier ledger A and a later ledger B, and a
//         left-to-right reduction over all shards.
//
// @details
// Every shard started fresh with balance_init, so its curve restarts at the
// initial capital. merge() chains B onto A:
//
//   keys            sorted union of both key sets
//   position,       summed; a key missing on one side counts as 0
//   position_quote
//   balance,        A's last balance is set to A's last equity and B's
//   equity          first balance to B's first equity; each side is then
//                   forward-filled and back-filled onto the union and added
//   close           A's where A has the key, otherwise B's
//   orders          concatenated per key, A's first, never rescaled
//
// Compounding correction:
//
//   logarithmic  B (position, position_quote, balance, equity) is scaled by
//                r = A.equity[last] / B.equity[first] before adding, so B
//                contributes returns, not levels. After adding, the seam
//                level A.equity[last] that the fills counted on both sides
//                is subtracted from balance and equity.
//
//   linear       After adding, B's balance_init is subtracted from balance
//                and equity. Reducing k shards therefore removes
//                (k - 1) * balance_init in total.
//
// With both corrections the result is the same for every grouping of the
// same ordered shard sequence, and for a strategy that is flat with no
// orders in flight at the seams it equals the single-shard run.
//
// Fee-rate metadata: equal rates are kept, differing rates become
// FeeRate::mixed(). The combined name is "<A> + <B>".
//
// Error handling:
//   MergeError if the two ledgers disagree on logarithmic mode (checked
//   before any arithmetic), or if in logarithmic mode B's first equity is
//   not positive (the rescale ratio would be undefined).
// -----------------------------------------------------------------------------
class ResultMerger {
 public:
  ResultMerger() = delete;

  // Either side empty → the other side is returned unchanged.
  static Ledger merge(const Ledger& a, const Ledger& b);

  // Left-to-right pairwise merge. An empty input yields an empty ledger.
  static Ledger reduce(const std::vector<Ledger>& ledgers);
};

}  // namespace barsim
