#pragma once

#include "barsim/backtest/ledger.hpp"
#include "barsim/domain/backtest_params.hpp"
#include "barsim/domain/bar.hpp"
#include "barsim/strategy/i_strategy.hpp"

#include <vector>

namespace barsim {

// -----------------------------------------------------------------------------
// BacktestEngine
// -----------------------------------------------------------------------------
//
// @brief  Programmatic root of a backtest: validates the input, picks the
//         single-shard or partitioned path and returns one Ledger.
//
// @details
// Pipeline of run(table):
//
//   1. InputValidator::validate(table, params, cpu_count)
//        → every structural violation reported at once (ValidationError)
//   2. k = Partitioner::resolveSplitCount(params.n_splits, cpu_count)
//   3. k == 1 → SimulationLoop on the caller thread with one strategy
//      k  > 1 → Partitioner::run (WorkerPool) → ResultMerger::reduce
//   4. The ledger is renamed to params.name.
//
// Thread model:
//   run() blocks the calling thread until the ledger is complete. With
//   k > 1 the shards run on a pool owned by that call; nothing outlives it.
//   The engine itself holds only immutable configuration, so concurrent
//   run() calls on one engine are safe as long as the strategy factory is.
//
// Ownership:
//   BacktestEngine
//    ├── params_     (BacktestParams — value, copied into every shard)
//    ├── factory_    (StrategyFactory — called once per shard)
//    └── cpu_count_  (int — available parallelism, >= 1)
//
// Error handling:
//   ValidationError before any simulation; InvalidOrderError, MergeError
//   or a strategy's own exception during it. No partial ledger is ever
//   returned.
// -----------------------------------------------------------------------------
class BacktestEngine {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  //
  // @param  params     Run parameters (fees, balance_init, n_splits, mode).
  // @param  factory    Creates one strategy per shard. Must be non-empty.
  // @param  cpu_count  Available parallelism for negative n_splits and the
  //                    pool size. Values below 1 are clamped to 1.
  //
  // @throws std::invalid_argument for an empty factory.
  // -------------------------------------------------------------------------
  BacktestEngine(domain::BacktestParams params,
                 StrategyFactory factory,
                 int cpu_count = defaultCpuCount());

  BacktestEngine(const BacktestEngine&) = delete;
  BacktestEngine& operator=(const BacktestEngine&) = delete;
  BacktestEngine(BacktestEngine&&) = delete;
  BacktestEngine& operator=(BacktestEngine&&) = delete;

  Ledger run(const domain::BarTable& table) const;

  // Already-built bars, e.g. from tests. Converted back to a table so the
  // same validation applies.
  Ledger run(const std::vector<domain::Bar>& bars) const;

  const domain::BacktestParams& params() const { return params_; }
  int cpuCount() const { return cpu_count_; }

  // std::thread::hardware_concurrency(), or 1 when it is unknown.
  static int defaultCpuCount();

 private:
  Ledger runValidated(const std::vector<domain::Bar>& bars) const;

  const domain::BacktestParams params_;
  const StrategyFactory factory_;
  const int cpu_count_;
};

}  // namespace barsim
