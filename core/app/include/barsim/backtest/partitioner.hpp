#pragma once

#include "barsim/backtest/ledger.hpp"
#include "barsim/domain/backtest_params.hpp"
#include "barsim/domain/bar.hpp"
#include "barsim/strategy/i_strategy.hpp"

#include <optional>
#include <string>
#include <vector>

namespace barsim {

// -----------------------------------------------------------------------------
// Partitioner — split a bar sequence into shards and simulate them in parallel
// -----------------------------------------------------------------------------
//
// @brief  Cuts the bars into k contiguous chunks by position and runs one
//         independent SimulationLoop per chunk on a WorkerPool.
//
// @details
// Chunk sizes: with n bars, the first n % k chunks hold n / k + 1 bars and
// the remaining chunks n / k. A chunk is empty when k > n.
//
// Every shard starts fresh: full balance_init, zero position, no carried
// orders, and a strategy instance of its own from the factory. The seams
// are reconciled later by ResultMerger.
//
// Thread model:
//   run() blocks the caller until every shard finished. The pool holds
//   min(k, cpu_count) threads and lives for one run() call. Each job owns
//   its bar slice by value, so shards share no mutable state.
//
// Error handling:
//   The first shard (in submission order) that threw has its exception
//   rethrown from run(); other shards are still allowed to finish before
//   the pool is torn down. No partial result is returned.
// -----------------------------------------------------------------------------
class Partitioner {
 public:
  Partitioner(domain::BacktestParams params,
              StrategyFactory factory,
              int cpu_count);

  Partitioner(const Partitioner&) = delete;
  Partitioner& operator=(const Partitioner&) = delete;
  Partitioner(Partitioner&&) = delete;
  Partitioner& operator=(Partitioner&&) = delete;

  // -------------------------------------------------------------------------
  // checkSplitCount / resolveSplitCount
  // -------------------------------------------------------------------------
  // n_splits > 0 is taken as is. n_splits < 0 means cpu_count + n_splits + 1
  // (-1 → one shard per hardware thread). 0 and values below -cpu_count are
  // invalid.
  //
  // checkSplitCount() returns the violation message, or nullopt when valid,
  // so InputValidator can aggregate it. resolveSplitCount() throws
  // std::invalid_argument with the same message.
  // -------------------------------------------------------------------------
  static std::optional<std::string> checkSplitCount(int n_splits,
                                                    int cpu_count);
  static int resolveSplitCount(int n_splits, int cpu_count);

  // Contiguous chunks as described above. Throws std::invalid_argument if
  // k < 1.
  static std::vector<std::vector<domain::Bar>> split(
      const std::vector<domain::Bar>& bars, int k);

  // -------------------------------------------------------------------------
  // run(bars, k)
  // -------------------------------------------------------------------------
  // @return One ledger per chunk, in chunk order (earliest first).
  // -------------------------------------------------------------------------
  std::vector<Ledger> run(const std::vector<domain::Bar>& bars, int k) const;

 private:
  const domain::BacktestParams params_;
  const StrategyFactory factory_;
  const int cpu_count_;
};

}  // namespace barsim
