#include "barsim/engine/backtest_engine.hpp"
#include "barsim/backtest/partitioner.hpp"
#include "barsim/backtest/result_merger.hpp"
#include "barsim/backtest/simulation_loop.hpp"
#include "barsim/validation/input_validator.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <utility>

namespace barsim {

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
BacktestEngine::BacktestEngine(domain::BacktestParams params,
                               StrategyFactory factory,
                               int cpu_count)
    : params_(std::move(params)),
      factory_(std::move(factory)),
      cpu_count_(std::max(cpu_count, 1)) {
  if (!factory_) {
    throw std::invalid_argument("BacktestEngine: strategy factory is empty");
  }
}

int BacktestEngine::defaultCpuCount() {
  const unsigned n = std::thread::hardware_concurrency();
  return n == 0 ? 1 : static_cast<int>(n);
}

// -----------------------------------------------------------------------------
// run(): validate, then simulate
// -----------------------------------------------------------------------------
Ledger BacktestEngine::run(const domain::BarTable& table) const {
  const auto bars = InputValidator::validate(table, params_, cpu_count_);
  return runValidated(bars);
}

Ledger BacktestEngine::run(const std::vector<domain::Bar>& bars) const {
  return run(domain::BarTable::fromBars(bars));
}

// -----------------------------------------------------------------------------
// runValidated(): inline for k == 1, partitioned otherwise
// -----------------------------------------------------------------------------
Ledger BacktestEngine::runValidated(
    const std::vector<domain::Bar>& bars) const {
  const int k = Partitioner::resolveSplitCount(params_.n_splits, cpu_count_);

  std::cout << "[BacktestEngine] run started: " << bars.size()
            << " bars, shards=" << k << ", mode="
            << (params_.logarithmic ? "logarithmic" : "linear") << "\n";
  const auto started = std::chrono::steady_clock::now();

  Ledger ledger;
  if (k == 1) {
    auto strategy = factory_();
    if (!strategy) {
      throw std::runtime_error("strategy factory returned null");
    }
    SimulationLoop loop(params_, *strategy);
    ledger = loop.run(bars);
  } else {
    Partitioner partitioner(params_, factory_, cpu_count_);
    ledger = ResultMerger::reduce(partitioner.run(bars, k));
  }
  ledger = ledger.withName(params_.name);

  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  std::cout << "[BacktestEngine] run finished: " << ledger.size()
            << " rows, " << ledger.totalOrderCount() << " orders in "
            << elapsed.count() << " ms\n";
  return ledger;
}

}  // namespace barsim
