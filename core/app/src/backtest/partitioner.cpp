#include "barsim/backtest/partitioner.hpp"
#include "barsim/backtest/simulation_loop.hpp"
#include "barsim/concurrent/worker_pool.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace barsim {

Partitioner::Partitioner(domain::BacktestParams params,
                         StrategyFactory factory,
                         int cpu_count)
    : params_(std::move(params)),
      factory_(std::move(factory)),
      cpu_count_(std::max(cpu_count, 1)) {
  if (!factory_) {
    throw std::invalid_argument("Partitioner: strategy factory is empty");
  }
}

// -----------------------------------------------------------------------------
// Split count
// -----------------------------------------------------------------------------
std::optional<std::string> Partitioner::checkSplitCount(int n_splits,
                                                        int cpu_count) {
  if (n_splits == 0) {
    return std::string("n_splits must be not 0");
  }
  if (n_splits < -cpu_count) {
    return "n_splits must be greater than -cpu_count=" +
           std::to_string(-cpu_count);
  }
  return std::nullopt;
}

int Partitioner::resolveSplitCount(int n_splits, int cpu_count) {
  if (auto error = checkSplitCount(n_splits, cpu_count)) {
    throw std::invalid_argument(*error);
  }
  return n_splits < 0 ? cpu_count + n_splits + 1 : n_splits;
}

// -----------------------------------------------------------------------------
// split: first n % k chunks get one extra bar
// -----------------------------------------------------------------------------
std::vector<std::vector<domain::Bar>> Partitioner::split(
    const std::vector<domain::Bar>& bars, int k) {
  if (k < 1) {
    throw std::invalid_argument("Partitioner: chunk count must be >= 1, got " +
                                std::to_string(k));
  }

  const std::size_t chunks = static_cast<std::size_t>(k);
  const std::size_t base = bars.size() / chunks;
  const std::size_t extra = bars.size() % chunks;

  std::vector<std::vector<domain::Bar>> out;
  out.reserve(chunks);
  auto begin = bars.begin();
  for (std::size_t i = 0; i < chunks; ++i) {
    const std::size_t len = base + (i < extra ? 1 : 0);
    out.emplace_back(begin, begin + static_cast<std::ptrdiff_t>(len));
    begin += static_cast<std::ptrdiff_t>(len);
  }
  return out;
}

// -----------------------------------------------------------------------------
// run: one job per chunk, results in submission order
// -----------------------------------------------------------------------------
std::vector<Ledger> Partitioner::run(const std::vector<domain::Bar>& bars,
                                     int k) const {
  auto chunks = split(bars, k);
  const std::size_t threads =
      std::min(chunks.size(), static_cast<std::size_t>(cpu_count_));

  std::cout << "[Partitioner] Running " << chunks.size() << " shards on "
            << threads << " threads\n";

  std::vector<std::future<Ledger>> pending;
  pending.reserve(chunks.size());

  std::vector<Ledger> ledgers;
  ledgers.reserve(chunks.size());
  std::exception_ptr first_error;
  {
    WorkerPool pool(threads);
    for (std::size_t i = 0; i < chunks.size(); ++i) {
      pending.push_back(pool.submit(
          [this, i, total = chunks.size(), chunk = std::move(chunks[i])]() {
            auto strategy = factory_();
            if (!strategy) {
              throw std::runtime_error("strategy factory returned null");
            }
            SimulationLoop loop(params_, *strategy);
            Ledger ledger = loop.run(chunk);

            std::ostringstream os;
            os << "[Partitioner] shard " << (i + 1) << "/" << total
               << " finished: " << chunk.size() << " bars\n";
            std::cout << os.str();
            return ledger;
          }));
    }

    for (auto& future : pending) {
      try {
        ledgers.push_back(future.get());
      } catch (const std::exception& e) {
        std::cerr << "[Partitioner] shard failed: " << e.what() << "\n";
        if (!first_error) {
          first_error = std::current_exception();
        }
      }
    }
  }

  if (first_error) {
    std::rethrow_exception(first_error);
  }
  return ledgers;
}

}  // namespace barsim
