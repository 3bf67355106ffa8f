// -----------------------------------------------------------------------------
// barsim — command-line entry point.
//
//   barsim <config.json>
//
//   1) Load the JSON config (fees, mode, n_splits, strategy, paths).
//   2) Load the bar table from CSV.
//   3) Build the strategy factory and run the BacktestEngine. Validation
//      failures, order faults and merge faults all abort the run here.
//   4) Log a one-line summary.
//   5) Write the ledger JSON if output_json is set.
//   6) Publish the ledger on the PUB socket if publish_endpoint is set.
//
// Exit codes: 0 success, 1 any error, 2 bad usage.
// -----------------------------------------------------------------------------

#include "barsim/config/app_config.hpp"
#include "barsim/config/csv_bar_loader.hpp"
#include "barsim/domain/errors.hpp"
#include "barsim/engine/backtest_engine.hpp"
#include "barsim/network/ledger_publisher.hpp"
#include "barsim/report/ledger_json.hpp"

#include <iostream>

namespace {

void printUsage(const char* argv0) {
  std::cerr << "usage: " << argv0 << " <config.json>\n";
}

void logSummary(const barsim::Ledger& ledger) {
  std::cout << "[main] " << ledger.name().value_or("backtest") << ": ";
  if (ledger.empty()) {
    std::cout << "no bars\n";
    return;
  }
  std::cout << "final equity=" << ledger.rows().back().equity_quote
            << " position=" << ledger.rows().back().position
            << " orders=" << ledger.totalOrderCount()
            << " total fee=" << ledger.totalFee() << "\n";
}

}  // namespace

int main(int argc, char** argv) {
  if (argc != 2) {
    printUsage(argv[0]);
    return 2;
  }

  try {
    const barsim::AppConfig config = barsim::loadConfig(argv[1]);
    const barsim::domain::BarTable table =
        barsim::loadBarsCsv(config.bars_csv);

    barsim::BacktestEngine engine(config.params,
                                  barsim::makeStrategyFactory(config.strategy));
    const barsim::Ledger ledger = engine.run(table);

    logSummary(ledger);

    if (!config.output_json.empty()) {
      barsim::writeJson(ledger, config.output_json);
    }

    if (!config.publish_endpoint.empty()) {
      barsim::LedgerPublisher publisher(config.publish_endpoint);
      publisher.start();
      publisher.publish(ledger);
      publisher.stop();
    }
  } catch (const barsim::ValidationError& e) {
    std::cerr << "[main] FATAL: " << e.causes().size()
              << " input violation(s):\n";
    for (const auto& cause : e.causes()) {
      std::cerr << "  - " << cause << "\n";
    }
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "[main] FATAL: " << e.what() << "\n";
    return 1;
  }

  return 0;
}
