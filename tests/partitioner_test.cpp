// =============================================================================
// partitioner_test.cpp
// =============================================================================
// Unit tests for barsim::Partitioner.
//
// Validates:
//   - Split-count resolution and its error messages
//   - Chunk sizing (first n % k chunks one bar longer, empty chunks if k > n)
//   - Shards run independently, results come back in chunk order
//   - Every shard gets its own strategy instance
//   - A failing shard fails the whole run
// =============================================================================

#include "barsim/backtest/partitioner.hpp"

#include "bar_fixtures.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using barsim::Partitioner;
using barsim::domain::Bar;
using barsim::domain::BacktestParams;
using barsim::domain::CloseData;
using barsim::domain::OrderRequest;
using barsim_test::randomBars;

namespace {

BacktestParams defaultParams() {
  BacktestParams params;
  params.maker_fee = 0.0;
  params.taker_fee = 0.001;
  params.balance_init = 100.0;
  return params;
}

std::vector<OrderRequest> noOrders(const CloseData&, const Bar&) {
  return {};
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. Split count resolution.
// -----------------------------------------------------------------------------
TEST(PartitionerTest, ResolveSplitCount) {
  EXPECT_EQ(Partitioner::resolveSplitCount(1, 8), 1);
  EXPECT_EQ(Partitioner::resolveSplitCount(5, 8), 5);
  EXPECT_EQ(Partitioner::resolveSplitCount(20, 8), 20);
  EXPECT_EQ(Partitioner::resolveSplitCount(-1, 8), 8);
  EXPECT_EQ(Partitioner::resolveSplitCount(-2, 8), 7);
  EXPECT_EQ(Partitioner::resolveSplitCount(-8, 8), 1);
}

TEST(PartitionerTest, InvalidSplitCountsAreRejected) {
  EXPECT_EQ(Partitioner::checkSplitCount(0, 8),
            std::optional<std::string>("n_splits must be not 0"));
  EXPECT_EQ(Partitioner::checkSplitCount(-9, 8),
            std::optional<std::string>(
                "n_splits must be greater than -cpu_count=-8"));
  EXPECT_FALSE(Partitioner::checkSplitCount(3, 8).has_value());

  EXPECT_THROW(Partitioner::resolveSplitCount(0, 4), std::invalid_argument);
  EXPECT_THROW(Partitioner::resolveSplitCount(-5, 4), std::invalid_argument);
}

// -----------------------------------------------------------------------------
// 2. Chunk sizes.
// -----------------------------------------------------------------------------
TEST(PartitionerTest, SplitGivesLeadingChunksTheRemainder) {
  const auto bars = randomBars(10);
  const auto chunks = Partitioner::split(bars, 3);

  ASSERT_EQ(chunks.size(), 3u);
  EXPECT_EQ(chunks[0].size(), 4u);
  EXPECT_EQ(chunks[1].size(), 3u);
  EXPECT_EQ(chunks[2].size(), 3u);

  // Contiguous and in order.
  EXPECT_EQ(chunks[0].front().key, 0);
  EXPECT_EQ(chunks[1].front().key, 4);
  EXPECT_EQ(chunks[2].front().key, 7);
  EXPECT_EQ(chunks[2].back().key, 9);
}

TEST(PartitionerTest, MoreChunksThanBarsLeavesTrailingChunksEmpty) {
  const auto chunks = Partitioner::split(randomBars(2), 4);
  ASSERT_EQ(chunks.size(), 4u);
  EXPECT_EQ(chunks[0].size(), 1u);
  EXPECT_EQ(chunks[1].size(), 1u);
  EXPECT_TRUE(chunks[2].empty());
  EXPECT_TRUE(chunks[3].empty());
}

TEST(PartitionerTest, SplitRejectsNonPositiveChunkCount) {
  EXPECT_THROW(Partitioner::split(randomBars(3), 0), std::invalid_argument);
}

// -----------------------------------------------------------------------------
// 3. run() returns one ledger per chunk, in chunk order, each starting from
//    balance_init.
// -----------------------------------------------------------------------------
TEST(PartitionerTest, RunReturnsShardLedgersInOrder) {
  const auto bars = randomBars(50, 11);
  Partitioner partitioner(defaultParams(), barsim_test::lambdaFactory(noOrders),
                          4);

  const auto ledgers = partitioner.run(bars, 5);
  ASSERT_EQ(ledgers.size(), 5u);

  std::int64_t expected_key = 0;
  for (const auto& ledger : ledgers) {
    ASSERT_EQ(ledger.size(), 10u);
    for (const auto& row : ledger.rows()) {
      EXPECT_EQ(row.key, expected_key++);
      EXPECT_DOUBLE_EQ(row.balance_quote, 100.0);
      EXPECT_DOUBLE_EQ(row.equity_quote, 100.0);
    }
  }
}

// -----------------------------------------------------------------------------
// 4. Each shard is driven by a fresh strategy instance.
// -----------------------------------------------------------------------------
TEST(PartitionerTest, EachShardGetsItsOwnStrategy) {
  std::atomic<int> created{0};
  auto factory = [&created]() -> std::unique_ptr<barsim::IStrategy> {
    created.fetch_add(1);
    return std::make_unique<barsim_test::LambdaStrategy>(noOrders);
  };

  Partitioner partitioner(defaultParams(), factory, 2);
  const auto ledgers = partitioner.run(randomBars(30), 6);
  EXPECT_EQ(ledgers.size(), 6u);
  EXPECT_EQ(created.load(), 6);
}

// -----------------------------------------------------------------------------
// 5. Shards with state: a strategy that buys once on its first bar. With one
//    instance per shard, every shard holds exactly one unit at the end.
// -----------------------------------------------------------------------------
TEST(PartitionerTest, ShardsDoNotShareStrategyState) {
  auto factory = []() -> std::unique_ptr<barsim::IStrategy> {
    auto bought = std::make_shared<bool>(false);
    return std::make_unique<barsim_test::LambdaStrategy>(
        [bought](const CloseData&, const Bar&) -> std::vector<OrderRequest> {
          if (*bought) return {};
          *bought = true;
          return {barsim::domain::MarketOrder{1.0}};
        });
  };

  Partitioner partitioner(defaultParams(), factory, 3);
  const auto ledgers = partitioner.run(randomBars(30, 5), 3);
  ASSERT_EQ(ledgers.size(), 3u);
  for (const auto& ledger : ledgers) {
    EXPECT_DOUBLE_EQ(ledger.rows().back().position, 1.0);
    EXPECT_EQ(ledger.totalOrderCount(), 1u);
  }
}

TEST(PartitionerTest, EmptyChunksProduceEmptyLedgers) {
  Partitioner partitioner(defaultParams(), barsim_test::lambdaFactory(noOrders),
                          4);
  const auto ledgers = partitioner.run(randomBars(2), 4);
  ASSERT_EQ(ledgers.size(), 4u);
  EXPECT_EQ(ledgers[0].size(), 1u);
  EXPECT_EQ(ledgers[1].size(), 1u);
  EXPECT_TRUE(ledgers[2].empty());
  EXPECT_TRUE(ledgers[3].empty());
}

// -----------------------------------------------------------------------------
// 6. A shard that throws aborts the run; no partial result.
// -----------------------------------------------------------------------------
TEST(PartitionerTest, FailingShardFailsTheRun) {
  auto fn = [](const CloseData& data, const Bar&) -> std::vector<OrderRequest> {
    if (data.index == 25) {
      throw std::runtime_error("strategy failure at 25");
    }
    return {};
  };
  Partitioner partitioner(defaultParams(), barsim_test::lambdaFactory(fn), 4);

  try {
    partitioner.run(randomBars(40), 4);
    FAIL() << "expected the shard exception to propagate";
  } catch (const std::runtime_error& e) {
    EXPECT_STREQ(e.what(), "strategy failure at 25");
  }
}

TEST(PartitionerTest, EmptyFactoryIsRejected) {
  EXPECT_THROW(Partitioner(defaultParams(), barsim::StrategyFactory{}, 2),
               std::invalid_argument);
}
