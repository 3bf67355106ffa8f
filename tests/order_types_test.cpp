// =============================================================================
// order_types_test.cpp
// =============================================================================
// Unit tests for the value types in barsim::domain: OrderRequest,
// FinishedOrder, FeeRate, Bar and BarTable.
// =============================================================================

#include "barsim/domain/bar.hpp"
#include "barsim/domain/fee_rate.hpp"
#include "barsim/domain/finished_order.hpp"
#include "barsim/domain/order_request.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <stdexcept>

using namespace barsim::domain;

// -----------------------------------------------------------------------------
// OrderRequest
// -----------------------------------------------------------------------------
TEST(OrderRequestTest, ScaledMultipliesSizeOnly) {
  const LimitOrder limit{-2.0, 95.0, true};
  EXPECT_EQ(limit.scaled(1.5), (LimitOrder{-3.0, 95.0, true}));
  EXPECT_EQ(MarketOrder{4.0}.scaled(0.25), MarketOrder{1.0});

  const OrderRequest request = limit;
  const OrderRequest out = scaled(request, 2.0);
  ASSERT_TRUE(std::holds_alternative<LimitOrder>(out));
  EXPECT_DOUBLE_EQ(orderSize(out), -4.0);
}

TEST(OrderRequestTest, ScaleByZeroGivesZeroSizeOrder) {
  EXPECT_DOUBLE_EQ(orderSize(scaled(OrderRequest{MarketOrder{3.0}}, 0.0)), 0.0);
}

TEST(OrderRequestTest, NegativeScaleIsRejected) {
  EXPECT_THROW(MarketOrder{1.0}.scaled(-1.0), std::invalid_argument);
  EXPECT_THROW((LimitOrder{1.0, 2.0, false}.scaled(-0.5)),
               std::invalid_argument);
  EXPECT_THROW(scaled(OrderRequest{MarketOrder{1.0}},
                      std::numeric_limits<double>::quiet_NaN()),
               std::invalid_argument);
}

TEST(OrderRequestTest, DescribeNamesKindAndFields) {
  EXPECT_EQ(describe(MarketOrder{2.0}), "Market(size=2)");
  EXPECT_EQ(describe(LimitOrder{1.0, 95.0, false}),
            "Limit(size=1, price=95, post_only=false)");
}

// -----------------------------------------------------------------------------
// FinishedOrder
// -----------------------------------------------------------------------------
TEST(FinishedOrderTest, FilledOnlyForFillStates) {
  FinishedOrder order;
  order.state = FinishedOrderState::FilledTaker;
  EXPECT_TRUE(order.filled());
  order.state = FinishedOrderState::FilledMaker;
  EXPECT_TRUE(order.filled());
  order.state = FinishedOrderState::CancelledNotFilled;
  EXPECT_FALSE(order.filled());
  order.state = FinishedOrderState::CancelledPostOnly;
  EXPECT_FALSE(order.filled());
}

TEST(FinishedOrderTest, ScaledScalesAmountsButNotPrice) {
  FinishedOrder order;
  order.time_index = 3;
  order.order = LimitOrder{1.0, 95.0, false};
  order.balance_decrement = 95.095;
  order.fee = 0.095;
  order.executed_price = 95.0;
  order.quote_size = 95.0;
  order.state = FinishedOrderState::FilledMaker;

  const FinishedOrder out = order.scaled(2.0);
  EXPECT_EQ(out.time_index, 3);
  EXPECT_DOUBLE_EQ(orderSize(out.order), 2.0);
  EXPECT_DOUBLE_EQ(out.balance_decrement, 190.19);
  EXPECT_DOUBLE_EQ(out.fee, 0.19);
  EXPECT_DOUBLE_EQ(out.quote_size, 190.0);
  EXPECT_DOUBLE_EQ(*out.executed_price, 95.0);
  EXPECT_EQ(out.state, FinishedOrderState::FilledMaker);

  EXPECT_THROW(order.scaled(-2.0), std::invalid_argument);
}

TEST(FinishedOrderTest, StateNames) {
  EXPECT_STREQ(toString(FinishedOrderState::FilledTaker), "FilledTaker");
  EXPECT_STREQ(toString(FinishedOrderState::CancelledPostOnly),
               "CancelledPostOnly");
}

// -----------------------------------------------------------------------------
// FeeRate
// -----------------------------------------------------------------------------
TEST(FeeRateTest, CombineKeepsEqualRatesAndMarksDifferentOnesMixed) {
  const auto a = FeeRate::known(0.001);
  const auto b = FeeRate::known(0.002);

  EXPECT_EQ(FeeRate::combine(a, a), a);
  EXPECT_DOUBLE_EQ(FeeRate::combine(a, a).value(), 0.001);

  const auto mixed = FeeRate::combine(a, b);
  EXPECT_TRUE(mixed.isMixed());
  EXPECT_THROW(mixed.value(), std::logic_error);

  // Once mixed, always mixed.
  EXPECT_TRUE(FeeRate::combine(mixed, a).isMixed());
  EXPECT_TRUE(FeeRate::combine(mixed, FeeRate::mixed()).isMixed());
}

// -----------------------------------------------------------------------------
// Bar / BarTable
// -----------------------------------------------------------------------------
TEST(BarTest, FieldLooksUpExtraColumns) {
  Bar bar;
  bar.extra["signal"] = 1.0;
  EXPECT_DOUBLE_EQ(bar.field("signal"), 1.0);
  EXPECT_THROW(bar.field("atr"), std::out_of_range);
}

TEST(BarTableTest, AddColumnChecksLength) {
  BarTable table;
  table.keys = {1, 2, 3};
  table.addColumn("open", {1.0, 2.0, 3.0});
  EXPECT_THROW(table.addColumn("close", {1.0}), std::invalid_argument);
  ASSERT_NE(table.column("open"), nullptr);
  EXPECT_EQ(table.column("close"), nullptr);
}

TEST(BarTableTest, FromBarsCarriesExtrasAndFillsMissingWithNaN) {
  Bar first;
  first.key = 10;
  first.open = first.high = first.low = first.close = 1.0;
  first.extra["signal"] = 1.0;
  Bar second = first;
  second.key = 11;
  second.extra.clear();

  const BarTable table = BarTable::fromBars({first, second});
  EXPECT_EQ(table.size(), 2u);
  ASSERT_NE(table.column("close"), nullptr);
  const auto* signal = table.column("signal");
  ASSERT_NE(signal, nullptr);
  EXPECT_DOUBLE_EQ((*signal)[0], 1.0);
  EXPECT_TRUE(std::isnan((*signal)[1]));
}
