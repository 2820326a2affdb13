#include <gtest/gtest.h>

#include "exceptions.hpp"
#include "order_simulator.hpp"
#include "test_helpers.hpp"

using backtester::CostModel;
using backtester::OrderRequest;
using backtester::OrderSimulator;
using core::Decimal;
using core::OrderSide;
using core::OrderStatus;
using core::OrderType;
using test_helpers::D;
using test_helpers::makeBar;

class OrderSimulatorTest : public ::testing::Test {
protected:
    OrderSimulator simulator{CostModel()};
    core::Bar day1 = makeBar("AAPL", "2024-03-01", "150.00", "151.00", "149.00", "150.50", 48000);
    core::Bar day2 = makeBar("AAPL", "2024-03-04", "151.50", "152.40", "150.90", "152.00", 48000);
    Decimal liquid_avg = D("2000000");
};

// ===========================================================================
// Submission
// ===========================================================================

TEST_F(OrderSimulatorTest, SubmitQueuesPendingOrder) {
    core::Order order = simulator.submit("AAPL", OrderType::Market, OrderSide::Buy, 100, day1);
    EXPECT_EQ(order.order_id, "ORD-000001");
    EXPECT_EQ(order.status, OrderStatus::Pending);
    EXPECT_EQ(order.created_timestamp, day1.timestamp);
    EXPECT_FALSE(order.fill_price);
    EXPECT_EQ(simulator.getPendingCount(), 1u);
    EXPECT_TRUE(simulator.hasPendingOrder("AAPL"));
    EXPECT_FALSE(simulator.hasPendingExit("AAPL"));

    core::Order second = simulator.submit("MSFT", OrderType::Market, OrderSide::Sell, 5, day1);
    EXPECT_EQ(second.order_id, "ORD-000002");
}

TEST_F(OrderSimulatorTest, InvalidOrdersThrow) {
    EXPECT_THROW(simulator.submit("AAPL", OrderType::Market, OrderSide::Buy, 0, day1), core::OrderException);
    EXPECT_THROW(simulator.submit("AAPL", OrderType::Limit, OrderSide::Buy, 10, day1), core::OrderException);
    EXPECT_THROW(simulator.submit("AAPL", OrderType::Limit, OrderSide::Buy, 10, day1, D("0")), core::OrderException);
    EXPECT_EQ(simulator.getPendingCount(), 0u);
}

TEST_F(OrderSimulatorTest, FullQueueRejects) {
    OrderSimulator small(CostModel(), 1);
    EXPECT_EQ(small.submit("AAPL", OrderType::Market, OrderSide::Buy, 1, day1).status, OrderStatus::Pending);
    core::Order rejected = small.submit("AAPL", OrderType::Market, OrderSide::Buy, 1, day1);
    EXPECT_EQ(rejected.status, OrderStatus::Rejected);
    EXPECT_EQ(small.getPendingCount(), 1u);
}

TEST(OrderSimulatorConfigTest, ZeroQueueCapacityIsConfigError) {
    EXPECT_THROW(OrderSimulator(CostModel(), 0), core::ConfigException);
}

// ===========================================================================
// Fills
// ===========================================================================

TEST_F(OrderSimulatorTest, MarketOrderFillsAtNextOpenPlusSlippage) {
    simulator.submit("AAPL", OrderType::Market, OrderSide::Buy, 100, day1);
    auto fills = simulator.fillPending(day2, liquid_avg);

    ASSERT_EQ(fills.size(), 1u);
    const core::Order& fill = fills.front();
    EXPECT_EQ(fill.status, OrderStatus::Filled);
    EXPECT_EQ(*fill.fill_price, D("151.5303"));
    EXPECT_EQ(fill.slippage, D("0.0303"));
    EXPECT_EQ(fill.commission, D("0.50"));
    EXPECT_EQ(*fill.fill_timestamp, day2.timestamp);
    EXPECT_EQ(simulator.getPendingCount(), 0u);
}

TEST_F(OrderSimulatorTest, NoFillOnCreationBar) {
    simulator.submit("AAPL", OrderType::Market, OrderSide::Buy, 100, day1);
    EXPECT_TRUE(simulator.fillPending(day1, liquid_avg).empty());
    EXPECT_EQ(simulator.getPendingCount(), 1u);
}

TEST_F(OrderSimulatorTest, OtherSymbolBarDoesNotFill) {
    simulator.submit("AAPL", OrderType::Market, OrderSide::Buy, 100, day1);
    core::Bar msft = makeBar("MSFT", "2024-03-04", "400", "401", "399", "400");
    EXPECT_TRUE(simulator.fillPending(msft, liquid_avg).empty());
    EXPECT_TRUE(simulator.hasPendingOrder("AAPL"));
}

TEST_F(OrderSimulatorTest, BuyLimitFillsAtLimitWhenLowTouches) {
    simulator.submit("AAPL", OrderType::Limit, OrderSide::Buy, 100, day1, D("151.00"));
    auto fills = simulator.fillPending(day2, liquid_avg);
    ASSERT_EQ(fills.size(), 1u);
    EXPECT_EQ(*fills.front().fill_price, D("151.00"));
    EXPECT_TRUE(fills.front().slippage.isZero());
    EXPECT_EQ(fills.front().commission, D("0.50"));
}

TEST_F(OrderSimulatorTest, UntouchedLimitStaysPending) {
    simulator.submit("AAPL", OrderType::Limit, OrderSide::Buy, 100, day1, D("150.00"));
    simulator.submit("AAPL", OrderType::Limit, OrderSide::Sell, 100, day1, D("153.00"));
    EXPECT_TRUE(simulator.fillPending(day2, liquid_avg).empty());
    EXPECT_EQ(simulator.getPendingCount(), 2u);
}

TEST_F(OrderSimulatorTest, SellLimitFillsWhenHighTouches) {
    simulator.submit("AAPL", OrderType::Limit, OrderSide::Sell, 100, day1, D("152.40"));
    auto fills = simulator.fillPending(day2, liquid_avg);
    ASSERT_EQ(fills.size(), 1u);
    EXPECT_EQ(*fills.front().fill_price, D("152.40"));
}

TEST_F(OrderSimulatorTest, FillsReturnInSubmissionOrder) {
    simulator.submit("AAPL", OrderType::Market, OrderSide::Buy, 10, day1);
    simulator.submit("AAPL", OrderType::Limit, OrderSide::Buy, 10, day1, D("140"));
    simulator.submit("AAPL", OrderType::Market, OrderSide::Sell, 20, day1);
    auto fills = simulator.fillPending(day2, liquid_avg);
    ASSERT_EQ(fills.size(), 2u);
    EXPECT_EQ(fills[0].order_id, "ORD-000001");
    EXPECT_EQ(fills[1].order_id, "ORD-000003");
    EXPECT_EQ(simulator.getPendingCount(), 1u);
}

TEST_F(OrderSimulatorTest, ExitOrdersAreTracked) {
    OrderRequest request;
    request.symbol = "AAPL";
    request.side = OrderSide::Sell;
    request.quantity = 100;
    request.exit_reason = "stop_loss";
    core::Order order = simulator.submit(request, day1);
    EXPECT_EQ(*order.exit_reason, "stop_loss");
    EXPECT_TRUE(simulator.hasPendingExit("AAPL"));
}

TEST_F(OrderSimulatorTest, CancelAllRejectsEverything) {
    simulator.submit("AAPL", OrderType::Market, OrderSide::Buy, 10, day1);
    simulator.submit("MSFT", OrderType::Market, OrderSide::Buy, 10, day1);
    auto cancelled = simulator.cancelAll();
    ASSERT_EQ(cancelled.size(), 2u);
    for (const auto& order : cancelled) {
        EXPECT_EQ(order.status, OrderStatus::Rejected);
        EXPECT_FALSE(order.fill_price);
    }
    EXPECT_EQ(simulator.getPendingCount(), 0u);
}
