#include <gtest/gtest.h>

#include "exceptions.hpp"
#include "portfolio.hpp"
#include "test_helpers.hpp"

using backtester::FillAction;
using backtester::Portfolio;
using core::Decimal;
using core::OrderSide;
using test_helpers::D;
using test_helpers::makeBar;
using test_helpers::makeFilledOrder;

class PortfolioTest : public ::testing::Test {
protected:
    Portfolio portfolio{Decimal(100000)};
};

// ===========================================================================
// Construction
// ===========================================================================

TEST(PortfolioConstructionTest, RequiresPositiveCapital) {
    EXPECT_THROW(Portfolio(Decimal{}), core::ConfigException);
    EXPECT_THROW(Portfolio(D("-5")), core::ConfigException);
}

TEST_F(PortfolioTest, StartsAllCash) {
    EXPECT_EQ(portfolio.getCash(), Decimal(100000));
    EXPECT_EQ(portfolio.getPortfolioValue(), Decimal(100000));
    EXPECT_EQ(portfolio.getOpenPositionCount(), 0u);
    EXPECT_TRUE(portfolio.getClosedTrades().empty());
}

// ===========================================================================
// Round trips
// ===========================================================================

TEST_F(PortfolioTest, LongRoundTripNetPnl) {
    auto entry = makeFilledOrder("AAPL", OrderSide::Buy, 100, "150.03", "0.50", "2024-03-04", D("148.53"));
    auto opened = portfolio.applyFill(entry);
    EXPECT_EQ(opened.action, FillAction::Opened);
    EXPECT_FALSE(opened.trade);
    EXPECT_EQ(portfolio.getCash(), D("84996.50"));

    const core::Position* position = portfolio.getPosition("AAPL");
    ASSERT_NE(position, nullptr);
    EXPECT_EQ(position->side, core::PositionSide::Long);
    EXPECT_EQ(position->risk_amount, Decimal(150));
    EXPECT_EQ(portfolio.getPortfolioValue(), D("99999.50"));

    auto exit = makeFilledOrder("AAPL", OrderSide::Sell, 100, "155.47", "0.50", "2024-03-11",
                                std::nullopt, std::string("take_profit"));
    auto closed = portfolio.applyFill(exit);
    EXPECT_EQ(closed.action, FillAction::Closed);
    ASSERT_TRUE(closed.trade);

    const core::Trade& trade = *closed.trade;
    EXPECT_EQ(trade.trade_id, "TRD-000001");
    EXPECT_EQ(trade.net_pnl, Decimal(543));
    EXPECT_EQ(trade.commission, Decimal(1));
    EXPECT_EQ(trade.gross_pnl, Decimal(544));
    EXPECT_EQ(trade.r_multiple, D("3.62"));
    EXPECT_EQ(trade.exit_reason, "take_profit");
    EXPECT_EQ(portfolio.getCash(), Decimal(100543));
    EXPECT_FALSE(portfolio.hasPosition("AAPL"));
    EXPECT_EQ(portfolio.getClosedTrades().size(), 1u);
}

TEST_F(PortfolioTest, PartialCloseAllocatesEntryCommission) {
    portfolio.applyFill(makeFilledOrder("AAPL", OrderSide::Buy, 100, "100", "1.00", "2024-03-04"));
    auto reduced = portfolio.applyFill(makeFilledOrder("AAPL", OrderSide::Sell, 40, "110", "0.40", "2024-03-05"));

    EXPECT_EQ(reduced.action, FillAction::Reduced);
    ASSERT_TRUE(reduced.trade);
    EXPECT_EQ(reduced.trade->quantity, 40);
    EXPECT_EQ(reduced.trade->net_pnl, D("399.2"));
    EXPECT_EQ(reduced.trade->exit_reason, "signal");
    EXPECT_EQ(portfolio.getCash(), D("94398.6"));

    const core::Position* position = portfolio.getPosition("AAPL");
    ASSERT_NE(position, nullptr);
    EXPECT_EQ(position->quantity, 60);
    EXPECT_EQ(position->total_commission, D("0.60"));
}

TEST_F(PortfolioTest, ShortRoundTrip) {
    portfolio.applyFill(makeFilledOrder("TSLA", OrderSide::Sell, 100, "50", "0.50", "2024-03-04", D("52")));
    EXPECT_EQ(portfolio.getPosition("TSLA")->side, core::PositionSide::Short);

    auto closed = portfolio.applyFill(makeFilledOrder("TSLA", OrderSide::Buy, 100, "45", "0.50", "2024-03-06"));
    ASSERT_TRUE(closed.trade);
    EXPECT_EQ(closed.trade->net_pnl, Decimal(499));
    EXPECT_EQ(closed.trade->r_multiple, D("2.495"));
    EXPECT_EQ(portfolio.getCash(), Decimal(100499));
}

TEST_F(PortfolioTest, ShortMarkedAgainstRisingPrice) {
    portfolio.applyFill(makeFilledOrder("TSLA", OrderSide::Sell, 100, "50", "0.50", "2024-03-04", D("52")));
    portfolio.markToMarket(makeBar("TSLA", "2024-03-05", "54", "56", "53", "55"));

    const core::Position* position = portfolio.getPosition("TSLA");
    EXPECT_EQ(position->unrealized_pnl, Decimal(-500));
    EXPECT_EQ(position->peak_price, Decimal(50));
    EXPECT_EQ(portfolio.getPortfolioValue(), D("99499.5"));
}

TEST_F(PortfolioTest, TradeWithoutStopHasZeroR) {
    portfolio.applyFill(makeFilledOrder("AAPL", OrderSide::Buy, 10, "100", "0", "2024-03-04"));
    auto closed = portfolio.applyFill(makeFilledOrder("AAPL", OrderSide::Sell, 10, "90", "0", "2024-03-05"));
    ASSERT_TRUE(closed.trade);
    EXPECT_EQ(closed.trade->net_pnl, Decimal(-100));
    EXPECT_TRUE(closed.trade->initial_risk.isZero());
    EXPECT_TRUE(closed.trade->r_multiple.isZero());
}

TEST_F(PortfolioTest, OversizedExitClosesOpenQuantityOnly) {
    portfolio.applyFill(makeFilledOrder("AAPL", OrderSide::Buy, 10, "100", "0", "2024-03-04"));
    auto closed = portfolio.applyFill(makeFilledOrder("AAPL", OrderSide::Sell, 25, "101", "0", "2024-03-05"));
    EXPECT_EQ(closed.action, FillAction::Closed);
    EXPECT_EQ(closed.trade->quantity, 10);
    EXPECT_EQ(portfolio.getOpenPositionCount(), 0u);
    EXPECT_EQ(portfolio.getCash(), Decimal(100010));
}

// ===========================================================================
// Increases, marks and rejections
// ===========================================================================

TEST_F(PortfolioTest, IncreaseAveragesEntryAndAddsRisk) {
    portfolio.applyFill(makeFilledOrder("AAPL", OrderSide::Buy, 100, "100", "0", "2024-03-04", D("98")));
    auto added = portfolio.applyFill(makeFilledOrder("AAPL", OrderSide::Buy, 100, "110", "0", "2024-03-05"));
    EXPECT_EQ(added.action, FillAction::Increased);

    const core::Position* position = portfolio.getPosition("AAPL");
    EXPECT_EQ(position->quantity, 200);
    EXPECT_EQ(position->average_entry_price, Decimal(105));
    EXPECT_EQ(position->risk_amount, Decimal(200 + 1200));
}

TEST_F(PortfolioTest, MarkToMarketTracksPeakAndOnlyTouchesSymbol) {
    portfolio.applyFill(makeFilledOrder("AAPL", OrderSide::Buy, 10, "100", "0", "2024-03-04"));
    portfolio.markToMarket(makeBar("AAPL", "2024-03-05", "104", "106", "103", "105"));
    portfolio.markToMarket(makeBar("AAPL", "2024-03-06", "103", "104", "101", "102"));
    portfolio.markToMarket(makeBar("MSFT", "2024-03-06", "400", "401", "399", "400"));

    const core::Position* position = portfolio.getPosition("AAPL");
    EXPECT_EQ(position->current_price, Decimal(102));
    EXPECT_EQ(position->peak_price, Decimal(105));
    EXPECT_EQ(position->unrealized_pnl, Decimal(20));
    EXPECT_FALSE(portfolio.hasPosition("MSFT"));
}

TEST_F(PortfolioTest, InsufficientCashIgnored) {
    auto result = portfolio.applyFill(makeFilledOrder("AAPL", OrderSide::Buy, 1000, "150", "5", "2024-03-04"));
    EXPECT_EQ(result.action, FillAction::Ignored);
    EXPECT_EQ(portfolio.getCash(), Decimal(100000));
    EXPECT_FALSE(portfolio.hasPosition("AAPL"));
}

TEST_F(PortfolioTest, UnfilledOrderIgnored) {
    auto order = makeFilledOrder("AAPL", OrderSide::Buy, 10, "150", "0", "2024-03-04");
    order.status = core::OrderStatus::Pending;
    EXPECT_EQ(portfolio.applyFill(order).action, FillAction::Ignored);
}

TEST_F(PortfolioTest, HeatIsRiskOverEquity) {
    portfolio.applyFill(makeFilledOrder("AAPL", OrderSide::Buy, 100, "150", "0", "2024-03-04", D("147")));
    EXPECT_EQ(portfolio.getTotalRiskAmount(), Decimal(300));
    EXPECT_EQ(portfolio.getPortfolioHeat(portfolio.getPortfolioValue()), D("0.3"));
    EXPECT_TRUE(portfolio.getPortfolioHeat(Decimal()).isZero());
}

TEST_F(PortfolioTest, CostTotalsAccumulate) {
    auto entry = makeFilledOrder("AAPL", OrderSide::Buy, 100, "150.0303", "0.50", "2024-03-04");
    entry.slippage = D("0.0303");
    portfolio.applyFill(entry);
    auto exit = makeFilledOrder("AAPL", OrderSide::Sell, 100, "151.9697", "0.50", "2024-03-05");
    exit.slippage = D("0.0303");
    auto closed = portfolio.applyFill(exit);

    EXPECT_EQ(portfolio.getTotalCommission(), Decimal(1));
    EXPECT_EQ(portfolio.getTotalSlippage(), D("6.06"));
    ASSERT_TRUE(closed.trade);
    EXPECT_EQ(closed.trade->slippage, D("6.06"));
    EXPECT_EQ(closed.trade->gross_pnl, closed.trade->net_pnl + Decimal(1) + D("6.06"));
}
