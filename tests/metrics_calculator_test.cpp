#include <gtest/gtest.h>

#include "metrics_calculator.hpp"
#include "test_helpers.hpp"

using backtester::MetricsCalculator;
using core::Decimal;
using test_helpers::D;
using test_helpers::makeCurve;

namespace {

    core::Trade trade(const std::string& net_pnl, const std::string& risk = "0") {
        core::Trade t;
        t.symbol = "AAPL";
        t.net_pnl = D(net_pnl);
        t.initial_risk = D(risk);
        if (t.initial_risk.isPositive()) {
            t.r_multiple = t.net_pnl / t.initial_risk;
        }
        return t;
    }

} // end anonymous namespace

// ===========================================================================
// Equity-based metrics
// ===========================================================================

TEST(MetricsCalculatorTest, DrawdownAndDurationRecovering) {
    auto stats = MetricsCalculator::drawdown(makeCurve({"100", "90", "95", "110"}));
    EXPECT_EQ(stats.max_drawdown, D("0.1"));
    EXPECT_EQ(stats.max_duration_bars, 2);
}

TEST(MetricsCalculatorTest, DrawdownDurationResetsAtNewPeak) {
    auto stats = MetricsCalculator::drawdown(makeCurve({"100", "90", "95", "100", "80"}));
    EXPECT_EQ(stats.max_drawdown, D("0.2"));
    EXPECT_EQ(stats.max_duration_bars, 2);
}

TEST(MetricsCalculatorTest, DrawdownBoundedByOne) {
    auto stats = MetricsCalculator::drawdown(makeCurve({"100", "0", "50"}));
    EXPECT_EQ(stats.max_drawdown, Decimal(1));
}

TEST(MetricsCalculatorTest, MonotoneCurveHasNoDrawdown) {
    auto stats = MetricsCalculator::drawdown(makeCurve({"100", "101", "102"}));
    EXPECT_TRUE(stats.max_drawdown.isZero());
    EXPECT_EQ(stats.max_duration_bars, 0);
    EXPECT_TRUE(MetricsCalculator::drawdown({}).max_drawdown.isZero());
}

TEST(MetricsCalculatorTest, SharpeFromPeriodReturns) {
    Decimal sharpe = MetricsCalculator::sharpeRatio(makeCurve({"100000", "101000", "103020", "102504.9"}));
    EXPECT_NEAR(sharpe.toDouble(), 10.413, 1e-3);
}

TEST(MetricsCalculatorTest, SharpeNeedsTwoReturnsAndVariance) {
    EXPECT_TRUE(MetricsCalculator::sharpeRatio(makeCurve({"100", "110"})).isZero());
    EXPECT_TRUE(MetricsCalculator::sharpeRatio(makeCurve({"100", "100", "100"})).isZero());
}

TEST(MetricsCalculatorTest, CagrAndTotalReturn) {
    EXPECT_EQ(MetricsCalculator::cagr(Decimal(100000), Decimal(121000), 2.0), D("0.1"));
    EXPECT_TRUE(MetricsCalculator::cagr(Decimal(100000), Decimal(121000), 0.0).isZero());
    EXPECT_TRUE(MetricsCalculator::cagr(Decimal(100000), Decimal(), 1.0).isZero());
    EXPECT_EQ(MetricsCalculator::totalReturnPct(Decimal(100000), Decimal(100750)), D("0.75"));
    EXPECT_TRUE(MetricsCalculator::totalReturnPct(Decimal(), Decimal(10)).isZero());
}

// ===========================================================================
// Trade-based metrics
// ===========================================================================

TEST(MetricsCalculatorTest, ZeroPnlTradeCountsInNeitherBucket) {
    auto metrics = MetricsCalculator::calculate(makeCurve({"100000", "100050"}),
                                                {trade("100"), trade("-50"), trade("0")}, Decimal(100000));
    EXPECT_EQ(metrics.total_trades, 3);
    EXPECT_EQ(metrics.winning_trades, 1);
    EXPECT_EQ(metrics.losing_trades, 1);
    EXPECT_EQ(metrics.win_rate, D("0.33333333"));
    EXPECT_EQ(metrics.total_pnl, Decimal(50));
    EXPECT_EQ(metrics.avg_win_pnl, Decimal(100));
    EXPECT_EQ(metrics.avg_loss_pnl, Decimal(-50));
}

TEST(MetricsCalculatorTest, ProfitFactorAndAverageR) {
    auto metrics = MetricsCalculator::calculate(makeCurve({"100000", "100200"}),
                                                {trade("300", "100"), trade("100"), trade("-200", "100")},
                                                Decimal(100000));
    EXPECT_EQ(metrics.profit_factor, Decimal(2));
    // The unrisked trade is left out of the R average
    EXPECT_EQ(metrics.average_r_multiple, D("0.5"));
}

TEST(MetricsCalculatorTest, NoLossesMeansZeroProfitFactor) {
    auto metrics = MetricsCalculator::calculate(makeCurve({"100000", "100100"}), {trade("100")}, Decimal(100000));
    EXPECT_TRUE(metrics.profit_factor.isZero());
    EXPECT_EQ(metrics.win_rate, Decimal(1));
}

TEST(MetricsCalculatorTest, EmptyInputsAreAllZero) {
    auto metrics = MetricsCalculator::calculate({}, {}, Decimal(100000));
    EXPECT_EQ(metrics.total_trades, 0);
    EXPECT_TRUE(metrics.win_rate.isZero());
    EXPECT_TRUE(metrics.sharpe_ratio.isZero());
    EXPECT_EQ(metrics.final_equity, Decimal(100000));
    EXPECT_TRUE(metrics.total_return_pct.isZero());
}

TEST(MetricsCalculatorTest, MetricsJsonUsesDecimalStrings) {
    auto metrics = MetricsCalculator::calculate(makeCurve({"100000", "100750"}), {trade("750", "200")},
                                                Decimal(100000));
    nlohmann::json j = metrics.toJson();
    EXPECT_EQ(j.at("win_rate").get<std::string>(), "1");
    EXPECT_EQ(j.at("average_r_multiple").get<std::string>(), "3.75");
    EXPECT_EQ(j.at("total_trades").get<int>(), 1);
}

// ===========================================================================
// Cost summary
// ===========================================================================

TEST(MetricsCalculatorTest, CostSummaryAveragesAndDegradation) {
    core::Trade a = trade("744.85", "200");
    a.commission = D("1.00");
    a.slippage = D("4.15");
    a.gross_pnl = D("750");
    a.gross_r_multiple = D("3.75");
    core::Trade b = trade("-101", "100");
    b.commission = D("1.00");
    b.slippage = D("0");
    b.gross_pnl = D("-100");
    b.gross_r_multiple = D("-1");

    auto summary = MetricsCalculator::calculateCostSummary({a, b});
    EXPECT_EQ(summary.total_trades, 2);
    EXPECT_EQ(summary.total_commission, Decimal(2));
    EXPECT_EQ(summary.total_slippage, D("4.15"));
    EXPECT_EQ(summary.total_transaction_costs, D("6.15"));
    EXPECT_EQ(summary.avg_transaction_cost_per_trade, D("3.075"));
    EXPECT_EQ(summary.gross_avg_r_multiple, D("1.375"));
    EXPECT_EQ(summary.net_avg_r_multiple, D("1.357125"));
    EXPECT_EQ(summary.r_multiple_degradation, D("0.017875"));
}

// ===========================================================================
// Properties
// ===========================================================================

TEST(MetricsCalculatorTest, ZeroTradesStillMeasureDrawdown) {
    auto metrics = MetricsCalculator::calculate(makeCurve({"100000", "95000", "97000"}), {}, Decimal(100000));
    EXPECT_TRUE(metrics.win_rate.isZero());
    EXPECT_TRUE(metrics.average_r_multiple.isZero());
    EXPECT_TRUE(metrics.profit_factor.isZero());
    EXPECT_EQ(metrics.max_drawdown, D("0.05"));
    EXPECT_EQ(metrics.max_drawdown_duration_bars, 2);
}

TEST(MetricsCalculatorTest, RecomputationIsIdentical) {
    auto curve = makeCurve({"100000", "101000", "99500", "102250", "101900"});
    std::vector<core::Trade> trades = {trade("1000", "500"), trade("-1500", "500"), trade("2750", "500")};
    auto first = MetricsCalculator::calculate(curve, trades, Decimal(100000));
    auto second = MetricsCalculator::calculate(curve, trades, Decimal(100000));
    EXPECT_EQ(first.toJson(), second.toJson());
}
