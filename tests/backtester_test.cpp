#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

#include "backtester.hpp"
#include "exceptions.hpp"
#include "position_sizer.hpp"
#include "scheduled_signal_source.hpp"
#include "test_helpers.hpp"
#include "utils.hpp"

using backtester::Backtester;
using backtester::BacktestConfig;
using backtester::BacktestResult;
using backtester::CandidateSignal;
using backtester::FixedRiskPositionSizer;
using backtester::ProgressUpdate;
using backtester::ScheduledSignalSource;
using core::Decimal;
using test_helpers::D;
using test_helpers::makeBar;
using test_helpers::ts;

namespace {

    // Five daily bars: entry signal on the first, a 7% rally on the third
    std::vector<core::Bar> rallyBars() {
        return {
            makeBar("AAPL", "2024-01-02", "100", "101", "99", "100"),
            makeBar("AAPL", "2024-01-03", "100", "102", "99.5", "101"),
            makeBar("AAPL", "2024-01-04", "101", "107.5", "100.5", "107"),
            makeBar("AAPL", "2024-01-05", "107.5", "108", "106", "107"),
            makeBar("AAPL", "2024-01-08", "107", "108", "106", "107.5"),
        };
    }

    CandidateSignal longSignal(const std::string& stop, long long size_hint) {
        CandidateSignal signal;
        signal.symbol = "AAPL";
        signal.side = core::PositionSide::Long;
        signal.initial_stop = D(stop);
        signal.size_hint = size_hint;
        signal.pattern = "SPRING";
        return signal;
    }

    class RecordingNotifier : public backtester::IProgressNotifier {
    public:
        void onProgress(const ProgressUpdate& update) override { updates.push_back(update); }
        std::vector<ProgressUpdate> updates;
    };

    class CancellingNotifier : public backtester::IProgressNotifier {
    public:
        void onProgress(const ProgressUpdate&) override {
            if (target) target->cancel();
        }
        Backtester* target = nullptr;
    };

    class ThrowingNotifier : public backtester::IProgressNotifier {
    public:
        void onProgress(const ProgressUpdate&) override { throw std::runtime_error("notifier down"); }
    };

    class NonStandardThrowingNotifier : public backtester::IProgressNotifier {
    public:
        void onProgress(const ProgressUpdate&) override { throw 42; }
    };

    class ThrowingSignalSource : public backtester::ISignalSource {
    public:
        std::vector<CandidateSignal> generate(size_t, const std::vector<core::Bar>&) override {
            throw std::runtime_error("detector crashed");
        }
        std::string getName() const override { return "Throwing"; }
    };

} // end anonymous namespace

class BacktesterTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.apply_costs = false;
        source.add(ts("2024-01-02"), longSignal("98", 100));
    }

    ScheduledSignalSource source;
    FixedRiskPositionSizer sizer;
    BacktestConfig config;
};

// ===========================================================================
// End-to-end runs
// ===========================================================================

TEST_F(BacktesterTest, TakeProfitRoundTripWithoutCosts) {
    Backtester backtester(config, source, sizer);
    BacktestResult result = backtester.run(rallyBars());

    EXPECT_FALSE(result.cancelled);
    EXPECT_EQ(result.bars_processed, 5u);
    EXPECT_EQ(result.skipped_bars, 0u);
    ASSERT_EQ(result.trades.size(), 1u);

    const core::Trade& trade = result.trades.front();
    EXPECT_EQ(trade.quantity, 100);
    EXPECT_EQ(trade.entry_price, Decimal(100));
    EXPECT_EQ(trade.exit_price, D("107.5"));
    EXPECT_EQ(trade.entry_timestamp, ts("2024-01-03"));
    EXPECT_EQ(trade.exit_timestamp, ts("2024-01-05"));
    EXPECT_EQ(trade.net_pnl, Decimal(750));
    EXPECT_EQ(trade.r_multiple, D("3.75"));
    EXPECT_EQ(trade.exit_reason, "take_profit");

    ASSERT_EQ(result.orders.size(), 2u);
    for (const auto& order : result.orders) {
        EXPECT_EQ(order.status, core::OrderStatus::Filled);
        ASSERT_TRUE(order.fill_timestamp);
        EXPECT_GT(*order.fill_timestamp, order.created_timestamp);
    }

    ASSERT_EQ(result.equity_curve.size(), 5u);
    EXPECT_EQ(result.equity_curve[0].portfolio_value, Decimal(100000));
    EXPECT_EQ(result.equity_curve[1].portfolio_value, Decimal(100100));
    EXPECT_EQ(result.equity_curve[2].portfolio_value, Decimal(100700));
    EXPECT_EQ(result.equity_curve.back().portfolio_value, Decimal(100750));
    EXPECT_TRUE(result.open_positions.empty());

    EXPECT_EQ(result.metrics.total_trades, 1);
    EXPECT_EQ(result.metrics.win_rate, Decimal(1));
    EXPECT_EQ(result.metrics.total_return_pct, D("0.75"));
    EXPECT_FALSE(result.cost_summary);
}

TEST_F(BacktesterTest, CostsReduceNetButNotGross) {
    config.apply_costs = true;
    Backtester backtester(config, source, sizer);
    BacktestResult result = backtester.run(rallyBars());

    ASSERT_EQ(result.trades.size(), 1u);
    const core::Trade& trade = result.trades.front();
    EXPECT_EQ(trade.entry_price, D("100.02"));
    EXPECT_EQ(trade.exit_price, D("107.4785"));
    EXPECT_EQ(trade.net_pnl, D("744.85"));
    EXPECT_EQ(trade.slippage, D("4.15"));
    EXPECT_EQ(trade.commission, Decimal(1));
    EXPECT_EQ(trade.gross_pnl, Decimal(750));

    ASSERT_TRUE(result.cost_summary);
    EXPECT_EQ(result.cost_summary->total_transaction_costs, D("5.15"));
    EXPECT_TRUE(result.cost_summary->r_multiple_degradation.isPositive());
}

TEST_F(BacktesterTest, EquityCurveMatchesFinalPortfolio) {
    Backtester backtester(config, source, sizer);
    BacktestResult result = backtester.run(rallyBars());
    EXPECT_EQ(result.metrics.final_equity, result.equity_curve.back().portfolio_value);
    for (size_t i = 1; i < result.equity_curve.size(); ++i) {
        EXPECT_LT(result.equity_curve[i - 1].timestamp, result.equity_curve[i].timestamp);
    }
}

TEST_F(BacktesterTest, RerunIsDeterministic) {
    Backtester backtester(config, source, sizer);
    BacktestResult first = backtester.run(rallyBars());
    BacktestResult second = backtester.run(rallyBars());
    EXPECT_NE(first.run_id, second.run_id);
    nlohmann::json a = first.toJson();
    nlohmann::json b = second.toJson();
    a.erase("run_id");
    b.erase("run_id");
    EXPECT_EQ(a, b);
}

TEST_F(BacktesterTest, NoSignalsNoTrades) {
    ScheduledSignalSource empty;
    Backtester backtester(config, empty, sizer);
    BacktestResult result = backtester.run(rallyBars());
    EXPECT_TRUE(result.trades.empty());
    EXPECT_TRUE(result.orders.empty());
    EXPECT_EQ(result.equity_curve.size(), 5u);
    EXPECT_EQ(result.metrics.final_equity, Decimal(100000));
}

// ===========================================================================
// Entry gating
// ===========================================================================

TEST_F(BacktesterTest, StopOnWrongSideIsIgnored) {
    ScheduledSignalSource bad;
    bad.add(ts("2024-01-02"), longSignal("101", 100));
    Backtester backtester(config, bad, sizer);
    BacktestResult result = backtester.run(rallyBars());
    EXPECT_TRUE(result.orders.empty());
    EXPECT_TRUE(result.trades.empty());
}

TEST_F(BacktesterTest, HeatBudgetCapsQuantity) {
    // 1% heat on 100,000 is 1,000 of risk; a 2.00 stop distance allows 500 shares
    config.max_portfolio_heat_pct = Decimal(1);
    ScheduledSignalSource big;
    big.add(ts("2024-01-02"), longSignal("98", 5000));
    Backtester backtester(config, big, sizer);
    BacktestResult result = backtester.run(rallyBars());
    ASSERT_FALSE(result.orders.empty());
    EXPECT_EQ(result.orders.front().quantity, 500);
}

TEST_F(BacktesterTest, PendingOrderAtEndIsRejected) {
    auto bars = rallyBars();
    ScheduledSignalSource late;
    late.add(ts("2024-01-08"), longSignal("105", 10));
    Backtester backtester(config, late, sizer);
    BacktestResult result = backtester.run(bars);
    ASSERT_EQ(result.orders.size(), 1u);
    EXPECT_EQ(result.orders.front().status, core::OrderStatus::Rejected);
    EXPECT_TRUE(result.open_positions.empty());
}

TEST_F(BacktesterTest, OpenPositionReportedAtEnd) {
    auto bars = rallyBars();
    bars.resize(2);
    Backtester backtester(config, source, sizer);
    BacktestResult result = backtester.run(bars);
    EXPECT_TRUE(result.trades.empty());
    ASSERT_EQ(result.open_positions.size(), 1u);
    EXPECT_EQ(result.open_positions.front().quantity, 100);
}

// ===========================================================================
// Data quality
// ===========================================================================

TEST_F(BacktesterTest, InvalidAndOutOfOrderBarsAreSkipped) {
    auto bars = rallyBars();
    bars.insert(bars.begin() + 1, makeBar("AAPL", "2024-01-02", "100", "101", "99", "100"));  // duplicate timestamp
    bars.insert(bars.begin() + 2, makeBar("AAPL", "2024-01-02T12:00:00Z", "100", "98", "99", "99")); // high < low
    Backtester backtester(config, source, sizer);
    BacktestResult result = backtester.run(bars);
    EXPECT_EQ(result.skipped_bars, 2u);
    EXPECT_EQ(result.bars_processed, 5u);
    EXPECT_EQ(result.equity_curve.size(), 5u);
    EXPECT_EQ(result.trades.size(), 1u);
}

// ===========================================================================
// Cash and fills
// ===========================================================================

TEST_F(BacktesterTest, LargeCapDollarVolumeDoesNotOverflow) {
    // 55M shares at 190 is about 1e10 of notional per bar
    std::vector<core::Bar> bars;
    core::Timestamp day = ts("2024-01-02");
    for (int i = 0; i < 30; ++i) {
        bars.push_back(core::makeBar("AAPL", "1d", day, D("190"), D("191"), D("189"), D("190"), 55000000));
        day = core::utils::addDays(day, 1);
    }
    config.apply_costs = true;
    ScheduledSignalSource liquid;
    liquid.add(ts("2024-01-02"), longSignal("185", 100));
    Backtester backtester(config, liquid, sizer);

    BacktestResult result;
    ASSERT_NO_THROW(result = backtester.run(bars));
    EXPECT_EQ(result.bars_processed, 30u);
    EXPECT_EQ(result.equity_curve.size(), 30u);
    ASSERT_EQ(result.open_positions.size(), 1u);
    // Liquid tier: 0.02% of the 190 open
    EXPECT_EQ(result.open_positions.front().average_entry_price, D("190.038"));
}

TEST_F(BacktesterTest, UnaffordableGapFillIsRejected) {
    config.initial_capital = Decimal(10000);
    config.risk_per_trade_pct = Decimal(100);
    config.max_portfolio_heat_pct = Decimal(100);
    ScheduledSignalSource gap;
    gap.add(ts("2024-01-02"), longSignal("90", 100000));
    std::vector<core::Bar> bars = {
        makeBar("AAPL", "2024-01-02", "100", "101", "99", "100"),
        makeBar("AAPL", "2024-01-03", "102", "103", "101", "102"),
    };
    Backtester backtester(config, gap, sizer);
    BacktestResult result = backtester.run(bars);

    // 99 shares sized against the 100 close cost 10,098 at the 102 open
    ASSERT_EQ(result.orders.size(), 1u);
    const core::Order& order = result.orders.front();
    EXPECT_EQ(order.quantity, 99);
    EXPECT_EQ(order.status, core::OrderStatus::Rejected);
    EXPECT_FALSE(order.fill_price);
    EXPECT_FALSE(order.fill_timestamp);
    EXPECT_TRUE(order.commission.isZero());
    EXPECT_TRUE(result.open_positions.empty());
    EXPECT_TRUE(result.trades.empty());
    EXPECT_EQ(result.equity_curve.back().cash, Decimal(10000));
}

namespace {

    std::vector<core::Bar> twoSymbolBars() {
        return {
            makeBar("AAPL", "2024-01-02", "100", "101", "99", "100"),
            makeBar("MSFT", "2024-01-02", "100", "101", "99", "100"),
            makeBar("AAPL", "2024-01-03", "100", "101", "99", "100"),
            makeBar("MSFT", "2024-01-03", "100", "101", "99", "100"),
        };
    }

    CandidateSignal signalFor(const std::string& symbol) {
        CandidateSignal signal;
        signal.symbol = symbol;
        signal.side = core::PositionSide::Long;
        signal.initial_stop = Decimal(90);
        signal.pattern = "SOS";
        return signal;
    }

} // end anonymous namespace

TEST_F(BacktesterTest, PendingEntriesReserveCash) {
    config.initial_capital = Decimal(10000);
    config.risk_per_trade_pct = Decimal(100);
    config.max_portfolio_heat_pct = Decimal(100);
    ScheduledSignalSource both;
    both.add(ts("2024-01-02"), signalFor("AAPL"));
    both.add(ts("2024-01-02"), signalFor("MSFT"));
    Backtester backtester(config, both, sizer);
    BacktestResult result = backtester.run(twoSymbolBars());

    // AAPL sets aside 99 x 100.5; the remaining 50.5 buys no MSFT
    ASSERT_EQ(result.orders.size(), 1u);
    EXPECT_EQ(result.orders.front().symbol, "AAPL");
    EXPECT_EQ(result.orders.front().status, core::OrderStatus::Filled);
    ASSERT_EQ(result.open_positions.size(), 1u);
    EXPECT_EQ(result.equity_curve.back().cash, Decimal(100));
}

TEST_F(BacktesterTest, PendingEntriesCountTowardsHeat) {
    config.risk_per_trade_pct = Decimal(5);
    config.max_portfolio_heat_pct = Decimal(6);
    ScheduledSignalSource both;
    both.add(ts("2024-01-02"), signalFor("AAPL"));
    both.add(ts("2024-01-02"), signalFor("MSFT"));
    Backtester backtester(config, both, sizer);
    BacktestResult result = backtester.run(twoSymbolBars());

    // 6,000 of heat: AAPL commits 5,000 while pending, MSFT gets the last 1,000
    ASSERT_EQ(result.orders.size(), 2u);
    EXPECT_EQ(result.orders[0].quantity, 500);
    EXPECT_EQ(result.orders[1].quantity, 100);
    for (const auto& order : result.orders) {
        EXPECT_EQ(order.status, core::OrderStatus::Filled);
    }
    EXPECT_EQ(result.open_positions.size(), 2u);
    EXPECT_EQ(result.equity_curve.back().cash, Decimal(40000));
}

// ===========================================================================
// Progress and cancellation
// ===========================================================================

TEST_F(BacktesterTest, ProgressEveryNBarsPlusFinal) {
    config.progress_every_bars = 2;
    RecordingNotifier notifier;
    Backtester backtester(config, source, sizer, &notifier);
    backtester.run(rallyBars());

    ASSERT_EQ(notifier.updates.size(), 3u);
    EXPECT_EQ(notifier.updates[0].bars_processed, 2u);
    EXPECT_EQ(notifier.updates[1].bars_processed, 4u);
    EXPECT_EQ(notifier.updates[2].bars_processed, 5u);
    EXPECT_DOUBLE_EQ(notifier.updates[2].percent_complete, 100.0);
}

TEST_F(BacktesterTest, CancelStopsBeforeNextBar) {
    config.progress_every_bars = 1;
    CancellingNotifier notifier;
    Backtester backtester(config, source, sizer, &notifier);
    notifier.target = &backtester;
    BacktestResult result = backtester.run(rallyBars());

    EXPECT_TRUE(result.cancelled);
    EXPECT_EQ(result.equity_curve.size(), 1u);
    EXPECT_EQ(result.bars_processed, 1u);
    // The entry submitted on the only processed bar never fills
    ASSERT_EQ(result.orders.size(), 1u);
    EXPECT_EQ(result.orders.front().status, core::OrderStatus::Rejected);
}

TEST_F(BacktesterTest, ThrowingNotifierDoesNotAbortRun) {
    config.progress_every_bars = 1;
    ThrowingNotifier notifier;
    Backtester backtester(config, source, sizer, &notifier);
    BacktestResult result = backtester.run(rallyBars());
    EXPECT_EQ(result.bars_processed, 5u);
    EXPECT_EQ(result.trades.size(), 1u);
}

TEST_F(BacktesterTest, NonStandardNotifierExceptionIsLogged) {
    config.progress_every_bars = 1;
    NonStandardThrowingNotifier notifier;
    Backtester backtester(config, source, sizer, &notifier);
    BacktestResult result;
    ASSERT_NO_THROW(result = backtester.run(rallyBars()));
    EXPECT_EQ(result.bars_processed, 5u);
    EXPECT_EQ(result.trades.size(), 1u);
}

// ===========================================================================
// Failures
// ===========================================================================

TEST_F(BacktesterTest, SignalSourceFailureBecomesBacktestException) {
    ThrowingSignalSource broken;
    Backtester backtester(config, broken, sizer);
    EXPECT_THROW(backtester.run(rallyBars()), core::BacktestException);
}

TEST_F(BacktesterTest, InvalidConfigRejectedAtConstruction) {
    config.initial_capital = Decimal();
    EXPECT_THROW(Backtester(config, source, sizer), core::ConfigException);
}

TEST(FixedRiskPositionSizerTest, FloorsRiskOverStopDistance) {
    FixedRiskPositionSizer sizer;
    EXPECT_EQ(sizer.calculateQuantity(Decimal(100000), Decimal(2), D("1.50")), 1333);
    EXPECT_EQ(sizer.calculateQuantity(Decimal(100000), Decimal(2), Decimal()), 0);
}
