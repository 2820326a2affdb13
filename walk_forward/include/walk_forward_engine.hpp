#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "backtester.hpp"
#include "datatypes.hpp"
#include "interfaces.hpp"
#include "metrics_calculator.hpp"
#include "walk_forward_config.hpp"

namespace walk_forward {

    using json = nlohmann::json;

    // A fresh signal source per backtest run; each train and validate slice starts clean
    using SignalSourceFactory = std::function<std::unique_ptr<backtester::ISignalSource>(const std::string& symbol)>;

    // Half-open ranges: train [train_start, train_end), validate [validate_start, validate_end)
    struct WindowPeriod {
        int window_number = 0;
        core::Timestamp train_start;
        core::Timestamp train_end;
        core::Timestamp validate_start;
        core::Timestamp validate_end;
    };

    struct WalkForwardWindow {
        WindowPeriod period;
        backtester::BacktestMetrics train_metrics;
        backtester::BacktestMetrics validate_metrics;
        std::string train_run_id;
        std::string validate_run_id;
        size_t train_bars = 0;
        size_t validate_bars = 0;
        core::Decimal performance_ratio;
        bool degradation_detected = false;

        json toJson() const;
    };

    struct WalkForwardSummary {
        int total_windows = 0;
        core::Decimal avg_validate_win_rate;
        core::Decimal avg_validate_avg_r;
        core::Decimal avg_validate_profit_factor;
        core::Decimal avg_validate_sharpe;
        core::Decimal avg_validate_max_drawdown;
        int degradation_count = 0;
        core::Decimal degradation_percentage;

        json toJson() const;
    };

    struct WalkForwardResult {
        std::string walk_forward_id;
        std::string symbol;
        std::vector<WalkForwardWindow> windows;
        WalkForwardSummary summary;
        core::Decimal stability_score; // Coefficient of variation of the validate primary metric
        std::vector<int> degradation_windows;
        // Paired t-test p-values, train vs validate: win_rate_pvalue, avg_r_pvalue,
        // profit_factor_pvalue, sharpe_ratio_pvalue. Empty with fewer than 2 windows.
        std::map<std::string, core::Decimal> statistical_significance;
        double total_execution_time_seconds = 0.0;

        json toJson() const;
    };

    class WalkForwardEngine {
    public:
        // Validates config (core::ConfigException). The sizer must outlive the engine
        // and be safe to share when suites run symbols in parallel.
        WalkForwardEngine(WalkForwardConfig config, SignalSourceFactory signal_factory,
                          const backtester::IPositionSizer& position_sizer);

        // Runs every window over `bars` (one symbol, ascending). A window whose backtest
        // throws is logged and left out. Throws core::BacktestException when there are
        // no bars or the date range cannot hold a single window.
        WalkForwardResult run(const std::string& symbol, const std::vector<core::Bar>& bars) const;

        // Windows over [startOfDay(first), startOfDay(last) + 1 day); a window whose
        // validate end passes that bound is dropped. Starts advance by validate_months.
        static std::vector<WindowPeriod> generateWindows(const core::Timestamp& first, const core::Timestamp& last,
                                                         int train_months, int validate_months);

        static core::Decimal metricValue(const backtester::BacktestMetrics& metrics, const std::string& metric);
        // validate / train on `metric`, 4 decimal places; 0 when the train value is 0
        static core::Decimal performanceRatio(const backtester::BacktestMetrics& train,
                                              const backtester::BacktestMetrics& validate,
                                              const std::string& metric);
        static bool isDegraded(const core::Decimal& performance_ratio, const core::Decimal& threshold);
        // Sample stddev / mean, 4 decimal places; 0 with fewer than 2 windows or a zero mean
        static core::Decimal stabilityScore(const std::vector<WalkForwardWindow>& windows, const std::string& metric);
        static WalkForwardSummary summarize(const std::vector<WalkForwardWindow>& windows);
        static std::map<std::string, core::Decimal> statisticalSignificance(const std::vector<WalkForwardWindow>& windows);

        // Two-sided p-value of a paired t-test on (a[i] - b[i]). Returns 1 for fewer than
        // 2 pairs, mismatched sizes, non-finite input or identical samples; 0 when every
        // difference is the same non-zero value.
        static double pairedTTestPValue(const std::vector<double>& a, const std::vector<double>& b);

        const WalkForwardConfig& getConfig() const { return config_; }

    private:
        backtester::BacktestResult runSlice(const std::string& symbol, const std::vector<core::Bar>& bars,
                                            const core::Timestamp& start, const core::Timestamp& end) const;

        WalkForwardConfig config_;
        SignalSourceFactory signal_factory_;
        const backtester::IPositionSizer& position_sizer_;
    };

} // namespace walk_forward
