#include "walk_forward_engine.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>

namespace walk_forward {

    namespace {

        constexpr int kRatioPlaces = 4;
        constexpr int kPValuePlaces = 6;

        // Continued fraction for the incomplete beta function (modified Lentz)
        double betaContinuedFraction(double a, double b, double x) {
            constexpr int kMaxIterations = 300;
            constexpr double kEpsilon = 1e-15;
            constexpr double kTiny = 1e-300;

            const double qab = a + b;
            const double qap = a + 1.0;
            const double qam = a - 1.0;
            double c = 1.0;
            double d = 1.0 - qab * x / qap;
            if (std::fabs(d) < kTiny) d = kTiny;
            d = 1.0 / d;
            double h = d;

            for (int m = 1; m <= kMaxIterations; ++m) {
                const int m2 = 2 * m;
                double aa = m * (b - m) * x / ((qam + m2) * (a + m2));
                d = 1.0 + aa * d;
                if (std::fabs(d) < kTiny) d = kTiny;
                c = 1.0 + aa / c;
                if (std::fabs(c) < kTiny) c = kTiny;
                d = 1.0 / d;
                h *= d * c;

                aa = -(a + m) * (qab + m) * x / ((a + m2) * (qap + m2));
                d = 1.0 + aa * d;
                if (std::fabs(d) < kTiny) d = kTiny;
                c = 1.0 + aa / c;
                if (std::fabs(c) < kTiny) c = kTiny;
                d = 1.0 / d;
                const double delta = d * c;
                h *= delta;
                if (std::fabs(delta - 1.0) < kEpsilon) {
                    break;
                }
            }
            return h;
        }

        // I_x(a, b)
        double regularizedIncompleteBeta(double a, double b, double x) {
            if (x <= 0.0) return 0.0;
            if (x >= 1.0) return 1.0;
            const double front = std::exp(std::lgamma(a + b) - std::lgamma(a) - std::lgamma(b)
                                          + a * std::log(x) + b * std::log(1.0 - x));
            if (x < (a + 1.0) / (a + b + 2.0)) {
                return front * betaContinuedFraction(a, b, x) / a;
            }
            return 1.0 - front * betaContinuedFraction(b, a, 1.0 - x) / b;
        }

        core::Decimal significanceOf(const std::vector<WalkForwardWindow>& windows,
                                     core::Decimal backtester::BacktestMetrics::*field) {
            std::vector<double> train;
            std::vector<double> validate;
            for (const auto& window : windows) {
                train.push_back((window.train_metrics.*field).toDouble());
                validate.push_back((window.validate_metrics.*field).toDouble());
            }
            return core::Decimal::fromDouble(WalkForwardEngine::pairedTTestPValue(train, validate), kPValuePlaces);
        }

        core::Decimal average(const std::vector<WalkForwardWindow>& windows,
                              core::Decimal backtester::BacktestMetrics::*field) {
            if (windows.empty()) {
                return core::Decimal();
            }
            core::Decimal total;
            for (const auto& window : windows) {
                total += window.validate_metrics.*field;
            }
            return total / core::Decimal(static_cast<long long>(windows.size()));
        }

        json periodToJson(const WindowPeriod& period) {
            return json{
                {"window_number", period.window_number},
                {"train_start", core::utils::timestampToDateString(period.train_start)},
                {"train_end", core::utils::timestampToDateString(period.train_end)},
                {"validate_start", core::utils::timestampToDateString(period.validate_start)},
                {"validate_end", core::utils::timestampToDateString(period.validate_end)}
            };
        }

    } // end anonymous namespace

    WalkForwardEngine::WalkForwardEngine(WalkForwardConfig config, SignalSourceFactory signal_factory,
                                         const backtester::IPositionSizer& position_sizer)
        : config_(std::move(config)),
          signal_factory_(std::move(signal_factory)),
          position_sizer_(position_sizer)
    {
        config_.validate();
        if (!signal_factory_) {
            throw core::ConfigException("Walk-forward engine requires a signal source factory.");
        }
    }

    std::vector<WindowPeriod> WalkForwardEngine::generateWindows(const core::Timestamp& first, const core::Timestamp& last,
                                                                 int train_months, int validate_months) {
        std::vector<WindowPeriod> windows;
        if (train_months <= 0 || validate_months <= 0 || last < first) {
            return windows;
        }

        const core::Timestamp overall_start = core::utils::startOfDay(first);
        const core::Timestamp overall_end = core::utils::addDays(core::utils::startOfDay(last), 1);

        // Offsets are taken from the overall start so month-end clamping never accumulates
        for (int offset = 0;; offset += validate_months) {
            WindowPeriod period;
            period.train_start = core::utils::addMonths(overall_start, offset);
            period.train_end = core::utils::addMonths(overall_start, offset + train_months);
            period.validate_start = period.train_end;
            period.validate_end = core::utils::addMonths(overall_start, offset + train_months + validate_months);
            if (period.validate_end > overall_end) {
                break;
            }
            period.window_number = static_cast<int>(windows.size()) + 1;
            windows.push_back(period);
        }
        return windows;
    }

    core::Decimal WalkForwardEngine::metricValue(const backtester::BacktestMetrics& metrics, const std::string& metric) {
        if (metric == "win_rate") return metrics.win_rate;
        if (metric == "avg_r_multiple") return metrics.average_r_multiple;
        if (metric == "profit_factor") return metrics.profit_factor;
        if (metric == "sharpe_ratio") return metrics.sharpe_ratio;
        throw core::ConfigException("Unknown primary_metric '" + metric + "'");
    }

    core::Decimal WalkForwardEngine::performanceRatio(const backtester::BacktestMetrics& train,
                                                      const backtester::BacktestMetrics& validate,
                                                      const std::string& metric) {
        const core::Decimal train_value = metricValue(train, metric);
        if (train_value.isZero()) {
            return core::Decimal();
        }
        return (metricValue(validate, metric) / train_value).round(kRatioPlaces);
    }

    bool WalkForwardEngine::isDegraded(const core::Decimal& performance_ratio, const core::Decimal& threshold) {
        return performance_ratio < threshold;
    }

    core::Decimal WalkForwardEngine::stabilityScore(const std::vector<WalkForwardWindow>& windows, const std::string& metric) {
        if (windows.size() < 2) {
            return core::Decimal();
        }
        std::vector<double> values;
        values.reserve(windows.size());
        for (const auto& window : windows) {
            values.push_back(metricValue(window.validate_metrics, metric).toDouble());
        }

        double sum = 0.0;
        for (double v : values) sum += v;
        const double mean = sum / static_cast<double>(values.size());
        if (mean == 0.0) {
            return core::Decimal();
        }

        double squared = 0.0;
        for (double v : values) squared += (v - mean) * (v - mean);
        const double stddev = std::sqrt(squared / static_cast<double>(values.size() - 1));
        const double cv = stddev / mean;
        if (!std::isfinite(cv)) {
            return core::Decimal();
        }
        return core::Decimal::fromDouble(cv, kRatioPlaces);
    }

    WalkForwardSummary WalkForwardEngine::summarize(const std::vector<WalkForwardWindow>& windows) {
        WalkForwardSummary summary;
        summary.total_windows = static_cast<int>(windows.size());
        summary.avg_validate_win_rate = average(windows, &backtester::BacktestMetrics::win_rate);
        summary.avg_validate_avg_r = average(windows, &backtester::BacktestMetrics::average_r_multiple);
        summary.avg_validate_profit_factor = average(windows, &backtester::BacktestMetrics::profit_factor);
        summary.avg_validate_sharpe = average(windows, &backtester::BacktestMetrics::sharpe_ratio);
        summary.avg_validate_max_drawdown = average(windows, &backtester::BacktestMetrics::max_drawdown);
        for (const auto& window : windows) {
            if (window.degradation_detected) {
                ++summary.degradation_count;
            }
        }
        if (!windows.empty()) {
            summary.degradation_percentage = core::Decimal(summary.degradation_count) * core::Decimal(100)
                / core::Decimal(summary.total_windows);
        }
        return summary;
    }

    backtester::BacktestResult WalkForwardEngine::runSlice(const std::string& symbol, const std::vector<core::Bar>& bars,
                                                           const core::Timestamp& start, const core::Timestamp& end) const {
        std::vector<core::Bar> slice;
        for (const auto& bar : bars) {
            if (bar.symbol == symbol && bar.timestamp >= start && bar.timestamp < end) {
                slice.push_back(bar);
            }
        }
        std::unique_ptr<backtester::ISignalSource> source = signal_factory_(symbol);
        if (!source) {
            throw core::BacktestException("Signal source factory returned no source for " + symbol);
        }
        backtester::Backtester backtester(config_.backtest, *source, position_sizer_);
        return backtester.run(slice);
    }

    WalkForwardResult WalkForwardEngine::run(const std::string& symbol, const std::vector<core::Bar>& bars) const {
        auto logger = core::logging::getLogger();
        const auto started = std::chrono::steady_clock::now();

        WalkForwardResult result;
        result.walk_forward_id = core::utils::generateRunId();
        result.symbol = symbol;

        if (bars.empty()) {
            throw core::BacktestException("No bars supplied for walk-forward test on " + symbol);
        }

        logger->info("Walk-forward {} started for {}: train {}m, validate {}m, primary metric {}",
                     result.walk_forward_id, symbol, config_.train_months, config_.validate_months,
                     config_.primary_metric);

        std::vector<WindowPeriod> periods = generateWindows(bars.front().timestamp, bars.back().timestamp,
                                                            config_.train_months, config_.validate_months);
        if (periods.empty()) {
            throw core::BacktestException("Date range too short for walk-forward test on " + symbol + ". Requires at least " +
                                          std::to_string(config_.train_months + config_.validate_months) + " months.");
        }
        logger->info("Generated {} walk-forward windows for {}", periods.size(), symbol);

        for (const auto& period : periods) {
            try {
                backtester::BacktestResult train = runSlice(symbol, bars, period.train_start, period.train_end);
                backtester::BacktestResult validate = runSlice(symbol, bars, period.validate_start, period.validate_end);

                WalkForwardWindow window;
                window.period = period;
                window.train_metrics = train.metrics;
                window.validate_metrics = validate.metrics;
                window.train_run_id = train.run_id;
                window.validate_run_id = validate.run_id;
                window.train_bars = train.bars_processed;
                window.validate_bars = validate.bars_processed;
                window.performance_ratio = performanceRatio(train.metrics, validate.metrics, config_.primary_metric);
                window.degradation_detected = isDegraded(window.performance_ratio, config_.degradation_threshold);

                logger->info("Window {} ({}): train win rate {}, validate win rate {}, ratio {}", period.window_number,
                             symbol, train.metrics.win_rate.toString(4), validate.metrics.win_rate.toString(4),
                             window.performance_ratio.toString(4));
                if (window.degradation_detected) {
                    logger->warn("Degradation in window {} ({}): ratio {} below threshold {}", period.window_number,
                                 symbol, window.performance_ratio.toString(4), config_.degradation_threshold.toString());
                    result.degradation_windows.push_back(period.window_number);
                }
                result.windows.push_back(std::move(window));
            } catch (const std::exception& e) {
                logger->error("Walk-forward window {} ({}) failed: {}", period.window_number, symbol, e.what());
            }
        }

        result.summary = summarize(result.windows);
        result.stability_score = stabilityScore(result.windows, config_.primary_metric);
        result.statistical_significance = statisticalSignificance(result.windows);
        result.total_execution_time_seconds =
            std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();

        logger->info("Walk-forward {} completed for {}: {} windows, {} degraded, stability {}", result.walk_forward_id,
                     symbol, result.windows.size(), result.degradation_windows.size(), result.stability_score.toString(4));
        return result;
    }

    // --- Significance ---

    double WalkForwardEngine::pairedTTestPValue(const std::vector<double>& a, const std::vector<double>& b) {
        if (a.size() != b.size() || a.size() < 2) {
            return 1.0;
        }
        const double n = static_cast<double>(a.size());
        std::vector<double> differences;
        double sum = 0.0;
        for (size_t i = 0; i < a.size(); ++i) {
            const double diff = a[i] - b[i];
            if (!std::isfinite(diff)) {
                return 1.0;
            }
            differences.push_back(diff);
            sum += diff;
        }
        const double mean = sum / n;
        double squares = 0.0;
        for (double diff : differences) {
            squares += (diff - mean) * (diff - mean);
        }
        const double stddev = std::sqrt(squares / (n - 1.0));
        if (stddev == 0.0) {
            return mean == 0.0 ? 1.0 : 0.0;
        }

        const double t = mean / (stddev / std::sqrt(n));
        const double df = n - 1.0;
        // Two-sided tail of Student's t: I_{df / (df + t^2)}(df / 2, 1 / 2)
        const double p = regularizedIncompleteBeta(df / 2.0, 0.5, df / (df + t * t));
        if (!std::isfinite(p)) {
            return 1.0;
        }
        return std::min(1.0, std::max(0.0, p));
    }

    std::map<std::string, core::Decimal> WalkForwardEngine::statisticalSignificance(
        const std::vector<WalkForwardWindow>& windows) {
        std::map<std::string, core::Decimal> pvalues;
        if (windows.size() < 2) {
            return pvalues;
        }
        pvalues["win_rate_pvalue"] = significanceOf(windows, &backtester::BacktestMetrics::win_rate);
        pvalues["avg_r_pvalue"] = significanceOf(windows, &backtester::BacktestMetrics::average_r_multiple);
        pvalues["profit_factor_pvalue"] = significanceOf(windows, &backtester::BacktestMetrics::profit_factor);
        pvalues["sharpe_ratio_pvalue"] = significanceOf(windows, &backtester::BacktestMetrics::sharpe_ratio);
        return pvalues;
    }

    // --- JSON views ---

    json WalkForwardWindow::toJson() const {
        json j = periodToJson(period);
        j["train_metrics"] = train_metrics.toJson();
        j["validate_metrics"] = validate_metrics.toJson();
        j["train_run_id"] = train_run_id;
        j["validate_run_id"] = validate_run_id;
        j["train_bars"] = train_bars;
        j["validate_bars"] = validate_bars;
        j["performance_ratio"] = performance_ratio;
        j["degradation_detected"] = degradation_detected;
        return j;
    }

    json WalkForwardSummary::toJson() const {
        return json{
            {"total_windows", total_windows},
            {"avg_validate_win_rate", avg_validate_win_rate},
            {"avg_validate_avg_r", avg_validate_avg_r},
            {"avg_validate_profit_factor", avg_validate_profit_factor},
            {"avg_validate_sharpe", avg_validate_sharpe},
            {"avg_validate_max_drawdown", avg_validate_max_drawdown},
            {"degradation_count", degradation_count},
            {"degradation_percentage", degradation_percentage}
        };
    }

    json WalkForwardResult::toJson() const {
        json windows_json = json::array();
        for (const auto& window : windows) {
            windows_json.push_back(window.toJson());
        }
        return json{
            {"walk_forward_id", walk_forward_id},
            {"symbol", symbol},
            {"windows", windows_json},
            {"summary", summary.toJson()},
            {"stability_score", stability_score},
            {"degradation_windows", degradation_windows},
            {"statistical_significance", statistical_significance},
            {"total_execution_time_seconds", total_execution_time_seconds}
        };
    }

} // namespace walk_forward
