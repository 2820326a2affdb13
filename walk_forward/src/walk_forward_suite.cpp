#include "walk_forward_suite.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <chrono>
#include <future>

namespace walk_forward {

    const std::vector<std::string>& comparedMetricNames() {
        static const std::vector<std::string> names = {
            "avg_validate_win_rate", "avg_validate_profit_factor", "avg_validate_sharpe", "avg_validate_max_drawdown"};
        return names;
    }

    const std::set<std::string>& higherIsBetterMetrics() {
        static const std::set<std::string> names = {
            "avg_validate_win_rate", "avg_validate_profit_factor", "avg_validate_sharpe"};
        return names;
    }

    const std::set<std::string>& lowerIsBetterMetrics() {
        static const std::set<std::string> names = {"avg_validate_max_drawdown"};
        return names;
    }

    WalkForwardSuite::WalkForwardSuite(SuiteConfig config, BarLoader bar_loader, SignalSourceFactory signal_factory,
                                       const backtester::IPositionSizer& position_sizer)
        : config_(std::move(config)),
          bar_loader_(std::move(bar_loader)),
          signal_factory_(std::move(signal_factory)),
          position_sizer_(position_sizer),
          baseline_store_(config_.baselines_dir)
    {
        config_.validate();
        if (!bar_loader_) {
            throw core::ConfigException("Walk-forward suite requires a bar loader.");
        }
        if (!signal_factory_) {
            throw core::ConfigException("Walk-forward suite requires a signal source factory.");
        }
    }

    SymbolResult WalkForwardSuite::failedSymbol(const SymbolSuiteConfig& symbol, const std::string& error) {
        SymbolResult result;
        result.symbol = symbol.symbol;
        result.asset_class = symbol.asset_class;
        result.error = error;
        return result;
    }

    SymbolResult WalkForwardSuite::runSymbol(const SymbolSuiteConfig& symbol, const std::vector<core::Bar>& bars) const {
        auto logger = core::logging::getLogger();
        logger->info("Walk-forward suite: running {} ({}, {} bars)", symbol.symbol, symbol.asset_class, bars.size());
        try {
            WalkForwardEngine engine(config_.walk_forward, signal_factory_, position_sizer_);
            WalkForwardResult wf = engine.run(symbol.symbol, bars);

            SymbolResult result;
            result.symbol = symbol.symbol;
            result.asset_class = symbol.asset_class;
            result.window_count = wf.summary.total_windows;
            result.avg_validate_win_rate = wf.summary.avg_validate_win_rate;
            result.avg_validate_profit_factor = wf.summary.avg_validate_profit_factor;
            result.avg_validate_sharpe = wf.summary.avg_validate_sharpe;
            result.avg_validate_max_drawdown = wf.summary.avg_validate_max_drawdown;
            result.stability_score = wf.stability_score;
            result.degradation_count = static_cast<int>(wf.degradation_windows.size());
            result.statistical_significance = wf.statistical_significance;
            result.total_execution_time_seconds = wf.total_execution_time_seconds;
            result.windows = std::move(wf.windows);
            return result;
        } catch (const std::exception& e) {
            logger->error("Walk-forward suite: {} failed: {}", symbol.symbol, e.what());
            return failedSymbol(symbol, e.what());
        }
    }

    SuiteResult WalkForwardSuite::run() const {
        auto logger = core::logging::getLogger();
        const auto started = std::chrono::steady_clock::now();

        SuiteResult result;
        result.suite_id = core::utils::generateRunId();
        result.baseline_version = config_.baseline_version;
        logger->info("Walk-forward suite {} started: {} symbols{}", result.suite_id, config_.symbols.size(),
                     config_.parallel ? " (parallel)" : "");

        // Loading stays on this thread; the loader may share a non-thread-safe connection
        std::vector<std::optional<std::vector<core::Bar>>> loaded;
        loaded.reserve(config_.symbols.size());
        std::vector<std::optional<std::string>> load_errors(config_.symbols.size());
        for (size_t i = 0; i < config_.symbols.size(); ++i) {
            try {
                loaded.emplace_back(bar_loader_(config_.symbols[i]));
            } catch (const std::exception& e) {
                logger->error("Walk-forward suite: loading bars for {} failed: {}", config_.symbols[i].symbol, e.what());
                loaded.emplace_back(std::nullopt);
                load_errors[i] = e.what();
            }
        }

        result.symbol_results.resize(config_.symbols.size());
        if (config_.parallel) {
            std::vector<std::future<SymbolResult>> futures(config_.symbols.size());
            for (size_t i = 0; i < config_.symbols.size(); ++i) {
                if (loaded[i]) {
                    futures[i] = std::async(std::launch::async, [this, i, &loaded]() {
                        return runSymbol(config_.symbols[i], *loaded[i]);
                    });
                }
            }
            for (size_t i = 0; i < config_.symbols.size(); ++i) {
                result.symbol_results[i] = loaded[i] ? futures[i].get() : failedSymbol(config_.symbols[i], *load_errors[i]);
            }
        } else {
            for (size_t i = 0; i < config_.symbols.size(); ++i) {
                result.symbol_results[i] = loaded[i] ? runSymbol(config_.symbols[i], *loaded[i])
                                                     : failedSymbol(config_.symbols[i], *load_errors[i]);
            }
        }

        // --- Baseline comparison ---
        for (const auto& symbol_result : result.symbol_results) {
            if (symbol_result.error) {
                continue;
            }
            std::optional<BaselineRecord> baseline = baseline_store_.load(symbol_result.symbol);
            if (!baseline) {
                continue;
            }
            for (auto& comparison : compareToBaseline(symbol_result, *baseline, config_.regression_tolerance_pct)) {
                if (comparison.regressed) {
                    result.regression_details.push_back(comparison.describe());
                    logger->warn("Regression: {}", comparison.describe());
                }
                result.baseline_comparisons.push_back(std::move(comparison));
            }
        }

        result.regression_count = static_cast<int>(result.regression_details.size());
        result.overall_pass = result.regression_count == 0;
        result.total_symbols = static_cast<int>(result.symbol_results.size());
        for (const auto& symbol_result : result.symbol_results) {
            result.total_windows += symbol_result.window_count;
        }
        result.total_execution_time_seconds =
            std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();

        logger->info("Walk-forward suite {} completed: {} symbols, {} windows, {} regressions, {}", result.suite_id,
                     result.total_symbols, result.total_windows, result.regression_count,
                     result.overall_pass ? "PASS" : "FAIL");
        return result;
    }

    BaselineComparison WalkForwardSuite::compareMetric(const std::string& symbol, const std::string& metric_name,
                                                       const core::Decimal& current_value, const core::Decimal& baseline_value,
                                                       const core::Decimal& tolerance_pct) {
        BaselineComparison comparison;
        comparison.symbol = symbol;
        comparison.metric_name = metric_name;
        comparison.baseline_value = baseline_value;
        comparison.current_value = current_value;
        comparison.tolerance_pct = tolerance_pct;
        if (!baseline_value.isZero()) {
            comparison.change_pct = (current_value - baseline_value) / baseline_value * core::Decimal(100);
        }

        if (higherIsBetterMetrics().count(metric_name)) {
            comparison.regressed = comparison.change_pct < -tolerance_pct;
        } else if (lowerIsBetterMetrics().count(metric_name)) {
            comparison.regressed = comparison.change_pct > tolerance_pct;
        } else {
            comparison.regressed = comparison.change_pct.abs() > tolerance_pct;
        }
        return comparison;
    }

    std::vector<BaselineComparison> WalkForwardSuite::compareToBaseline(const SymbolResult& result,
                                                                        const BaselineRecord& baseline,
                                                                        const core::Decimal& tolerance_pct) {
        std::vector<BaselineComparison> comparisons;
        const std::map<std::string, core::Decimal> current = result.comparableMetrics();
        for (const auto& name : comparedMetricNames()) {
            auto stored = baseline.metrics.find(name);
            if (stored == baseline.metrics.end()) {
                continue;
            }
            comparisons.push_back(compareMetric(result.symbol, name, current.at(name), stored->second, tolerance_pct));
        }
        return comparisons;
    }

    std::vector<std::filesystem::path> WalkForwardSuite::saveBaselines(const SuiteResult& result) const {
        std::vector<std::filesystem::path> saved;
        const std::string created_at = core::utils::timestampToString(std::chrono::system_clock::now());
        for (const auto& symbol_result : result.symbol_results) {
            if (symbol_result.error) {
                continue;
            }
            BaselineRecord record;
            record.symbol = symbol_result.symbol;
            record.asset_class = symbol_result.asset_class;
            record.baseline_version = config_.baseline_version;
            record.suite_id = result.suite_id;
            record.window_count = symbol_result.window_count;
            record.metrics = symbol_result.comparableMetrics();
            record.stability_score = symbol_result.stability_score;
            record.degradation_count = symbol_result.degradation_count;
            record.created_at = created_at;
            saved.push_back(baseline_store_.save(record));
        }
        return saved;
    }

    // --- JSON views ---

    std::map<std::string, core::Decimal> SymbolResult::comparableMetrics() const {
        return {
            {"avg_validate_win_rate", avg_validate_win_rate},
            {"avg_validate_profit_factor", avg_validate_profit_factor},
            {"avg_validate_sharpe", avg_validate_sharpe},
            {"avg_validate_max_drawdown", avg_validate_max_drawdown}
        };
    }

    json SymbolResult::toJson() const {
        json windows_json = json::array();
        for (const auto& window : windows) {
            windows_json.push_back(window.toJson());
        }
        json j = {
            {"symbol", symbol},
            {"asset_class", asset_class},
            {"window_count", window_count},
            {"stability_score", stability_score},
            {"degradation_count", degradation_count},
            {"statistical_significance", statistical_significance},
            {"total_execution_time_seconds", total_execution_time_seconds},
            {"windows", windows_json},
            {"error", error ? json(*error) : json(nullptr)}
        };
        for (const auto& pair : comparableMetrics()) {
            j[pair.first] = pair.second;
        }
        return j;
    }

    std::string BaselineComparison::describe() const {
        const core::Decimal rounded = change_pct.round(1);
        return symbol + "/" + metric_name + ": " + (rounded.isNegative() ? "" : "+") + rounded.toString(1) +
               "% (tolerance: " + tolerance_pct.toString() + "%)";
    }

    json BaselineComparison::toJson() const {
        return json{
            {"symbol", symbol},
            {"metric_name", metric_name},
            {"baseline_value", baseline_value},
            {"current_value", current_value},
            {"change_pct", change_pct},
            {"tolerance_pct", tolerance_pct},
            {"regressed", regressed}
        };
    }

    json SuiteResult::toJson() const {
        json symbols_json = json::array();
        for (const auto& symbol_result : symbol_results) {
            symbols_json.push_back(symbol_result.toJson());
        }
        json comparisons_json = json::array();
        for (const auto& comparison : baseline_comparisons) {
            comparisons_json.push_back(comparison.toJson());
        }
        return json{
            {"suite_id", suite_id},
            {"baseline_version", baseline_version},
            {"symbol_results", symbols_json},
            {"baseline_comparisons", comparisons_json},
            {"overall_pass", overall_pass},
            {"total_symbols", total_symbols},
            {"total_windows", total_windows},
            {"total_execution_time_seconds", total_execution_time_seconds},
            {"regression_count", regression_count},
            {"regression_details", regression_details}
        };
    }

} // namespace walk_forward
