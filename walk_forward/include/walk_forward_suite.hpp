#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "baseline_store.hpp"
#include "walk_forward_config.hpp"
#include "walk_forward_engine.hpp"

namespace walk_forward {

    using json = nlohmann::json;

    // Suite metrics compared against baselines, in report order
    const std::vector<std::string>& comparedMetricNames();
    // Regress when they fall by more than the tolerance
    const std::set<std::string>& higherIsBetterMetrics();
    // Regress when they rise by more than the tolerance
    const std::set<std::string>& lowerIsBetterMetrics();

    // Loads one symbol's bars. Called from the suite's own thread only.
    using BarLoader = std::function<std::vector<core::Bar>(const SymbolSuiteConfig& symbol)>;

    struct SymbolResult {
        std::string symbol;
        std::string asset_class;
        int window_count = 0;
        core::Decimal avg_validate_win_rate;
        core::Decimal avg_validate_profit_factor;
        core::Decimal avg_validate_sharpe;
        core::Decimal avg_validate_max_drawdown;
        core::Decimal stability_score;
        int degradation_count = 0;
        std::map<std::string, core::Decimal> statistical_significance;
        double total_execution_time_seconds = 0.0;
        std::vector<WalkForwardWindow> windows;
        std::optional<std::string> error; // Set when the symbol could not be run

        // Values keyed by comparedMetricNames()
        std::map<std::string, core::Decimal> comparableMetrics() const;
        json toJson() const;
    };

    struct BaselineComparison {
        std::string symbol;
        std::string metric_name;
        core::Decimal baseline_value;
        core::Decimal current_value;
        core::Decimal change_pct; // 0 when the baseline value is 0
        core::Decimal tolerance_pct;
        bool regressed = false;

        // "AAPL/avg_validate_win_rate: -16.7% (tolerance: 10%)"
        std::string describe() const;
        json toJson() const;
    };

    struct SuiteResult {
        std::string suite_id;
        std::string baseline_version;
        std::vector<SymbolResult> symbol_results;
        std::vector<BaselineComparison> baseline_comparisons;
        bool overall_pass = true;
        int total_symbols = 0;
        int total_windows = 0;
        double total_execution_time_seconds = 0.0;
        int regression_count = 0;
        std::vector<std::string> regression_details;

        json toJson() const;
    };

    // Walk-forward over several symbols with baseline regression checks.
    // A symbol that fails is reported with its error; the other symbols still run.
    class WalkForwardSuite {
    public:
        // Validates config (core::ConfigException)
        WalkForwardSuite(SuiteConfig config, BarLoader bar_loader, SignalSourceFactory signal_factory,
                         const backtester::IPositionSizer& position_sizer);

        // Loads every symbol's bars first, then runs the symbols, in parallel when
        // config.parallel is set, and compares each against its stored baseline.
        SuiteResult run() const;

        // Writes one baseline per successful symbol. Never called by run().
        std::vector<std::filesystem::path> saveBaselines(const SuiteResult& result) const;

        static BaselineComparison compareMetric(const std::string& symbol, const std::string& metric_name,
                                                const core::Decimal& current_value, const core::Decimal& baseline_value,
                                                const core::Decimal& tolerance_pct);
        // One comparison per metric present in the baseline
        static std::vector<BaselineComparison> compareToBaseline(const SymbolResult& result, const BaselineRecord& baseline,
                                                                 const core::Decimal& tolerance_pct);

        const SuiteConfig& getConfig() const { return config_; }

    private:
        SymbolResult runSymbol(const SymbolSuiteConfig& symbol, const std::vector<core::Bar>& bars) const;
        static SymbolResult failedSymbol(const SymbolSuiteConfig& symbol, const std::string& error);

        SuiteConfig config_;
        BarLoader bar_loader_;
        SignalSourceFactory signal_factory_;
        const backtester::IPositionSizer& position_sizer_;
        BaselineStore baseline_store_;
    };

} // namespace walk_forward
