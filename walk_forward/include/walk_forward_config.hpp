#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "backtest_config.hpp"
#include "decimal.hpp"

namespace walk_forward {

    using json = nlohmann::json;

    // Metrics a window's performance ratio can be computed on
    const std::vector<std::string>& primaryMetricNames();

    struct WalkForwardConfig {
        int train_months = 6;
        int validate_months = 3;
        std::string primary_metric = "win_rate"; // win_rate | avg_r_multiple | profit_factor | sharpe_ratio
        // A window degrades when validate/train on the primary metric falls below this
        core::Decimal degradation_threshold = core::Decimal::fromString("0.80");
        backtester::BacktestConfig backtest;

        // Missing keys keep their defaults. Throws core::ConfigException.
        static WalkForwardConfig fromJson(const json& config);
        json toJson() const;
        void validate() const;
    };

    struct SymbolSuiteConfig {
        std::string symbol;
        std::string asset_class = "stock";
        std::string timeframe = "1d";
    };

    struct SuiteConfig {
        std::vector<SymbolSuiteConfig> symbols;
        WalkForwardConfig walk_forward;
        core::Decimal regression_tolerance_pct = core::Decimal(10);
        std::string baselines_dir = "baselines/walk_forward";
        std::string baseline_version = "1.0";
        bool parallel = false;

        // Throws core::ConfigException
        static SuiteConfig fromJson(const json& config);
        json toJson() const;
        void validate() const;
    };

} // namespace walk_forward
