#pragma once

#include <cstddef>
#include <nlohmann/json.hpp>

#include "bar_processor.hpp"
#include "cost_model.hpp"
#include "decimal.hpp"
#include "metrics_calculator.hpp"

namespace backtester {

    using json = nlohmann::json;

    struct BacktestConfig {
        core::Decimal initial_capital = core::Decimal(100000);
        core::Decimal risk_per_trade_pct = core::Decimal(2);      // % of equity risked per entry
        core::Decimal max_portfolio_heat_pct = core::Decimal(10); // Cap on committed risk, % of equity
        int max_open_positions = 5;
        size_t max_pending_orders = 1000;
        size_t avg_volume_lookback = 20; // Bars in the trailing dollar-volume average

        // Progress is reported every N bars (0 = every 5% of the run) or every T seconds
        size_t progress_every_bars = 0;
        double progress_interval_seconds = 10.0;

        double risk_free_rate = 0.02;
        int periods_per_year = 252;

        bool apply_costs = true;
        ExitRules exit_rules;
        CostModelConfig cost_model = CostModelConfig::defaults();

        // Missing keys keep their defaults. Throws core::ConfigException.
        static BacktestConfig fromJson(const json& config);
        json toJson() const;

        // Throws core::ConfigException on the first invalid field
        void validate() const;

        MetricsOptions metricsOptions() const;
        // Zero-rate model when apply_costs is false
        CostModelConfig effectiveCostModel() const;
    };

} // namespace backtester
