#pragma once

#include <vector>
#include <nlohmann/json.hpp>

#include "datatypes.hpp"

namespace backtester {

    using json = nlohmann::json;

    struct MetricsOptions {
        double risk_free_rate = 0.02; // Annual
        int periods_per_year = 252;
    };

    // --- Backtest Metrics Struct ---
    // Recomputed wholesale from an equity curve and trade list, never updated in place.
    struct BacktestMetrics {
        int total_trades = 0;
        int winning_trades = 0;
        int losing_trades = 0;  // Zero-P&L trades count in neither
        core::Decimal win_rate; // Fraction of total_trades
        core::Decimal average_r_multiple;
        core::Decimal profit_factor; // 0 when there are no losing trades
        core::Decimal total_pnl;
        core::Decimal final_equity;
        core::Decimal total_return_pct;
        core::Decimal cagr;
        core::Decimal sharpe_ratio;
        core::Decimal max_drawdown; // Fraction of peak, in [0, 1]
        long long max_drawdown_duration_bars = 0;
        core::Decimal avg_win_pnl;
        core::Decimal avg_loss_pnl; // Negative or zero

        void logMetrics() const;
        json toJson() const;
    };

    struct CostSummary {
        int total_trades = 0;
        core::Decimal total_commission;
        core::Decimal total_slippage;
        core::Decimal total_transaction_costs;
        core::Decimal avg_commission_per_trade;
        core::Decimal avg_slippage_per_trade;
        core::Decimal avg_transaction_cost_per_trade;
        core::Decimal gross_avg_r_multiple;
        core::Decimal net_avg_r_multiple;
        core::Decimal r_multiple_degradation; // gross - net

        void logSummary() const;
        json toJson() const;
    };

    struct DrawdownStats {
        core::Decimal max_drawdown;
        long long max_duration_bars = 0;
    };

    // Pure functions of their inputs. Degenerate divisions resolve to 0.
    class MetricsCalculator {
    public:
        // Decimal places used when floating-point results (CAGR, Sharpe) return to fixed point
        static constexpr int kFloatMetricPlaces = 6;

        static BacktestMetrics calculate(const std::vector<core::EquityCurvePoint>& equity_curve,
                                         const std::vector<core::Trade>& trades,
                                         const core::Decimal& initial_capital,
                                         const MetricsOptions& options = MetricsOptions{});

        static CostSummary calculateCostSummary(const std::vector<core::Trade>& trades);

        static core::Decimal totalReturnPct(const core::Decimal& initial, const core::Decimal& final_value);
        static core::Decimal cagr(const core::Decimal& initial, const core::Decimal& final_value, double years);
        static core::Decimal sharpeRatio(const std::vector<core::EquityCurvePoint>& equity_curve,
                                         const MetricsOptions& options = MetricsOptions{});
        static DrawdownStats drawdown(const std::vector<core::EquityCurvePoint>& equity_curve);
    };

} // namespace backtester
