#include "metrics_calculator.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <cmath>
#include <numeric>
#include <algorithm>

namespace backtester {

    namespace {

        core::Decimal toFixed(double value) {
            if (!std::isfinite(value)) {
                return core::Decimal();
            }
            return core::Decimal::fromDouble(value, MetricsCalculator::kFloatMetricPlaces);
        }

        core::Decimal average(const core::Decimal& total, long long count) {
            return count > 0 ? total / core::Decimal(count) : core::Decimal();
        }

    } // end anonymous namespace

    core::Decimal MetricsCalculator::totalReturnPct(const core::Decimal& initial, const core::Decimal& final_value) {
        if (!initial.isPositive()) {
            return core::Decimal();
        }
        return (final_value - initial) / initial * core::Decimal(100);
    }

    core::Decimal MetricsCalculator::cagr(const core::Decimal& initial, const core::Decimal& final_value, double years) {
        if (years <= 0.0 || !initial.isPositive() || !final_value.isPositive()) {
            return core::Decimal();
        }
        double growth = final_value.toDouble() / initial.toDouble();
        return toFixed(std::pow(growth, 1.0 / years) - 1.0);
    }

    core::Decimal MetricsCalculator::sharpeRatio(const std::vector<core::EquityCurvePoint>& equity_curve,
                                                 const MetricsOptions& options) {
        if (equity_curve.size() < 2 || options.periods_per_year <= 0) {
            return core::Decimal();
        }

        std::vector<double> returns;
        returns.reserve(equity_curve.size() - 1);
        for (size_t i = 1; i < equity_curve.size(); ++i) {
            double previous = equity_curve[i - 1].portfolio_value.toDouble();
            double current = equity_curve[i].portfolio_value.toDouble();
            returns.push_back(previous > 0.0 ? (current - previous) / previous : 0.0);
        }
        // Sample standard deviation needs two returns
        if (returns.size() < 2) {
            return core::Decimal();
        }

        double mean = std::accumulate(returns.begin(), returns.end(), 0.0) / static_cast<double>(returns.size());
        double squared = 0.0;
        for (double r : returns) {
            squared += (r - mean) * (r - mean);
        }
        double std_dev = std::sqrt(squared / static_cast<double>(returns.size() - 1));
        if (!(std_dev > 0.0)) {
            return core::Decimal();
        }

        double periods = static_cast<double>(options.periods_per_year);
        double excess = mean - options.risk_free_rate / periods;
        return toFixed(excess / std_dev * std::sqrt(periods));
    }

    DrawdownStats MetricsCalculator::drawdown(const std::vector<core::EquityCurvePoint>& equity_curve) {
        DrawdownStats stats;
        if (equity_curve.empty()) {
            return stats;
        }

        core::Decimal peak = equity_curve.front().portfolio_value;
        long long current_duration = 0;
        for (const auto& point : equity_curve) {
            const core::Decimal& value = point.portfolio_value;
            if (value >= peak) {
                peak = value;
                current_duration = 0;
                continue;
            }
            ++current_duration;
            stats.max_duration_bars = std::max(stats.max_duration_bars, current_duration);
            if (peak.isPositive()) {
                core::Decimal dd = (peak - value) / peak;
                if (dd > stats.max_drawdown) {
                    stats.max_drawdown = dd;
                }
            }
        }
        return stats;
    }

    BacktestMetrics MetricsCalculator::calculate(const std::vector<core::EquityCurvePoint>& equity_curve,
                                                 const std::vector<core::Trade>& trades,
                                                 const core::Decimal& initial_capital,
                                                 const MetricsOptions& options) {
        BacktestMetrics metrics;

        // --- Equity-based metrics ---
        metrics.final_equity = equity_curve.empty() ? initial_capital : equity_curve.back().portfolio_value;
        metrics.total_return_pct = totalReturnPct(initial_capital, metrics.final_equity);
        if (equity_curve.size() >= 2) {
            double years = core::utils::daysBetween(equity_curve.front().timestamp, equity_curve.back().timestamp) / 365.25;
            metrics.cagr = cagr(initial_capital, metrics.final_equity, years);
        }
        metrics.sharpe_ratio = sharpeRatio(equity_curve, options);
        DrawdownStats dd = drawdown(equity_curve);
        metrics.max_drawdown = dd.max_drawdown;
        metrics.max_drawdown_duration_bars = dd.max_duration_bars;

        // --- Trade-based metrics ---
        metrics.total_trades = static_cast<int>(trades.size());
        core::Decimal gross_profit;
        core::Decimal gross_loss;
        core::Decimal r_total;
        long long r_count = 0;
        for (const auto& trade : trades) {
            metrics.total_pnl += trade.net_pnl;
            if (trade.net_pnl.isPositive()) {
                ++metrics.winning_trades;
                gross_profit += trade.net_pnl;
            } else if (trade.net_pnl.isNegative()) {
                ++metrics.losing_trades;
                gross_loss += trade.net_pnl;
            }
            if (trade.initial_risk.isPositive()) {
                r_total += trade.r_multiple;
                ++r_count;
            }
        }

        metrics.win_rate = average(core::Decimal(metrics.winning_trades), metrics.total_trades);
        metrics.average_r_multiple = average(r_total, r_count);
        metrics.profit_factor = gross_loss.isZero() ? core::Decimal() : gross_profit / gross_loss.abs();
        metrics.avg_win_pnl = average(gross_profit, metrics.winning_trades);
        metrics.avg_loss_pnl = average(gross_loss, metrics.losing_trades);
        return metrics;
    }

    CostSummary MetricsCalculator::calculateCostSummary(const std::vector<core::Trade>& trades) {
        CostSummary summary;
        summary.total_trades = static_cast<int>(trades.size());

        core::Decimal gross_r_total;
        core::Decimal net_r_total;
        long long r_count = 0;
        for (const auto& trade : trades) {
            summary.total_commission += trade.commission;
            summary.total_slippage += trade.slippage;
            if (trade.initial_risk.isPositive()) {
                gross_r_total += trade.gross_r_multiple;
                net_r_total += trade.r_multiple;
                ++r_count;
            }
        }

        summary.total_transaction_costs = summary.total_commission + summary.total_slippage;
        summary.avg_commission_per_trade = average(summary.total_commission, summary.total_trades);
        summary.avg_slippage_per_trade = average(summary.total_slippage, summary.total_trades);
        summary.avg_transaction_cost_per_trade = average(summary.total_transaction_costs, summary.total_trades);
        summary.gross_avg_r_multiple = average(gross_r_total, r_count);
        summary.net_avg_r_multiple = average(net_r_total, r_count);
        summary.r_multiple_degradation = summary.gross_avg_r_multiple - summary.net_avg_r_multiple;
        return summary;
    }

    void BacktestMetrics::logMetrics() const {
        auto logger = core::logging::getLogger();
        logger->info("--- Backtest Metrics ---");
        logger->info("Total Return: {}%", total_return_pct.toString(2));
        logger->info("Total PnL: {}", total_pnl.toString(2));
        logger->info("Final Equity: {}", final_equity.toString(2));
        logger->info("CAGR: {}%", (cagr * core::Decimal(100)).toString(2));
        logger->info("Sharpe Ratio: {}", sharpe_ratio.toString(4));
        logger->info("Max Drawdown: {}% ({} bars)", (max_drawdown * core::Decimal(100)).toString(2),
                     max_drawdown_duration_bars);
        logger->info("Trades: {} (won {}, lost {})", total_trades, winning_trades, losing_trades);
        logger->info("Win Rate: {}%", (win_rate * core::Decimal(100)).toString(2));
        logger->info("Avg R-Multiple: {}", average_r_multiple.toString(4));
        logger->info("Profit Factor: {}", profit_factor.toString(4));
        logger->info("Avg Win PnL: {}", avg_win_pnl.toString(2));
        logger->info("Avg Loss PnL: {}", avg_loss_pnl.toString(2));
        logger->info("------------------------");
    }

    json BacktestMetrics::toJson() const {
        return json{
            {"total_trades", total_trades},
            {"winning_trades", winning_trades},
            {"losing_trades", losing_trades},
            {"win_rate", win_rate},
            {"average_r_multiple", average_r_multiple},
            {"profit_factor", profit_factor},
            {"total_pnl", total_pnl},
            {"final_equity", final_equity},
            {"total_return_pct", total_return_pct},
            {"cagr", cagr},
            {"sharpe_ratio", sharpe_ratio},
            {"max_drawdown", max_drawdown},
            {"max_drawdown_duration_bars", max_drawdown_duration_bars},
            {"avg_win_pnl", avg_win_pnl},
            {"avg_loss_pnl", avg_loss_pnl}
        };
    }

    void CostSummary::logSummary() const {
        auto logger = core::logging::getLogger();
        logger->info("--- Transaction Costs ---");
        logger->info("Commission: {} total, {} per trade", total_commission.toString(2),
                     avg_commission_per_trade.toString(2));
        logger->info("Slippage: {} total, {} per trade", total_slippage.toString(2),
                     avg_slippage_per_trade.toString(2));
        logger->info("Avg R-Multiple: gross {}, net {} (degradation {})", gross_avg_r_multiple.toString(4),
                     net_avg_r_multiple.toString(4), r_multiple_degradation.toString(4));
    }

    json CostSummary::toJson() const {
        return json{
            {"total_trades", total_trades},
            {"total_commission", total_commission},
            {"total_slippage", total_slippage},
            {"total_transaction_costs", total_transaction_costs},
            {"avg_commission_per_trade", avg_commission_per_trade},
            {"avg_slippage_per_trade", avg_slippage_per_trade},
            {"avg_transaction_cost_per_trade", avg_transaction_cost_per_trade},
            {"gross_avg_r_multiple", gross_avg_r_multiple},
            {"net_avg_r_multiple", net_avg_r_multiple},
            {"r_multiple_degradation", r_multiple_degradation}
        };
    }

} // namespace backtester
