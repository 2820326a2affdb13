#include "backtest_config.hpp"
#include "exceptions.hpp"

#include <string>
#include <type_traits>

namespace backtester {

    namespace {

        core::Decimal readDecimal(const json& config, const char* key, const core::Decimal& fallback) {
            if (!config.contains(key)) {
                return fallback;
            }
            const json& value = config.at(key);
            if (!value.is_string() && !value.is_number()) {
                throw core::ConfigException(std::string("Backtest config '") + key + "' must be a decimal string or number.");
            }
            try {
                return value.get<core::Decimal>();
            } catch (const std::exception& e) {
                throw core::ConfigException(std::string("Backtest config '") + key + "' is not a valid decimal: " + e.what());
            }
        }

        template <typename T>
        T readNumber(const json& config, const char* key, T fallback) {
            if (!config.contains(key)) {
                return fallback;
            }
            const json& value = config.at(key);
            if (!value.is_number()) {
                throw core::ConfigException(std::string("Backtest config '") + key + "' must be a number.");
            }
            if (std::is_unsigned<T>::value && value.is_number_integer() && value.get<long long>() < 0) {
                throw core::ConfigException(std::string("Backtest config '") + key + "' must not be negative.");
            }
            return value.get<T>();
        }

        void checkPercent(const core::Decimal& value, const char* name) {
            if (!value.isPositive() || value > core::Decimal(100)) {
                throw core::ConfigException(std::string(name) + " must be in (0, 100], got " + value.toString());
            }
        }

    } // end anonymous namespace

    BacktestConfig BacktestConfig::fromJson(const json& config) {
        if (!config.is_object()) {
            throw core::ConfigException("Backtest config must be a JSON object.");
        }

        BacktestConfig result;
        result.initial_capital = readDecimal(config, "initial_capital", result.initial_capital);
        result.risk_per_trade_pct = readDecimal(config, "risk_per_trade_pct", result.risk_per_trade_pct);
        result.max_portfolio_heat_pct = readDecimal(config, "max_portfolio_heat_pct", result.max_portfolio_heat_pct);
        result.max_open_positions = readNumber<int>(config, "max_open_positions", result.max_open_positions);
        result.max_pending_orders = readNumber<size_t>(config, "max_pending_orders", result.max_pending_orders);
        result.avg_volume_lookback = readNumber<size_t>(config, "avg_volume_lookback", result.avg_volume_lookback);
        result.progress_every_bars = readNumber<size_t>(config, "progress_every_bars", result.progress_every_bars);
        result.progress_interval_seconds = readNumber<double>(config, "progress_interval_seconds", result.progress_interval_seconds);
        result.risk_free_rate = readNumber<double>(config, "risk_free_rate", result.risk_free_rate);
        result.periods_per_year = readNumber<int>(config, "periods_per_year", result.periods_per_year);

        if (config.contains("apply_costs")) {
            if (!config.at("apply_costs").is_boolean()) {
                throw core::ConfigException("Backtest config 'apply_costs' must be a boolean.");
            }
            result.apply_costs = config.at("apply_costs").get<bool>();
        }
        if (config.contains("exit_rules")) {
            result.exit_rules = ExitRules::fromJson(config.at("exit_rules"));
        }
        if (config.contains("cost_model")) {
            result.cost_model = CostModelConfig::fromJson(config.at("cost_model"));
        }

        result.validate();
        return result;
    }

    json BacktestConfig::toJson() const {
        return json{
            {"initial_capital", initial_capital},
            {"risk_per_trade_pct", risk_per_trade_pct},
            {"max_portfolio_heat_pct", max_portfolio_heat_pct},
            {"max_open_positions", max_open_positions},
            {"max_pending_orders", max_pending_orders},
            {"avg_volume_lookback", avg_volume_lookback},
            {"progress_every_bars", progress_every_bars},
            {"progress_interval_seconds", progress_interval_seconds},
            {"risk_free_rate", risk_free_rate},
            {"periods_per_year", periods_per_year},
            {"apply_costs", apply_costs},
            {"exit_rules", exit_rules.toJson()},
            {"cost_model", cost_model.toJson()}
        };
    }

    void BacktestConfig::validate() const {
        if (!initial_capital.isPositive()) {
            throw core::ConfigException("initial_capital must be > 0, got " + initial_capital.toString());
        }
        checkPercent(risk_per_trade_pct, "risk_per_trade_pct");
        checkPercent(max_portfolio_heat_pct, "max_portfolio_heat_pct");
        if (max_open_positions <= 0) {
            throw core::ConfigException("max_open_positions must be > 0, got " + std::to_string(max_open_positions));
        }
        if (max_pending_orders == 0) {
            throw core::ConfigException("max_pending_orders must be > 0");
        }
        if (avg_volume_lookback == 0) {
            throw core::ConfigException("avg_volume_lookback must be > 0");
        }
        if (progress_interval_seconds <= 0.0) {
            throw core::ConfigException("progress_interval_seconds must be > 0");
        }
        if (periods_per_year <= 0) {
            throw core::ConfigException("periods_per_year must be > 0, got " + std::to_string(periods_per_year));
        }
        exit_rules.validate();
        cost_model.validate();
    }

    MetricsOptions BacktestConfig::metricsOptions() const {
        MetricsOptions options;
        options.risk_free_rate = risk_free_rate;
        options.periods_per_year = periods_per_year;
        return options;
    }

    CostModelConfig BacktestConfig::effectiveCostModel() const {
        if (apply_costs) {
            return cost_model;
        }
        CostModelConfig no_costs = cost_model;
        no_costs.liquid_slippage_rate = core::Decimal();
        no_costs.illiquid_slippage_rate = core::Decimal();
        no_costs.impact_rate_per_step = core::Decimal();
        no_costs.zero_volume_penalty_rate = core::Decimal();
        no_costs.commission_per_share = core::Decimal();
        return no_costs;
    }

} // namespace backtester
