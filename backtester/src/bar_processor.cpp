#include "bar_processor.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"

namespace backtester {

    namespace {

        void checkUnitInterval(const core::Decimal& value, const char* name) {
            if (!value.isPositive() || value > core::Decimal(1)) {
                throw core::ConfigException(std::string(name) + " must be in (0, 1], got " + value.toString());
            }
        }

        core::Decimal readPct(const json& config, const char* key, const core::Decimal& fallback) {
            if (!config.contains(key)) {
                return fallback;
            }
            const json& value = config.at(key);
            if (!value.is_string() && !value.is_number()) {
                throw core::ConfigException(std::string("Exit rule '") + key + "' must be a decimal string or number.");
            }
            try {
                return value.get<core::Decimal>();
            } catch (const std::exception& e) {
                throw core::ConfigException(std::string("Exit rule '") + key + "' is not a valid decimal: " + e.what());
            }
        }

    } // end anonymous namespace

    std::string toString(ExitReason reason) {
        switch (reason) {
            case ExitReason::StopLoss: return "stop_loss";
            case ExitReason::TrailingStop: return "trailing_stop";
            case ExitReason::TakeProfit: return "take_profit";
        }
        return "unknown";
    }

    ExitRules ExitRules::fromJson(const json& config) {
        if (!config.is_object()) {
            throw core::ConfigException("Exit rules config must be a JSON object.");
        }
        ExitRules rules;
        rules.stop_loss_pct = readPct(config, "stop_loss_pct", rules.stop_loss_pct);
        rules.take_profit_pct = readPct(config, "take_profit_pct", rules.take_profit_pct);
        if (config.contains("trailing_stop_pct") && !config.at("trailing_stop_pct").is_null()) {
            rules.trailing_stop_pct = readPct(config, "trailing_stop_pct", core::Decimal());
        }
        rules.validate();
        return rules;
    }

    json ExitRules::toJson() const {
        json j = {
            {"stop_loss_pct", stop_loss_pct},
            {"take_profit_pct", take_profit_pct}
        };
        j["trailing_stop_pct"] = trailing_stop_pct ? json(*trailing_stop_pct) : json(nullptr);
        return j;
    }

    void ExitRules::validate() const {
        checkUnitInterval(stop_loss_pct, "stop_loss_pct");
        checkUnitInterval(take_profit_pct, "take_profit_pct");
        if (trailing_stop_pct) {
            checkUnitInterval(*trailing_stop_pct, "trailing_stop_pct");
        }
    }

    BarProcessor::BarProcessor(ExitRules rules)
        : rules_(std::move(rules)) {
        rules_.validate();
    }

    std::optional<ExitSignal> BarProcessor::evaluateExit(const core::Position& position, const core::Bar& bar) const {
        if (position.symbol != bar.symbol || !position.average_entry_price.isPositive()) {
            return std::nullopt;
        }

        const core::Decimal& entry = position.average_entry_price;
        const core::Decimal move = (bar.close - entry) / entry;
        const bool is_long = position.side == core::PositionSide::Long;

        ExitSignal signal;
        signal.symbol = position.symbol;
        signal.exit_price = bar.close;
        signal.move_pct = move;

        // Stop-loss first
        if (is_long ? move <= -rules_.stop_loss_pct : move >= rules_.stop_loss_pct) {
            signal.reason = ExitReason::StopLoss;
            return signal;
        }

        // Trailing stop only after the position has moved in its favour
        if (rules_.trailing_stop_pct && position.peak_price.isPositive()) {
            const core::Decimal& peak = position.peak_price;
            const bool in_profit_once = is_long ? peak > entry : peak < entry;
            const core::Decimal retrace = is_long ? (peak - bar.close) / peak : (bar.close - peak) / peak;
            if (in_profit_once && retrace >= *rules_.trailing_stop_pct) {
                signal.reason = ExitReason::TrailingStop;
                return signal;
            }
        }

        if (is_long ? move >= rules_.take_profit_pct : move <= -rules_.take_profit_pct) {
            signal.reason = ExitReason::TakeProfit;
            return signal;
        }
        return std::nullopt;
    }

    BarProcessingResult BarProcessor::process(const core::Bar& bar, size_t bar_index, Portfolio& portfolio,
                                              const std::optional<core::Decimal>& previous_value) const {
        portfolio.markToMarket(bar);

        BarProcessingResult result;
        result.bar_index = bar_index;
        result.timestamp = bar.timestamp;

        if (const core::Position* position = portfolio.getPosition(bar.symbol)) {
            if (auto exit = evaluateExit(*position, bar)) {
                core::logging::getLogger()->info("Exit triggered for {} at {}: {} (move {}%, close {})",
                    exit->symbol, core::utils::timestampToString(bar.timestamp), toString(exit->reason),
                    (exit->move_pct * core::Decimal(100)).toString(2), exit->exit_price.toString());
                result.exit_signals.push_back(*exit);
            }
        }

        result.equity_point = makeEquityPoint(bar.timestamp, portfolio, previous_value);
        result.cash = result.equity_point.cash;
        result.positions_value = result.equity_point.positions_value;
        result.portfolio_value = result.equity_point.portfolio_value;
        return result;
    }

    core::EquityCurvePoint BarProcessor::makeEquityPoint(const core::Timestamp& timestamp, const Portfolio& portfolio,
                                                         const std::optional<core::Decimal>& previous_value) {
        core::EquityCurvePoint point;
        point.timestamp = timestamp;
        point.cash = portfolio.getCash();
        point.positions_value = portfolio.getPositionsValue();
        point.portfolio_value = point.cash + point.positions_value;
        if (previous_value && previous_value->isPositive()) {
            point.daily_return = (point.portfolio_value - *previous_value) / *previous_value;
        }
        return point;
    }

} // namespace backtester
