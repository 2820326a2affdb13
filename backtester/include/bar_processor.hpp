#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "datatypes.hpp"
#include "portfolio.hpp"

namespace backtester {

    using json = nlohmann::json;

    enum class ExitReason { StopLoss, TrailingStop, TakeProfit };

    std::string toString(ExitReason reason);

    // Percentages are fractions: 0.02 == 2%. Each must lie in (0, 1].
    struct ExitRules {
        core::Decimal stop_loss_pct = core::Decimal::fromString("0.02");
        core::Decimal take_profit_pct = core::Decimal::fromString("0.06");
        std::optional<core::Decimal> trailing_stop_pct;

        static ExitRules fromJson(const json& config);
        json toJson() const;
        // Throws core::ConfigException
        void validate() const;
    };

    struct ExitSignal {
        std::string symbol;
        ExitReason reason = ExitReason::StopLoss;
        core::Decimal exit_price; // Close of the triggering bar
        core::Decimal move_pct;   // Signed move from average entry, as a fraction
    };

    struct BarProcessingResult {
        size_t bar_index = 0;
        core::Timestamp timestamp;
        core::Decimal cash;
        core::Decimal positions_value;
        core::Decimal portfolio_value;
        std::vector<ExitSignal> exit_signals;
        core::EquityCurvePoint equity_point;
    };

    // Marks positions to the bar close and decides which of them must exit.
    //
    // Checking order per position: stop-loss, trailing stop, take-profit. At most
    // one exit signal per position per bar, so a bar that satisfies both the stop
    // and the target reports the stop.
    class BarProcessor {
    public:
        explicit BarProcessor(ExitRules rules);

        const ExitRules& getRules() const { return rules_; }

        // Marks bar.symbol's position to market, then evaluates its exit conditions
        BarProcessingResult process(const core::Bar& bar, size_t bar_index, Portfolio& portfolio,
                                    const std::optional<core::Decimal>& previous_value) const;

        std::optional<ExitSignal> evaluateExit(const core::Position& position, const core::Bar& bar) const;

        // portfolio_value = cash + positions value; daily_return vs previous_value (0 when absent or <= 0)
        static core::EquityCurvePoint makeEquityPoint(const core::Timestamp& timestamp, const Portfolio& portfolio,
                                                      const std::optional<core::Decimal>& previous_value);

    private:
        ExitRules rules_;
    };

} // namespace backtester
