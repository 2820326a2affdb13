#include "cost_model.hpp"
#include "exceptions.hpp"

#include <string>

namespace backtester {

    namespace {

        void readDecimal(const json& config, const char* key, core::Decimal& target) {
            if (!config.contains(key)) {
                return;
            }
            const json& value = config.at(key);
            if (!value.is_string() && !value.is_number()) {
                throw core::ConfigException(std::string("Cost model '") + key + "' must be a decimal string or number.");
            }
            try {
                target = value.get<core::Decimal>();
            } catch (const std::exception& e) {
                throw core::ConfigException(std::string("Cost model '") + key + "' is not a valid decimal: " + e.what());
            }
        }

        void requireNonNegative(const core::Decimal& value, const char* name) {
            if (value.isNegative()) {
                throw core::ConfigException(std::string(name) + " must be >= 0, got " + value.toString());
            }
        }

    } // end anonymous namespace

    CostModelConfig CostModelConfig::fromJson(const json& config) {
        if (!config.is_object()) {
            throw core::ConfigException("Cost model config must be a JSON object.");
        }
        CostModelConfig result = defaults();
        readDecimal(config, "liquid_slippage_rate", result.liquid_slippage_rate);
        readDecimal(config, "illiquid_slippage_rate", result.illiquid_slippage_rate);
        readDecimal(config, "liquidity_threshold", result.liquidity_threshold);
        readDecimal(config, "impact_threshold_ratio", result.impact_threshold_ratio);
        readDecimal(config, "impact_step_ratio", result.impact_step_ratio);
        readDecimal(config, "impact_rate_per_step", result.impact_rate_per_step);
        readDecimal(config, "zero_volume_penalty_rate", result.zero_volume_penalty_rate);
        readDecimal(config, "commission_per_share", result.commission_per_share);
        result.validate();
        return result;
    }

    json CostModelConfig::toJson() const {
        return json{
            {"liquid_slippage_rate", liquid_slippage_rate},
            {"illiquid_slippage_rate", illiquid_slippage_rate},
            {"liquidity_threshold", liquidity_threshold},
            {"impact_threshold_ratio", impact_threshold_ratio},
            {"impact_step_ratio", impact_step_ratio},
            {"impact_rate_per_step", impact_rate_per_step},
            {"zero_volume_penalty_rate", zero_volume_penalty_rate},
            {"commission_per_share", commission_per_share}
        };
    }

    void CostModelConfig::validate() const {
        requireNonNegative(liquid_slippage_rate, "liquid_slippage_rate");
        requireNonNegative(illiquid_slippage_rate, "illiquid_slippage_rate");
        requireNonNegative(liquidity_threshold, "liquidity_threshold");
        requireNonNegative(impact_threshold_ratio, "impact_threshold_ratio");
        requireNonNegative(impact_rate_per_step, "impact_rate_per_step");
        requireNonNegative(zero_volume_penalty_rate, "zero_volume_penalty_rate");
        requireNonNegative(commission_per_share, "commission_per_share");
        if (!impact_step_ratio.isPositive()) {
            throw core::ConfigException("impact_step_ratio must be > 0, got " + impact_step_ratio.toString());
        }
    }

    CostModel::CostModel(CostModelConfig config)
        : config_(std::move(config)) {
        config_.validate();
    }

    long long CostModel::impactIncrements(long long quantity, long long bar_volume) const {
        if (bar_volume <= 0 || quantity <= 0) {
            return 0;
        }
        // Compare in share units to keep the floor exact:
        // excess = qty - threshold*volume, step = step_ratio*volume
        const core::Decimal volume(bar_volume);
        const core::Decimal excess = core::Decimal(quantity) - config_.impact_threshold_ratio * volume;
        if (!excess.isPositive()) {
            return 0;
        }
        const core::Decimal step = config_.impact_step_ratio * volume;
        return (excess / step).floor();
    }

    core::Decimal CostModel::slippageRate(const core::Bar& bar, long long quantity, const core::Decimal& avg_volume) const {
        if (bar.volume <= 0) {
            return config_.illiquid_slippage_rate + config_.zero_volume_penalty_rate;
        }

        core::Decimal rate = (avg_volume >= config_.liquidity_threshold)
            ? config_.liquid_slippage_rate
            : config_.illiquid_slippage_rate;

        long long increments = impactIncrements(quantity, bar.volume);
        if (increments > 0) {
            rate += config_.impact_rate_per_step * core::Decimal(increments);
        }
        return rate;
    }

    core::Decimal CostModel::slippage(const core::Bar& bar, core::OrderSide /*side*/, long long quantity,
                                      const core::Decimal& avg_volume) const {
        return bar.open * slippageRate(bar, quantity, avg_volume);
    }

    core::Decimal CostModel::commission(long long quantity) const {
        return commission(quantity, config_.commission_per_share);
    }

    core::Decimal CostModel::commission(long long quantity, const core::Decimal& rate_per_share) {
        return rate_per_share * core::Decimal(quantity);
    }

    core::Decimal CostModel::applySlippage(const core::Decimal& price, const core::Decimal& slippage,
                                           core::OrderSide side) {
        return side == core::OrderSide::Buy ? price + slippage : price - slippage;
    }

} // namespace backtester
