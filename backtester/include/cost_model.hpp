#pragma once

#include <nlohmann/json.hpp>

#include "datatypes.hpp"
#include "decimal.hpp"

namespace backtester {

    using json = nlohmann::json;

    // Slippage and commission parameters. All rates are fractions of price.
    struct CostModelConfig {
        core::Decimal liquid_slippage_rate = core::Decimal::fromString("0.0002");   // 0.02%
        core::Decimal illiquid_slippage_rate = core::Decimal::fromString("0.0005"); // 0.05%
        // Average dollar volume at or above which a bar counts as liquid
        core::Decimal liquidity_threshold = core::Decimal(1000000);
        // Market impact: once quantity / bar volume exceeds impact_threshold_ratio,
        // each whole impact_step_ratio of excess adds impact_rate_per_step
        core::Decimal impact_threshold_ratio = core::Decimal::fromString("0.10");
        core::Decimal impact_step_ratio = core::Decimal::fromString("0.10");
        core::Decimal impact_rate_per_step = core::Decimal::fromString("0.0001");
        // Added on top of the illiquid rate when the bar traded zero volume
        core::Decimal zero_volume_penalty_rate = core::Decimal::fromString("0.0005");
        core::Decimal commission_per_share = core::Decimal::fromString("0.005");

        static CostModelConfig defaults() { return CostModelConfig{}; }
        static CostModelConfig fromJson(const json& config);
        json toJson() const;

        // Throws core::ConfigException on negative rates or non-positive steps
        void validate() const;
    };

    class CostModel {
    public:
        explicit CostModel(CostModelConfig config = CostModelConfig::defaults());

        const CostModelConfig& getConfig() const { return config_; }

        // Slippage rate (fraction of price) for an order of `quantity` against `bar`
        core::Decimal slippageRate(const core::Bar& bar, long long quantity, const core::Decimal& avg_volume) const;

        // Per-share slippage amount, always >= 0; the side decides its sign when applied
        core::Decimal slippage(const core::Bar& bar, core::OrderSide side, long long quantity,
                               const core::Decimal& avg_volume) const;

        core::Decimal commission(long long quantity) const;

        // Number of whole impact steps beyond the threshold, 0 for zero-volume bars
        long long impactIncrements(long long quantity, long long bar_volume) const;

        // Linear per-share commission; a zero rate is valid
        static core::Decimal commission(long long quantity, const core::Decimal& rate_per_share);

        // BUY fills move up, SELL fills move down
        static core::Decimal applySlippage(const core::Decimal& price, const core::Decimal& slippage,
                                           core::OrderSide side);

    private:
        CostModelConfig config_;
    };

} // namespace backtester
