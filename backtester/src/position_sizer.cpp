#include "position_sizer.hpp"

namespace backtester {

    long long FixedRiskPositionSizer::calculateQuantity(const core::Decimal& equity,
                                                        const core::Decimal& risk_per_trade_pct,
                                                        const core::Decimal& stop_distance) const {
        if (!stop_distance.isPositive() || !equity.isPositive() || !risk_per_trade_pct.isPositive()) {
            return 0;
        }
        core::Decimal risk_dollars = equity * risk_per_trade_pct / core::Decimal(100);
        return (risk_dollars / stop_distance).floor();
    }

} // namespace backtester
