#pragma once

#include "interfaces.hpp"

namespace backtester {

    // floor(equity x risk% / 100 / stop distance); 0 for a non-positive stop distance
    class FixedRiskPositionSizer : public IPositionSizer {
    public:
        long long calculateQuantity(const core::Decimal& equity,
                                    const core::Decimal& risk_per_trade_pct,
                                    const core::Decimal& stop_distance) const override;
    };

} // namespace backtester
