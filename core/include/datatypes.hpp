#pragma once

#include <string>
#include <vector>
#include <chrono>   // For timestamps
#include <optional> // For limit prices, stops, fills

#include "decimal.hpp"

namespace core {

    // UTC time points throughout
    using Timestamp = std::chrono::system_clock::time_point;

    enum class OrderType { Market, Limit };

    enum class OrderSide { Buy, Sell };

    // PENDING -> FILLED | REJECTED, terminal afterwards
    enum class OrderStatus { Pending, Filled, Rejected };

    enum class PositionSide { Long, Short };

    struct Bar {
        std::string symbol;
        std::string timeframe;
        Timestamp timestamp;
        Decimal open;
        Decimal high;
        Decimal low;
        Decimal close;
        long long volume = 0;
        Decimal spread; // high - low

        bool operator<(const Bar& other) const {
            return timestamp < other.timestamp;
        }
    };

    struct Order {
        std::string order_id;
        std::string symbol;
        OrderType type = OrderType::Market;
        OrderSide side = OrderSide::Buy;
        long long quantity = 0;
        std::optional<Decimal> limit_price;
        Timestamp created_timestamp;
        OrderStatus status = OrderStatus::Pending;
        std::optional<Decimal> fill_price;
        std::optional<Timestamp> fill_timestamp;
        Decimal slippage;   // Per-share amount applied to the fill
        Decimal commission; // Total commission for this fill

        // Entry orders: initial protective stop from the signal
        std::optional<Decimal> stop_price;
        // Closing orders: why the position is being exited
        std::optional<std::string> exit_reason;
    };

    struct Position {
        std::string symbol;
        PositionSide side = PositionSide::Long;
        long long quantity = 0;
        Decimal average_entry_price;
        Decimal current_price;
        Timestamp entry_timestamp;
        Timestamp last_updated;
        Decimal unrealized_pnl;
        Decimal total_commission; // Entry commission not yet allocated to a trade
        Decimal total_slippage;   // Entry slippage dollars not yet allocated to a trade

        std::optional<Decimal> initial_stop;
        Decimal risk_amount; // |entry - initial stop| x quantity, fixed at entry
        Decimal peak_price;  // Most favourable close since entry
    };

    // Closed (or partially closed) round trip
    struct Trade {
        std::string trade_id;
        std::string symbol;
        PositionSide side = PositionSide::Long;
        long long quantity = 0;
        Decimal entry_price;
        Decimal exit_price;
        Timestamp entry_timestamp;
        Timestamp exit_timestamp;
        Decimal gross_pnl;    // Before commission and slippage
        Decimal net_pnl;      // After commission and slippage
        Decimal commission;   // Entry (allocated) + exit
        Decimal slippage;     // Dollar slippage, entry (allocated) + exit
        Decimal initial_risk; // Dollar risk of the closed quantity at entry
        Decimal r_multiple;       // net_pnl / initial_risk
        Decimal gross_r_multiple; // gross_pnl / initial_risk
        std::string exit_reason;
    };

    struct EquityCurvePoint {
        Timestamp timestamp;
        Decimal portfolio_value;
        Decimal cash;
        Decimal positions_value;
        Decimal daily_return; // Fraction vs. previous point, 0 for the first
    };

    template<typename T>
    using TimeSeries = std::vector<T>;

    // --- Enum string conversions ---
    std::string toString(OrderType type);
    std::string toString(OrderSide side);
    std::string toString(OrderStatus status);
    std::string toString(PositionSide side);

    OrderType orderTypeFromString(const std::string& text);
    OrderSide orderSideFromString(const std::string& text);
    PositionSide positionSideFromString(const std::string& text);

    // Builds a bar with spread = high - low. Does not validate.
    Bar makeBar(const std::string& symbol, const std::string& timeframe, Timestamp timestamp,
                Decimal open, Decimal high, Decimal low, Decimal close, long long volume);

    // Returns the reason a bar is unusable, or nullopt when it is valid
    std::optional<std::string> validateBar(const Bar& bar);

} // namespace core
