#include "datatypes.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace core {

    namespace {

        std::string toUpper(std::string text) {
            std::transform(text.begin(), text.end(), text.begin(),
                [](unsigned char c){ return static_cast<char>(std::toupper(c)); });
            return text;
        }

    } // end anonymous namespace

    std::string toString(OrderType type) {
        switch (type) {
            case OrderType::Market: return "MARKET";
            case OrderType::Limit: return "LIMIT";
        }
        return "UNKNOWN";
    }

    std::string toString(OrderSide side) {
        switch (side) {
            case OrderSide::Buy: return "BUY";
            case OrderSide::Sell: return "SELL";
        }
        return "UNKNOWN";
    }

    std::string toString(OrderStatus status) {
        switch (status) {
            case OrderStatus::Pending: return "PENDING";
            case OrderStatus::Filled: return "FILLED";
            case OrderStatus::Rejected: return "REJECTED";
        }
        return "UNKNOWN";
    }

    std::string toString(PositionSide side) {
        switch (side) {
            case PositionSide::Long: return "LONG";
            case PositionSide::Short: return "SHORT";
        }
        return "UNKNOWN";
    }

    OrderType orderTypeFromString(const std::string& text) {
        std::string upper = toUpper(text);
        if (upper == "MARKET") return OrderType::Market;
        if (upper == "LIMIT") return OrderType::Limit;
        throw std::invalid_argument("Unknown order type string: " + text);
    }

    OrderSide orderSideFromString(const std::string& text) {
        std::string upper = toUpper(text);
        if (upper == "BUY") return OrderSide::Buy;
        if (upper == "SELL") return OrderSide::Sell;
        throw std::invalid_argument("Unknown order side string: " + text);
    }

    PositionSide positionSideFromString(const std::string& text) {
        std::string upper = toUpper(text);
        if (upper == "LONG") return PositionSide::Long;
        if (upper == "SHORT") return PositionSide::Short;
        throw std::invalid_argument("Unknown position side string: " + text);
    }

    Bar makeBar(const std::string& symbol, const std::string& timeframe, Timestamp timestamp,
                Decimal open, Decimal high, Decimal low, Decimal close, long long volume) {
        Bar bar;
        bar.symbol = symbol;
        bar.timeframe = timeframe;
        bar.timestamp = timestamp;
        bar.open = open;
        bar.high = high;
        bar.low = low;
        bar.close = close;
        bar.volume = volume;
        bar.spread = high - low;
        return bar;
    }

    std::optional<std::string> validateBar(const Bar& bar) {
        if (!bar.open.isPositive() || !bar.high.isPositive() ||
            !bar.low.isPositive() || !bar.close.isPositive()) {
            return std::string("non-positive OHLC price");
        }
        if (bar.high < bar.low) {
            return std::string("high below low");
        }
        if (bar.open < bar.low || bar.open > bar.high) {
            return std::string("open outside [low, high]");
        }
        if (bar.close < bar.low || bar.close > bar.high) {
            return std::string("close outside [low, high]");
        }
        if (bar.volume < 0) {
            return std::string("negative volume");
        }
        return std::nullopt;
    }

} // namespace core
