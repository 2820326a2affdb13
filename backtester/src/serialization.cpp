#include "serialization.hpp"
#include "utils.hpp"

namespace backtester {

    namespace {

        json optionalDecimal(const std::optional<core::Decimal>& value) {
            return value ? json(*value) : json(nullptr);
        }

    } // end anonymous namespace

    json toJson(const core::Bar& bar) {
        return json{
            {"symbol", bar.symbol},
            {"timeframe", bar.timeframe},
            {"timestamp", core::utils::timestampToString(bar.timestamp)},
            {"open", bar.open},
            {"high", bar.high},
            {"low", bar.low},
            {"close", bar.close},
            {"volume", bar.volume},
            {"spread", bar.spread}
        };
    }

    json toJson(const core::Order& order) {
        json j = {
            {"order_id", order.order_id},
            {"symbol", order.symbol},
            {"type", core::toString(order.type)},
            {"side", core::toString(order.side)},
            {"quantity", order.quantity},
            {"limit_price", optionalDecimal(order.limit_price)},
            {"created_timestamp", core::utils::timestampToString(order.created_timestamp)},
            {"status", core::toString(order.status)},
            {"fill_price", optionalDecimal(order.fill_price)},
            {"slippage", order.slippage},
            {"commission", order.commission},
            {"stop_price", optionalDecimal(order.stop_price)}
        };
        j["fill_timestamp"] = order.fill_timestamp
            ? json(core::utils::timestampToString(*order.fill_timestamp)) : json(nullptr);
        j["exit_reason"] = order.exit_reason ? json(*order.exit_reason) : json(nullptr);
        return j;
    }

    json toJson(const core::Position& position) {
        return json{
            {"symbol", position.symbol},
            {"side", core::toString(position.side)},
            {"quantity", position.quantity},
            {"average_entry_price", position.average_entry_price},
            {"current_price", position.current_price},
            {"entry_timestamp", core::utils::timestampToString(position.entry_timestamp)},
            {"last_updated", core::utils::timestampToString(position.last_updated)},
            {"unrealized_pnl", position.unrealized_pnl},
            {"total_commission", position.total_commission},
            {"initial_stop", optionalDecimal(position.initial_stop)},
            {"risk_amount", position.risk_amount}
        };
    }

    json toJson(const core::Trade& trade) {
        return json{
            {"trade_id", trade.trade_id},
            {"symbol", trade.symbol},
            {"side", core::toString(trade.side)},
            {"quantity", trade.quantity},
            {"entry_price", trade.entry_price},
            {"exit_price", trade.exit_price},
            {"entry_timestamp", core::utils::timestampToString(trade.entry_timestamp)},
            {"exit_timestamp", core::utils::timestampToString(trade.exit_timestamp)},
            {"gross_pnl", trade.gross_pnl},
            {"net_pnl", trade.net_pnl},
            {"commission", trade.commission},
            {"slippage", trade.slippage},
            {"initial_risk", trade.initial_risk},
            {"r_multiple", trade.r_multiple},
            {"gross_r_multiple", trade.gross_r_multiple},
            {"exit_reason", trade.exit_reason}
        };
    }

    json toJson(const core::EquityCurvePoint& point) {
        return json{
            {"timestamp", core::utils::timestampToString(point.timestamp)},
            {"portfolio_value", point.portfolio_value},
            {"cash", point.cash},
            {"positions_value", point.positions_value},
            {"daily_return", point.daily_return}
        };
    }

} // namespace backtester
