#include "portfolio.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace backtester {

    namespace {

        core::PositionSide entrySide(core::OrderSide side) {
            return side == core::OrderSide::Buy ? core::PositionSide::Long : core::PositionSide::Short;
        }

        core::Decimal direction(core::PositionSide side) {
            return side == core::PositionSide::Long ? core::Decimal(1) : core::Decimal(-1);
        }

        // value x part / whole, with the full value returned when part == whole
        core::Decimal allocate(const core::Decimal& value, long long part, long long whole) {
            if (part >= whole) {
                return value;
            }
            return value * core::Decimal(part) / core::Decimal(whole);
        }

        void refreshUnrealized(core::Position& position) {
            position.unrealized_pnl = (position.current_price - position.average_entry_price)
                * core::Decimal(position.quantity) * direction(position.side);
        }

    } // end anonymous namespace

    Portfolio::Portfolio(const core::Decimal& initial_capital)
        : initial_capital_(initial_capital), cash_(initial_capital) {
        if (!initial_capital.isPositive()) {
            throw core::ConfigException("Initial capital must be positive, got " + initial_capital.toString());
        }
    }

    bool Portfolio::hasPosition(const std::string& symbol) const {
        return positions_.count(symbol) > 0;
    }

    const core::Position* Portfolio::getPosition(const std::string& symbol) const {
        auto it = positions_.find(symbol);
        return it != positions_.end() ? &it->second : nullptr;
    }

    core::Decimal Portfolio::getPositionsValue() const {
        core::Decimal total;
        for (const auto& pair : positions_) {
            const core::Position& position = pair.second;
            total += position.average_entry_price * core::Decimal(position.quantity) + position.unrealized_pnl;
        }
        return total;
    }

    core::Decimal Portfolio::getPortfolioValue() const {
        return cash_ + getPositionsValue();
    }

    core::Decimal Portfolio::getTotalRiskAmount() const {
        core::Decimal total;
        for (const auto& pair : positions_) {
            total += pair.second.risk_amount;
        }
        return total;
    }

    core::Decimal Portfolio::getPortfolioHeat(const core::Decimal& equity) const {
        if (!equity.isPositive()) {
            return core::Decimal();
        }
        return getTotalRiskAmount() / equity * core::Decimal(100);
    }

    std::string Portfolio::nextTradeId() {
        std::ostringstream oss;
        oss << "TRD-" << std::setw(6) << std::setfill('0') << ++trade_sequence_;
        return oss.str();
    }

    void Portfolio::markToMarket(const core::Bar& bar) {
        auto it = positions_.find(bar.symbol);
        if (it == positions_.end()) {
            return;
        }
        core::Position& position = it->second;
        position.current_price = bar.close;
        position.last_updated = bar.timestamp;
        refreshUnrealized(position);
        if (position.side == core::PositionSide::Long) {
            position.peak_price = std::max(position.peak_price, bar.close);
        } else {
            position.peak_price = std::min(position.peak_price, bar.close);
        }
    }

    FillResult Portfolio::applyFill(const core::Order& order) {
        auto logger = core::logging::getLogger();
        if (order.status != core::OrderStatus::Filled || !order.fill_price || !order.fill_timestamp) {
            logger->warn("Ignoring order {} for {}: not filled", order.order_id, order.symbol);
            return FillResult{};
        }
        if (order.quantity <= 0) {
            logger->warn("Ignoring order {} with non-positive quantity {}", order.order_id, order.quantity);
            return FillResult{};
        }

        auto it = positions_.find(order.symbol);
        if (it == positions_.end()) {
            return openOrIncrease(order, nullptr);
        }
        if (it->second.side == entrySide(order.side)) {
            return openOrIncrease(order, &it->second);
        }
        return reduceOrClose(order, it->second);
    }

    FillResult Portfolio::openOrIncrease(const core::Order& order, const core::Position* existing) {
        auto logger = core::logging::getLogger();
        const core::Decimal fill_price = *order.fill_price;
        const core::Decimal quantity(order.quantity);
        const core::Decimal cost = fill_price * quantity + order.commission;

        if (cost > cash_) {
            logger->error("Insufficient cash for {} {}: have {}, need {}. Fill ignored.",
                          order.order_id, order.symbol, cash_.toString(), cost.toString());
            return FillResult{};
        }

        const core::Decimal slippage_dollars = order.slippage * quantity;
        cash_ -= cost;
        total_commission_ += order.commission;
        total_slippage_ += slippage_dollars;

        FillResult result;
        if (!existing) {
            core::Position position;
            position.symbol = order.symbol;
            position.side = entrySide(order.side);
            position.quantity = order.quantity;
            position.average_entry_price = fill_price;
            position.current_price = fill_price;
            position.entry_timestamp = *order.fill_timestamp;
            position.last_updated = *order.fill_timestamp;
            position.total_commission = order.commission;
            position.total_slippage = slippage_dollars;
            position.initial_stop = order.stop_price;
            position.peak_price = fill_price;
            if (order.stop_price) {
                position.risk_amount = (fill_price - *order.stop_price).abs() * quantity;
            }
            positions_[order.symbol] = position;
            result.action = FillAction::Opened;
            logger->info("Opened {} {} x{} @ {} (commission {}, risk {})", core::toString(position.side),
                         position.symbol, position.quantity, fill_price.toString(),
                         order.commission.toString(), position.risk_amount.toString());
        } else {
            core::Position& position = positions_[order.symbol];
            const long long new_quantity = position.quantity + order.quantity;
            position.average_entry_price =
                (position.average_entry_price * core::Decimal(position.quantity) + fill_price * quantity)
                / core::Decimal(new_quantity);
            position.quantity = new_quantity;
            position.total_commission += order.commission;
            position.total_slippage += slippage_dollars;
            position.last_updated = *order.fill_timestamp;
            const std::optional<core::Decimal>& stop = order.stop_price ? order.stop_price : position.initial_stop;
            if (stop) {
                position.risk_amount += (fill_price - *stop).abs() * quantity;
            }
            refreshUnrealized(position);
            result.action = FillAction::Increased;
            logger->info("Increased {} to x{} (avg entry {})", position.symbol, position.quantity,
                         position.average_entry_price.toString());
        }
        return result;
    }

    FillResult Portfolio::reduceOrClose(const core::Order& order, core::Position& position) {
        auto logger = core::logging::getLogger();
        long long close_quantity = order.quantity;
        if (close_quantity > position.quantity) {
            logger->warn("Order {} quantity {} exceeds open {} x{}; closing the open quantity only",
                         order.order_id, order.quantity, position.symbol, position.quantity);
            close_quantity = position.quantity;
        }

        const core::Decimal exit_price = *order.fill_price;
        const core::Decimal closed(close_quantity);
        const core::Decimal entry_commission = allocate(position.total_commission, close_quantity, position.quantity);
        const core::Decimal entry_slippage = allocate(position.total_slippage, close_quantity, position.quantity);
        const core::Decimal risk = allocate(position.risk_amount, close_quantity, position.quantity);
        const core::Decimal exit_commission = allocate(order.commission, close_quantity, order.quantity);
        const core::Decimal exit_slippage = order.slippage * closed;

        const core::Decimal price_pnl = (exit_price - position.average_entry_price) * closed * direction(position.side);
        const core::Decimal net_pnl = price_pnl - entry_commission - exit_commission;

        core::Trade trade;
        trade.trade_id = nextTradeId();
        trade.symbol = position.symbol;
        trade.side = position.side;
        trade.quantity = close_quantity;
        trade.entry_price = position.average_entry_price;
        trade.exit_price = exit_price;
        trade.entry_timestamp = position.entry_timestamp;
        trade.exit_timestamp = *order.fill_timestamp;
        trade.commission = entry_commission + exit_commission;
        trade.slippage = entry_slippage + exit_slippage;
        trade.net_pnl = net_pnl;
        // Fill prices already include slippage, so gross adds both cost kinds back
        trade.gross_pnl = net_pnl + trade.commission + trade.slippage;
        trade.initial_risk = risk;
        if (risk.isPositive()) {
            trade.r_multiple = trade.net_pnl / risk;
            trade.gross_r_multiple = trade.gross_pnl / risk;
        }
        trade.exit_reason = order.exit_reason.value_or("signal");

        // Release collateral plus realized price P&L, minus the exit commission
        cash_ += position.average_entry_price * closed + price_pnl - exit_commission;
        total_commission_ += exit_commission;
        total_slippage_ += exit_slippage;

        position.quantity -= close_quantity;
        position.total_commission -= entry_commission;
        position.total_slippage -= entry_slippage;
        position.risk_amount -= risk;
        position.last_updated = *order.fill_timestamp;

        FillResult result;
        if (position.quantity == 0) {
            logger->info("Closed {} {} x{} @ {} ({}): net P&L {}, R {}", core::toString(trade.side), trade.symbol,
                         trade.quantity, exit_price.toString(), trade.exit_reason,
                         trade.net_pnl.toString(), trade.r_multiple.toString());
            const std::string symbol = position.symbol;
            positions_.erase(symbol);
            result.action = FillAction::Closed;
        } else {
            refreshUnrealized(position);
            logger->info("Reduced {} by x{} @ {}: net P&L {}, x{} remaining", trade.symbol, close_quantity,
                         exit_price.toString(), trade.net_pnl.toString(), position.quantity);
            result.action = FillAction::Reduced;
        }

        closed_trades_.push_back(trade);
        result.trade = std::move(trade);
        return result;
    }

} // namespace backtester
