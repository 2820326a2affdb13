#include "order_simulator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <iomanip>
#include <sstream>

namespace backtester {

    OrderSimulator::OrderSimulator(CostModel cost_model, size_t max_pending_orders)
        : cost_model_(std::move(cost_model)), max_pending_orders_(max_pending_orders)
    {
        if (max_pending_orders_ == 0) {
            throw core::ConfigException("max_pending_orders must be > 0");
        }
    }

    std::string OrderSimulator::nextOrderId() {
        std::ostringstream oss;
        oss << "ORD-" << std::setw(6) << std::setfill('0') << ++order_sequence_;
        return oss.str();
    }

    core::Order OrderSimulator::submit(const std::string& symbol, core::OrderType type, core::OrderSide side,
                                       long long quantity, const core::Bar& current_bar,
                                       std::optional<core::Decimal> limit_price) {
        OrderRequest request;
        request.symbol = symbol;
        request.type = type;
        request.side = side;
        request.quantity = quantity;
        request.limit_price = limit_price;
        return submit(request, current_bar);
    }

    core::Order OrderSimulator::submit(const OrderRequest& request, const core::Bar& current_bar) {
        auto logger = core::logging::getLogger();

        if (request.quantity <= 0) {
            throw core::OrderException("Order quantity must be > 0, got " + std::to_string(request.quantity));
        }
        if (request.type == core::OrderType::Limit &&
            (!request.limit_price || !request.limit_price->isPositive())) {
            throw core::OrderException("LIMIT order for " + request.symbol + " requires a positive limit price");
        }

        core::Order order;
        order.order_id = nextOrderId();
        order.symbol = request.symbol;
        order.type = request.type;
        order.side = request.side;
        order.quantity = request.quantity;
        order.limit_price = request.type == core::OrderType::Limit ? request.limit_price : std::nullopt;
        order.created_timestamp = current_bar.timestamp;
        order.stop_price = request.stop_price;
        order.exit_reason = request.exit_reason;

        if (pending_.size() >= max_pending_orders_) {
            order.status = core::OrderStatus::Rejected;
            logger->warn("Order {} rejected: pending queue full ({} orders)", order.order_id, pending_.size());
            return order;
        }

        order.status = core::OrderStatus::Pending;
        pending_.push_back(order);
        logger->debug("Order {} submitted: {} {} {} x{} at {}", order.order_id, core::toString(order.type),
                      core::toString(order.side), order.symbol, order.quantity,
                      core::utils::timestampToString(order.created_timestamp));
        return order;
    }

    std::optional<core::Order> OrderSimulator::tryFill(const core::Order& order, const core::Bar& bar,
                                                       const core::Decimal& avg_volume) const {
        core::Order filled = order;

        if (order.type == core::OrderType::Market) {
            core::Decimal slippage = cost_model_.slippage(bar, order.side, order.quantity, avg_volume);
            filled.fill_price = CostModel::applySlippage(bar.open, slippage, order.side);
            filled.slippage = slippage;
        } else {
            const core::Decimal& limit = *order.limit_price;
            bool touched = order.side == core::OrderSide::Buy ? bar.low <= limit : bar.high >= limit;
            if (!touched) {
                return std::nullopt;
            }
            filled.fill_price = limit;
            filled.slippage = core::Decimal();
        }

        filled.commission = cost_model_.commission(order.quantity);
        filled.fill_timestamp = bar.timestamp;
        filled.status = core::OrderStatus::Filled;
        return filled;
    }

    std::vector<core::Order> OrderSimulator::fillPending(const core::Bar& next_bar, const core::Decimal& avg_volume) {
        auto logger = core::logging::getLogger();
        std::vector<core::Order> filled_orders;
        std::vector<core::Order> still_pending;
        still_pending.reserve(pending_.size());

        for (const auto& order : pending_) {
            // Orders only see bars strictly after the one they were created on
            if (order.symbol != next_bar.symbol || next_bar.timestamp <= order.created_timestamp) {
                still_pending.push_back(order);
                continue;
            }

            auto filled = tryFill(order, next_bar, avg_volume);
            if (!filled) {
                still_pending.push_back(order);
                continue;
            }

            logger->debug("Order {} filled: {} {} x{} @ {} (slippage {}, commission {})",
                          filled->order_id, core::toString(filled->side), filled->symbol, filled->quantity,
                          filled->fill_price->toString(), filled->slippage.toString(),
                          filled->commission.toString());
            filled_orders.push_back(std::move(*filled));
        }

        pending_ = std::move(still_pending);
        return filled_orders;
    }

    std::vector<core::Order> OrderSimulator::cancelAll() {
        std::vector<core::Order> cancelled;
        cancelled.reserve(pending_.size());
        for (auto& order : pending_) {
            order.status = core::OrderStatus::Rejected;
            cancelled.push_back(order);
        }
        if (!cancelled.empty()) {
            core::logging::getLogger()->info("Cancelled {} pending orders", cancelled.size());
        }
        pending_.clear();
        return cancelled;
    }

    bool OrderSimulator::hasPendingOrder(const std::string& symbol) const {
        for (const auto& order : pending_) {
            if (order.symbol == symbol) {
                return true;
            }
        }
        return false;
    }

    bool OrderSimulator::hasPendingExit(const std::string& symbol) const {
        for (const auto& order : pending_) {
            if (order.symbol == symbol && order.exit_reason) {
                return true;
            }
        }
        return false;
    }

} // namespace backtester
