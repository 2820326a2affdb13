#pragma once

#include <optional>
#include <string>
#include <vector>

#include "cost_model.hpp"
#include "datatypes.hpp"

namespace backtester {

    // Everything the orchestrator knows when it asks for an order
    struct OrderRequest {
        std::string symbol;
        core::OrderType type = core::OrderType::Market;
        core::OrderSide side = core::OrderSide::Buy;
        long long quantity = 0;
        std::optional<core::Decimal> limit_price;
        std::optional<core::Decimal> stop_price;
        std::optional<std::string> exit_reason;
    };

    // Queues orders and fills them against strictly later bars.
    // The only component that changes an Order after creation.
    class OrderSimulator {
    public:
        explicit OrderSimulator(CostModel cost_model, size_t max_pending_orders = 1000);

        // New PENDING order stamped with current_bar's timestamp. Returns a REJECTED
        // order when the queue is full. Throws core::OrderException on quantity <= 0
        // or a LIMIT order without a positive limit price.
        core::Order submit(const OrderRequest& request, const core::Bar& current_bar);

        core::Order submit(const std::string& symbol, core::OrderType type, core::OrderSide side,
                           long long quantity, const core::Bar& current_bar,
                           std::optional<core::Decimal> limit_price = std::nullopt);

        // Fills pending orders for next_bar.symbol created strictly before next_bar.
        // Filled orders leave the queue and are returned in submission order.
        std::vector<core::Order> fillPending(const core::Bar& next_bar, const core::Decimal& avg_volume);

        // Marks every pending order REJECTED and empties the queue
        std::vector<core::Order> cancelAll();

        size_t getPendingCount() const { return pending_.size(); }
        const std::vector<core::Order>& getPendingOrders() const { return pending_; }
        bool hasPendingOrder(const std::string& symbol) const;
        // Pending order carrying an exit reason, i.e. a closing order
        bool hasPendingExit(const std::string& symbol) const;

        const CostModel& getCostModel() const { return cost_model_; }

    private:
        std::optional<core::Order> tryFill(const core::Order& order, const core::Bar& bar,
                                           const core::Decimal& avg_volume) const;
        std::string nextOrderId();

        CostModel cost_model_;
        size_t max_pending_orders_;
        std::vector<core::Order> pending_;
        long long order_sequence_ = 0;
    };

} // namespace backtester
