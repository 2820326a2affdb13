// backtester/include/portfolio.hpp
#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>

#include "datatypes.hpp"

namespace backtester {

    enum class FillAction {
        Opened,    // New position
        Increased, // Added to an existing position on the same side
        Reduced,   // Partial exit, position still open
        Closed,    // Position reached zero quantity
        Ignored    // Not applied (not filled, insufficient cash)
    };

    struct FillResult {
        FillAction action = FillAction::Ignored;
        std::optional<core::Trade> trade; // Set on Reduced and Closed
    };

    // Exclusive owner of cash and open positions (keyed by symbol).
    //
    // Short positions are collateralised: opening one debits fill x qty + commission
    // like a long, and the position is valued at cost basis + unrealized P&L, so
    // cash + positions value is the account equity for either side.
    class Portfolio {
    public:
        // Throws core::ConfigException when initial_capital <= 0
        explicit Portfolio(const core::Decimal& initial_capital);

        // --- Getters ---
        const core::Decimal& getInitialCapital() const { return initial_capital_; }
        const core::Decimal& getCash() const { return cash_; }
        bool hasPosition(const std::string& symbol) const;
        const core::Position* getPosition(const std::string& symbol) const;
        const std::map<std::string, core::Position>& getPositions() const { return positions_; }
        size_t getOpenPositionCount() const { return positions_.size(); }
        const std::vector<core::Trade>& getClosedTrades() const { return closed_trades_; }

        core::Decimal getPositionsValue() const;
        core::Decimal getPortfolioValue() const;

        // Sum of committed risk across open positions
        core::Decimal getTotalRiskAmount() const;
        // Total committed risk as a percentage of equity, 0 when equity <= 0
        core::Decimal getPortfolioHeat(const core::Decimal& equity) const;

        core::Decimal getTotalCommission() const { return total_commission_; }
        core::Decimal getTotalSlippage() const { return total_slippage_; }

        // --- Modifiers ---
        // Applies a FILLED order: entries open or extend a position, orders on the
        // opposite side reduce or close it and produce a Trade.
        FillResult applyFill(const core::Order& order);

        // Updates mark price, unrealized P&L and the favourable extreme for bar.symbol only
        void markToMarket(const core::Bar& bar);

    private:
        FillResult openOrIncrease(const core::Order& order, const core::Position* existing);
        FillResult reduceOrClose(const core::Order& order, core::Position& position);
        std::string nextTradeId();

        core::Decimal initial_capital_;
        core::Decimal cash_;
        std::map<std::string, core::Position> positions_;
        std::vector<core::Trade> closed_trades_;
        core::Decimal total_commission_;
        core::Decimal total_slippage_;
        long long trade_sequence_ = 0;
    };

} // namespace backtester
