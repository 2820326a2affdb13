#include "backtester.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "serialization.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>

namespace backtester {

    namespace {

        // Headroom for gaps between the signal bar's close and the next open
        const core::Decimal kGapBuffer = core::Decimal::fromString("0.005");

        core::OrderSide entryOrderSide(core::PositionSide side) {
            return side == core::PositionSide::Long ? core::OrderSide::Buy : core::OrderSide::Sell;
        }

        core::OrderSide exitOrderSide(core::PositionSide side) {
            return side == core::PositionSide::Long ? core::OrderSide::Sell : core::OrderSide::Buy;
        }

        // A fill the portfolio could not take never happened
        void rejectUnappliedFill(core::Order& order) {
            order.status = core::OrderStatus::Rejected;
            order.fill_price.reset();
            order.fill_timestamp.reset();
            order.slippage = core::Decimal();
            order.commission = core::Decimal();
        }

    } // end anonymous namespace

    Backtester::Backtester(BacktestConfig config, ISignalSource& signal_source,
                           const IPositionSizer& position_sizer, IProgressNotifier* progress_notifier)
        : config_(std::move(config)),
          signal_source_(signal_source),
          position_sizer_(position_sizer),
          progress_notifier_(progress_notifier ? progress_notifier : &null_notifier_),
          bar_processor_(config_.exit_rules)
    {
        config_.validate();
        core::logging::getLogger()->debug("Backtester initialized with capital {} and signal source '{}'",
                                          config_.initial_capital.toString(), signal_source_.getName());
    }

    void Backtester::cancel() {
        cancelled_.store(true);
    }

    bool Backtester::isCancelled() const {
        return cancelled_.load();
    }

    void Backtester::resetState() {
        portfolio_ = std::make_unique<Portfolio>(config_.initial_capital);
        order_simulator_ = std::make_unique<OrderSimulator>(CostModel(config_.effectiveCostModel()),
                                                            config_.max_pending_orders);
        history_.clear();
        equity_curve_.clear();
        orders_.clear();
        volume_window_.clear();
        entry_reservations_.clear();
        last_timestamp_.clear();
        last_progress_bar_ = 0;
        last_progress_time_ = std::chrono::steady_clock::now();
    }

    BacktestResult Backtester::run(const std::vector<core::Bar>& bars) {
        auto logger = core::logging::getLogger();
        logger->info("========================================================");
        logger->info("Starting Backtest Run: {} bars, signal source '{}'", bars.size(), signal_source_.getName());
        logger->info("========================================================");

        resetState();
        history_.reserve(bars.size());
        equity_curve_.reserve(bars.size());
        progress_every_bars_ = config_.progress_every_bars > 0
            ? config_.progress_every_bars
            : std::max<size_t>(1, bars.size() / 20);

        BacktestResult result;
        result.run_id = core::utils::generateRunId();
        result.config = config_;

        size_t processed = 0;
        for (const core::Bar& bar : bars) {
            if (cancelled_.load()) {
                logger->warn("Backtest cancelled after {} of {} bars", processed, bars.size());
                result.cancelled = true;
                break;
            }
            ++processed;

            if (auto reason = rejectReason(bar)) {
                logger->warn("Skipping bar {} {}: {}", bar.symbol, core::utils::timestampToString(bar.timestamp), *reason);
                ++result.skipped_bars;
                notifyProgress(processed, bars.size(), false);
                continue;
            }

            history_.push_back(bar);
            last_timestamp_[bar.symbol] = bar.timestamp;
            recordVolume(bar);
            const size_t bar_index = history_.size() - 1;

            // (a) signals
            std::vector<CandidateSignal> signals;
            try {
                signals = signal_source_.generate(bar_index, history_);
            } catch (const std::exception& e) {
                throw core::BacktestException("Signal source '" + signal_source_.getName() + "' failed at " +
                                              core::utils::timestampToString(bar.timestamp) + ": " + e.what());
            }

            // (b) entries
            if (!signals.empty()) {
                submitEntries(signals, bar);
            }

            // (c) mark to market and exits
            std::optional<core::Decimal> previous_value;
            if (!equity_curve_.empty()) {
                previous_value = equity_curve_.back().portfolio_value;
            }
            BarProcessingResult processed_bar = bar_processor_.process(bar, bar_index, *portfolio_, previous_value);
            submitExits(processed_bar.exit_signals, bar);

            // (d) fills for orders created on earlier bars
            applyFills(bar);

            // (e) equity after fills, positions opened at this open marked to this close
            portfolio_->markToMarket(bar);
            equity_curve_.push_back(BarProcessor::makeEquityPoint(bar.timestamp, *portfolio_, previous_value));

            // (f) progress
            notifyProgress(processed, bars.size(), false);
        }

        notifyProgress(processed, bars.size(), true);

        for (auto& order : order_simulator_->cancelAll()) {
            orders_.push_back(std::move(order));
        }
        entry_reservations_.clear();

        result.bars_processed = history_.size();
        result.trades = portfolio_->getClosedTrades();
        result.equity_curve = equity_curve_;
        result.orders = orders_;
        for (const auto& pair : portfolio_->getPositions()) {
            result.open_positions.push_back(pair.second);
        }
        result.metrics = MetricsCalculator::calculate(equity_curve_, result.trades, config_.initial_capital,
                                                      config_.metricsOptions());
        if (config_.apply_costs) {
            result.cost_summary = MetricsCalculator::calculateCostSummary(result.trades);
        }

        logger->info("Backtest {} finished: {} bars processed, {} skipped, {} trades, {} open positions{}",
                     result.run_id, result.bars_processed, result.skipped_bars, result.trades.size(),
                     result.open_positions.size(), result.cancelled ? " (cancelled)" : "");
        if (result.trades.empty()) {
            logger->info("Backtest produced zero trades");
        }
        return result;
    }

    std::optional<std::string> Backtester::rejectReason(const core::Bar& bar) const {
        if (auto reason = core::validateBar(bar)) {
            return reason;
        }
        auto it = last_timestamp_.find(bar.symbol);
        if (it != last_timestamp_.end() && bar.timestamp <= it->second) {
            return std::string("timestamp not after previous bar for symbol");
        }
        return std::nullopt;
    }

    void Backtester::recordVolume(const core::Bar& bar) {
        auto& window = volume_window_[bar.symbol];
        window.push_back(VolumeSample{bar.volume, bar.close});
        while (window.size() > config_.avg_volume_lookback) {
            window.pop_front();
        }
    }

    core::Decimal Backtester::averageVolume(const std::string& symbol) const {
        auto it = volume_window_.find(symbol);
        if (it == volume_window_.end() || it->second.empty()) {
            return core::Decimal();
        }
        // Summed in raw 1e-8 units at 128 bits: twenty bars of large-cap
        // dollar volume do not fit in a Decimal, their mean does.
        __int128 total = 0;
        for (const auto& sample : it->second) {
            total += static_cast<__int128>(sample.volume) * sample.close.raw();
        }
        const __int128 count = static_cast<__int128>(it->second.size());
        const __int128 average = (total + count / 2) / count;
        if (average > std::numeric_limits<std::int64_t>::max()) {
            return core::Decimal::fromRaw(std::numeric_limits<std::int64_t>::max());
        }
        return core::Decimal::fromRaw(static_cast<std::int64_t>(average));
    }

    size_t Backtester::pendingEntryCount() const {
        size_t count = 0;
        for (const auto& order : order_simulator_->getPendingOrders()) {
            if (!order.exit_reason) {
                ++count;
            }
        }
        return count;
    }

    EntryReservation Backtester::pendingEntryReservation() const {
        EntryReservation total;
        for (const auto& order : order_simulator_->getPendingOrders()) {
            auto it = entry_reservations_.find(order.order_id);
            if (it != entry_reservations_.end()) {
                total.cash += it->second.cash;
                total.risk += it->second.risk;
            }
        }
        return total;
    }

    void Backtester::submitEntries(const std::vector<CandidateSignal>& signals, const core::Bar& bar) {
        auto logger = core::logging::getLogger();

        for (const auto& signal : signals) {
            if (signal.symbol != bar.symbol) {
                logger->warn("Ignoring {} signal for {} delivered on a {} bar", signal.pattern, signal.symbol, bar.symbol);
                continue;
            }
            if (portfolio_->hasPosition(signal.symbol) || order_simulator_->hasPendingOrder(signal.symbol)) {
                logger->debug("Ignoring {} signal for {}: position or order already open", signal.pattern, signal.symbol);
                continue;
            }
            if (portfolio_->getOpenPositionCount() + pendingEntryCount() >= static_cast<size_t>(config_.max_open_positions)) {
                logger->info("Ignoring {} signal for {}: max open positions ({}) reached",
                             signal.pattern, signal.symbol, config_.max_open_positions);
                continue;
            }

            const core::Decimal reference = signal.limit_price ? *signal.limit_price : bar.close;
            const bool is_long = signal.side == core::PositionSide::Long;
            if (is_long ? signal.initial_stop >= reference : signal.initial_stop <= reference) {
                logger->warn("Ignoring {} signal for {}: stop {} on the wrong side of {}", signal.pattern,
                             signal.symbol, signal.initial_stop.toString(), reference.toString());
                continue;
            }
            const core::Decimal stop_distance = (reference - signal.initial_stop).abs();
            const core::Decimal equity = portfolio_->getPortfolioValue();

            long long quantity = position_sizer_.calculateQuantity(equity, config_.risk_per_trade_pct, stop_distance);
            if (signal.size_hint && *signal.size_hint > 0) {
                quantity = std::min(quantity, *signal.size_hint);
            }

            // Cash, less what pending entries already set aside
            const EntryReservation reserved = pendingEntryReservation();
            const core::Decimal per_share_cost = reference * (core::Decimal(1) + kGapBuffer)
                + order_simulator_->getCostModel().getConfig().commission_per_share;
            const core::Decimal available_cash = portfolio_->getCash() - reserved.cash;
            if (!available_cash.isPositive()) {
                logger->info("Ignoring {} signal for {}: no cash left after pending entries", signal.pattern, signal.symbol);
                continue;
            }
            quantity = std::min(quantity, (available_cash / per_share_cost).floor());

            // Portfolio heat, pending entries included
            const core::Decimal heat_budget = equity * config_.max_portfolio_heat_pct / core::Decimal(100)
                - portfolio_->getTotalRiskAmount() - reserved.risk;
            if (!heat_budget.isPositive()) {
                logger->info("Ignoring {} signal for {}: portfolio heat {}% at limit", signal.pattern, signal.symbol,
                             portfolio_->getPortfolioHeat(equity).toString(2));
                continue;
            }
            quantity = std::min(quantity, (heat_budget / stop_distance).floor());

            if (quantity <= 0) {
                logger->info("Ignoring {} signal for {}: sized quantity is zero", signal.pattern, signal.symbol);
                continue;
            }

            OrderRequest request;
            request.symbol = signal.symbol;
            request.type = signal.limit_price ? core::OrderType::Limit : core::OrderType::Market;
            request.side = entryOrderSide(signal.side);
            request.quantity = quantity;
            request.limit_price = signal.limit_price;
            request.stop_price = signal.initial_stop;

            core::Order order = order_simulator_->submit(request, bar);
            if (order.status == core::OrderStatus::Rejected) {
                orders_.push_back(order);
                continue;
            }
            const core::Decimal shares(quantity);
            entry_reservations_[order.order_id] = EntryReservation{per_share_cost * shares, stop_distance * shares};
            logger->info("{} entry for {} ({}): {} x{} stop {}", core::toString(signal.side), signal.symbol,
                         signal.pattern, core::toString(order.type), quantity, signal.initial_stop.toString());
        }
    }

    void Backtester::submitExits(const std::vector<ExitSignal>& exits, const core::Bar& bar) {
        for (const auto& exit : exits) {
            const core::Position* position = portfolio_->getPosition(exit.symbol);
            if (!position || order_simulator_->hasPendingExit(exit.symbol)) {
                continue;
            }
            OrderRequest request;
            request.symbol = exit.symbol;
            request.type = core::OrderType::Market;
            request.side = exitOrderSide(position->side);
            request.quantity = position->quantity;
            request.exit_reason = toString(exit.reason);

            core::Order order = order_simulator_->submit(request, bar);
            if (order.status == core::OrderStatus::Rejected) {
                orders_.push_back(order);
            }
        }
    }

    void Backtester::applyFills(const core::Bar& bar) {
        auto logger = core::logging::getLogger();
        std::vector<core::Order> filled = order_simulator_->fillPending(bar, averageVolume(bar.symbol));
        for (auto& order : filled) {
            entry_reservations_.erase(order.order_id);
            FillResult fill = portfolio_->applyFill(order);
            if (fill.action == FillAction::Ignored) {
                logger->warn("Order {} ({}) rejected: fill at {} could not be applied to the portfolio",
                             order.order_id, order.symbol, order.fill_price ? order.fill_price->toString() : "n/a");
                rejectUnappliedFill(order);
            }
            orders_.push_back(std::move(order));
        }
    }

    void Backtester::notifyProgress(size_t processed, size_t total, bool force) {
        auto now = std::chrono::steady_clock::now();
        double elapsed = std::chrono::duration<double>(now - last_progress_time_).count();
        bool due = processed - last_progress_bar_ >= progress_every_bars_ || elapsed >= config_.progress_interval_seconds;
        if (!force && !due) {
            return;
        }
        if (force && processed == last_progress_bar_ && processed != 0) {
            return;
        }

        ProgressUpdate update;
        update.bars_processed = processed;
        update.total_bars = total;
        update.percent_complete = total > 0 ? 100.0 * static_cast<double>(processed) / static_cast<double>(total) : 100.0;
        last_progress_bar_ = processed;
        last_progress_time_ = now;

        try {
            progress_notifier_->onProgress(update);
        } catch (const std::exception& e) {
            core::logging::getLogger()->warn("Progress notifier failed at {}/{} bars: {}", processed, total, e.what());
        } catch (...) {
            core::logging::getLogger()->warn("Progress notifier failed at {}/{} bars: unknown exception", processed, total);
        }
    }

    json BacktestResult::toJson() const {
        json j;
        j["run_id"] = run_id;
        j["config"] = config.toJson();
        j["bars_processed"] = bars_processed;
        j["skipped_bars"] = skipped_bars;
        j["cancelled"] = cancelled;
        j["metrics"] = metrics.toJson();
        j["cost_summary"] = cost_summary ? cost_summary->toJson() : json(nullptr);

        j["trades"] = json::array();
        for (const auto& trade : trades) j["trades"].push_back(backtester::toJson(trade));
        j["equity_curve"] = json::array();
        for (const auto& point : equity_curve) j["equity_curve"].push_back(backtester::toJson(point));
        j["orders"] = json::array();
        for (const auto& order : orders) j["orders"].push_back(backtester::toJson(order));
        j["open_positions"] = json::array();
        for (const auto& position : open_positions) j["open_positions"].push_back(backtester::toJson(position));
        return j;
    }

} // namespace backtester
